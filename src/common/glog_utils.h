#pragma once

#include <atomic>
#include <filesystem>
#include <string>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "common/option.h"

namespace retryable {

constexpr unsigned int DEFAULT_LOG_CLEANER_DAYS = 3;

inline google::LogSeverity GetGlogSeverity(const Options& options) {
    auto log_level = GetOptionValue<std::string>(options, RETRYABLE_LOG_LEVEL);
    if (log_level == "WARNING") {
        return google::GLOG_WARNING;
    }
    if (log_level == "ERROR") {
        return google::GLOG_ERROR;
    }
    // glog has no debug severity, DEBUG logs at INFO
    return google::GLOG_INFO;
}

/*
 * Initialize google logging once per process. Command-line flags (--log_dir,
 * --minloglevel, --logtostderr) win over options.
 */
inline void InitGlog(const std::string& app_name, const Options& options) {
    static std::atomic<bool> log_initialized = false;
    if (log_initialized.exchange(true)) {
        return;
    }

    std::string log_level;
    if (!google::GetCommandLineOption("minloglevel", &log_level) || log_level == "0") {
        FLAGS_minloglevel = GetGlogSeverity(options);
    }

    std::string log_dir;
    if (!google::GetCommandLineOption("log_dir", &log_dir) || log_dir.empty()) {
        log_dir = GetOptionValue<std::string>(options, RETRYABLE_LOG_DIR);
    }
    std::filesystem::create_directories(log_dir);
    FLAGS_log_dir = log_dir;

    if (GetOptionValue<bool>(options, RETRYABLE_LOG_TO_CONSOLE)) {
        FLAGS_alsologtostderr = true;
    }

    std::string log_flush_interval;
    if (!google::GetCommandLineOption("logbufsecs", &log_flush_interval)) {
        FLAGS_logbufsecs = 1;
    }

    google::EnableLogCleaner(DEFAULT_LOG_CLEANER_DAYS);
    // glog keeps the pointer it is given
    static std::string program_name;
    program_name = app_name;
    google::InitGoogleLogging(program_name.c_str());

    LOG(INFO) << "Initialized glog for " << app_name << ", log_dir: " << log_dir;
}

} // namespace retryable
