#pragma once

#include <unistd.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/async.h>
#include <spdlog/common.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "common/option.h"

namespace retryable {

// Get log level from options
inline spdlog::level::level_enum GetLogLevel(const Options& options) {
    spdlog::level::level_enum ret = spdlog::level::info; // default log level

    auto log_level = GetOptionValue<std::string>(options, RETRYABLE_LOG_LEVEL);
    if (log_level == "DEBUG") {
        ret = spdlog::level::debug;
    } else if (log_level == "INFO") {
        ret = spdlog::level::info;
    } else if (log_level == "WARNING") {
        ret = spdlog::level::warn;
    } else if (log_level == "ERROR") {
        ret = spdlog::level::err;
    } else {
        SPDLOG_ERROR("Unknown log level: {}", log_level);
    }
    return ret;
}

/*
 * Initialize spdlog with an async logger whose sinks follow the options.
 * Calling it again installs a new default logger built from the current options.
 * @param app_name: the name of the application
 * @param options: the options of the application
 */
inline void InitSpdlog(const std::string& app_name, const Options& options) {
    static std::mutex logger_mutex;
    static bool thread_pool_initialized = false;

    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!thread_pool_initialized) {
        spdlog::init_thread_pool(8192, 1);
        thread_pool_initialized = true;
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (GetOptionValue<bool>(options, RETRYABLE_LOG_TO_CONSOLE)) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }

    if (GetOptionValue<bool>(options, RETRYABLE_LOG_TO_FILE)) {
        // Cut a new file at 00:00 every day, keep the last configured days
        auto log_dir = GetOptionValue<std::string>(options, RETRYABLE_LOG_DIR);
        std::string log_name = log_dir + "/" + app_name + "." + std::to_string(getpid()); // logdir/app_name.pid
        int max_file_days = GetOptionValue<int>(options, RETRYABLE_LOG_MAX_FILE_DAYS);
        sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(
            log_name, 0, 0, false, static_cast<uint16_t>(max_file_days)));
    }
    // Sinks of a live async logger are never touched, a reconfiguration swaps the logger
    auto logger = std::make_shared<spdlog::async_logger>(
        app_name,
        sinks.begin(),
        sinks.end(),
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::block // When the queue is full, block
    );

    spdlog::set_default_logger(logger);
    spdlog::set_level(GetLogLevel(options));
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [pid %P] [thread %t] [%l] [%s:%#] %v");

    SPDLOG_INFO("Initialized spdlog for {}", app_name);
}

} // namespace retryable
