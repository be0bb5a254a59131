#pragma once

#include <string>

#include <spdlog/spdlog.h>

#include "common/glog_utils.h"
#include "common/option.h"
#include "common/spdlog_utils.h"

namespace retryable {

inline bool InitRetryableLog(const std::string& app_name, const Options& options) {
    auto log_backend = GetOptionValue<std::string>(options, RETRYABLE_LOG_BACKEND);
    if (log_backend == "SPDLOG") {
        InitSpdlog(app_name, options);
    } else if (log_backend == "GLOG") {
        InitGlog(app_name, options);
    } else {
        SPDLOG_ERROR("Invalid log backend: {}", log_backend);
        return false;
    }
    return true;
}

} // namespace retryable
