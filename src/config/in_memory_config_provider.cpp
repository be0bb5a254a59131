#include <spdlog/spdlog.h>

#include "retryable/config.h"

namespace retryable {

bool InMemoryConfigProvider::GetConfig(const std::string& name, RetryOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = configs_.find(name);
    if (it == configs_.end()) {
        return false;
    }
    options = it->second;
    return true;
}

bool InMemoryConfigProvider::SetConfig(const std::string& name, const RetryOptions& options) {
    if (name.empty()) {
        SPDLOG_ERROR("Retry config name is empty");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    configs_[name] = options;
    return true;
}

bool InMemoryConfigProvider::RemoveConfig(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (configs_.erase(name) == 0) {
        SPDLOG_WARN("Retry config {} to be removed not found", name);
    }
    return true;
}

} // namespace retryable
