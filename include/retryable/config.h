#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "retryable/options.h"

namespace retryable {

// Scope holding the option set every resolution is merged over.
inline const std::string kDefaultsScope = "defaults";

/**
 * Source of the defaults and of named option sets.
 */
class ConfigProvider {
 public:
    virtual ~ConfigProvider() = default;

    /**
     * Fills `options` with the option set stored under `name`.
     *
     * @return false if nothing is stored under `name`; `options` is left untouched
     */
    virtual bool GetConfig(const std::string& name, RetryOptions& options) = 0;
};

/**
 * Holds typed option sets in memory, including sleep functions and hooks that have
 * no textual form. Thread-safe.
 */
class InMemoryConfigProvider : public ConfigProvider {
 public:
    InMemoryConfigProvider() = default;

    bool GetConfig(const std::string& name, RetryOptions& options) override;

    bool SetConfig(const std::string& name, const RetryOptions& options);

    bool RemoveConfig(const std::string& name);

 private:
    std::mutex mutex_;
    std::unordered_map<std::string, RetryOptions> configs_;
};

} // namespace retryable
