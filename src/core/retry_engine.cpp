#include "retryable/retry_engine.h"

#include <stdexcept>
#include <typeinfo>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/retry/retry_counter.h"

namespace retryable {

RetryEngine::RetryEngine(std::shared_ptr<ConfigProvider> provider, std::shared_ptr<Sleeper> sleeper)
    : provider_(std::move(provider)),
      sleeper_(std::move(sleeper)) {
    if (provider_ == nullptr) {
        throw std::invalid_argument("RetryEngine requires a config provider");
    }
    if (sleeper_ == nullptr) {
        throw std::invalid_argument("RetryEngine requires a sleeper");
    }
}

void RetryEngine::Drive(const Policy& policy, const Attempt& attempt, const std::string& action) const {
    try {
        RunAttempts(policy, attempt, action);
    } catch (...) {
        // The hook runs once for the whole sequence; the failure keeps propagating.
        policy.RunAfterHook();
        throw;
    }
    policy.RunAfterHook();
}

void RetryEngine::RunAttempts(const Policy& policy, const Attempt& attempt, const std::string& action) const {
    RetryCounter counter(policy.GetMaxTries());
    while (true) {
        bool error_value = false;
        try {
            error_value = attempt();
        } catch (const std::exception& e) {
            if (!ShouldRetry(policy, counter, e, action)) {
                throw;
            }
            Backoff(policy, counter.GetRetryCount(), e.what(), action);
            counter.Advance();
            continue;
        }

        if (!error_value) {
            return;
        }
        if (counter.IsExhausted()) {
            SPDLOG_DEBUG(
                "Failed to {}: error value after {} attempt(s), returning it", action, counter.GetAttemptCount());
            return;
        }
        Backoff(policy, counter.GetRetryCount(), "returned an error value", action);
        counter.Advance();
    }
}

bool RetryEngine::ShouldRetry(
    const Policy& policy, const RetryCounter& counter, const std::exception& failure, const std::string& action) const {
    if (counter.IsExhausted()) {
        SPDLOG_DEBUG(
            "Failed to {}: giving up after {} attempt(s): {}", action, counter.GetAttemptCount(), failure.what());
        return false;
    }
    if (!policy.MatchesFailureKind(failure)) {
        SPDLOG_DEBUG("Failed to {}: {} is not a retryable failure kind", action, typeid(failure).name());
        return false;
    }
    if (!policy.MatchesMessage(failure.what())) {
        SPDLOG_DEBUG("Failed to {}: message '{}' matches no retryable message", action, failure.what());
        return false;
    }
    return true;
}

void RetryEngine::Backoff(const Policy& policy, int retry, const std::string& reason, const std::string& action)
    const {
    auto sleep_time = policy.GetSleepTime(retry);
    SPDLOG_WARN(
        "Failed to {} (attempt {}/{}): {}. Retrying in {}ms",
        action,
        retry + 1,
        policy.GetMaxTries() + 1,
        reason,
        sleep_time.count());
    sleeper_->Sleep(sleep_time);
}

} // namespace retryable
