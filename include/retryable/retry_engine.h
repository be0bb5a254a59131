#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "retryable/config.h"
#include "retryable/options.h"
#include "retryable/policy.h"
#include "retryable/sleeper.h"

namespace retryable {

class RetryCounter;

// Fits the phrase "Failed to ${action}" in retry logs.
inline const std::string kDefaultAction = "run retryable work";

template <typename F>
using WorkResult = std::decay_t<std::invoke_result_t<F&>>;

/**
 * Runs work under a retry policy.
 *
 * The engine keeps no per-call state, so one engine may serve concurrent callers as
 * long as its provider and sleeper are thread-safe.
 */
class RetryEngine {
 public:
    /**
     * Invokes one attempt. Returns true if the attempt returned an error value;
     * thrown failures propagate out of it.
     */
    using Attempt = std::function<bool()>;

    RetryEngine(std::shared_ptr<ConfigProvider> provider, std::shared_ptr<Sleeper> sleeper);

    /**
     * Retries `work` with `options` merged over the provider's defaults.
     *
     * @return the value of the last attempt
     * @throws the last failure thrown by `work` when it is not retried
     */
    template <typename F>
    WorkResult<F> Run(const RetryOptions& options, F&& work, const std::string& action = kDefaultAction) const {
        return Execute(ResolvePolicy(options, *provider_), std::forward<F>(work), action);
    }

    /**
     * Retries `work` with the option set stored under `name`.
     */
    template <typename F>
    WorkResult<F> Run(const std::string& name, F&& work, const std::string& action = kDefaultAction) const {
        return Execute(ResolvePolicy(name, *provider_), std::forward<F>(work), action);
    }

    template <typename F>
    WorkResult<F> Run(F&& work) const {
        return Run(RetryOptions(), std::forward<F>(work));
    }

    template <typename F>
    WorkResult<F> Execute(const Policy& policy, F&& work, const std::string& action = kDefaultAction) const {
        using T = WorkResult<F>;
        if constexpr (std::is_void_v<T>) {
            Drive(
                policy,
                [&work]() {
                    work();
                    return false;
                },
                action);
        } else {
            std::function<bool(const T&)> is_error;
            if (policy.GetErrorPredicate().has_value()) {
                is_error = policy.GetErrorPredicate()->For<T>();
            }
            std::optional<T> result;
            Drive(
                policy,
                [&work, &result, &is_error]() {
                    result.emplace(work());
                    return is_error && is_error(*result);
                },
                action);
            return std::move(*result);
        }
    }

    /**
     * The attempt loop. Runs the policy's after hook exactly once when the loop ends,
     * whichever way it ends.
     */
    void Drive(const Policy& policy, const Attempt& attempt, const std::string& action) const;

    [[nodiscard]] const std::shared_ptr<ConfigProvider>& GetConfigProvider() const { return provider_; }

    [[nodiscard]] const std::shared_ptr<Sleeper>& GetSleeper() const { return sleeper_; }

 private:
    void RunAttempts(const Policy& policy, const Attempt& attempt, const std::string& action) const;

    bool ShouldRetry(
        const Policy& policy, const RetryCounter& counter, const std::exception& failure, const std::string& action) const;

    void Backoff(const Policy& policy, int retry, const std::string& reason, const std::string& action) const;

    std::shared_ptr<ConfigProvider> provider_;
    std::shared_ptr<Sleeper> sleeper_;
};

} // namespace retryable
