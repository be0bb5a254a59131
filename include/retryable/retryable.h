#pragma once

#include <memory>
#include <string>
#include <utility>

#include "retryable/config.h"
#include "retryable/error.h"
#include "retryable/options.h"
#include "retryable/policy.h"
#include "retryable/retry_engine.h"
#include "retryable/sleeper.h"

namespace retryable {

/**
 * The engine behind the Retryable() free functions. Its provider is loaded from the
 * RETRYABLE_* options (environment or options file, see RETRYABLE_OPTIONS_LOAD_MODE)
 * on first use; its sleeper sleeps on the calling thread.
 */
RetryEngine GetDefaultRetryEngine();

void SetDefaultConfigProvider(std::shared_ptr<ConfigProvider> provider);

void SetDefaultSleeper(std::shared_ptr<Sleeper> sleeper);

// Drops the replaced provider and sleeper; the next call reloads them from options.
void ResetDefaultRetryEngine();

/**
 * Sets up library logging from the RETRYABLE_LOG_* options.
 *
 * @return false if RETRYABLE_LOG_BACKEND names an unknown backend
 */
bool InitRetryableLog(const std::string& app_name);

/**
 * Maybe retry some code.
 *
 *   Retryable(RetryOptions().WithOn(On<TimeoutError>()).WithTries(5).WithSleep(2), [] {
 *       return api.Call();
 *   });
 *
 * Options:
 * - on: failure kinds to retry and/or OnSelector::Error() for error values. Default:
 *   any failure, never error values.
 * - message: only retry failures whose what() matches. Default: any message.
 * - tries: how many times to retry. Default 1.
 * - sleep: seconds to sleep between retries, or a function of the retry index.
 *   Default 1.
 * - after: runs exactly once no matter how many retries.
 *
 * Exhausted thrown failures propagate unchanged; exhausted error values are
 * returned.
 */
template <typename F>
WorkResult<F> Retryable(const RetryOptions& options, F&& work) {
    return GetDefaultRetryEngine().Run(options, std::forward<F>(work));
}

/**
 * Retries with the named option set. Unknown names fall back to the defaults.
 */
template <typename F>
WorkResult<F> Retryable(const std::string& name, F&& work) {
    return GetDefaultRetryEngine().Run(name, std::forward<F>(work));
}

template <typename F>
WorkResult<F> Retryable(F&& work) {
    return GetDefaultRetryEngine().Run(std::forward<F>(work));
}

} // namespace retryable
