#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <vector>

#include "retryable/config.h"
#include "retryable/options.h"

namespace retryable {

constexpr int kDefaultTries = 1;
constexpr double kDefaultSleepSeconds = 1.0;

/**
 * The canonical retry configuration of one invocation. Built once by
 * ResolvePolicy and never modified afterwards.
 */
class Policy {
 public:
    /**
     * @throws ConfigurationError if max_tries is negative or a constant sleep is
     * negative or not finite
     */
    Policy(
        int max_tries,
        std::vector<FailureKind> failure_kinds,
        std::vector<MessageMatcher> message_matchers,
        std::optional<ErrorPredicate> error_predicate,
        SleepSpec sleep,
        AfterHook after);

    // Number of retries allowed after the first attempt.
    [[nodiscard]] int GetMaxTries() const { return max_tries_; }

    [[nodiscard]] const std::vector<FailureKind>& GetFailureKinds() const { return failure_kinds_; }

    [[nodiscard]] const std::vector<MessageMatcher>& GetMessageMatchers() const { return message_matchers_; }

    [[nodiscard]] const std::optional<ErrorPredicate>& GetErrorPredicate() const { return error_predicate_; }

    // An empty kind list matches every failure.
    [[nodiscard]] bool MatchesFailureKind(const std::exception& failure) const;

    // An empty matcher list matches every message.
    [[nodiscard]] bool MatchesMessage(const std::string& message) const;

    /**
     * Computes the sleep before retry number `retry` (zero based), rounded to the
     * nearest millisecond.
     *
     * @throws ConfigurationError if a sleep function yields a negative or non-finite
     * duration
     */
    [[nodiscard]] std::chrono::milliseconds GetSleepTime(int retry) const;

    void RunAfterHook() const;

    [[nodiscard]] std::string ToString() const;

 private:
    int max_tries_;
    std::vector<FailureKind> failure_kinds_;
    std::vector<MessageMatcher> message_matchers_;
    std::optional<ErrorPredicate> error_predicate_;
    SleepSpec sleep_;
    AfterHook after_;
};

/**
 * Merges `options` over the provider's defaults (themselves merged over the
 * built-in defaults) and normalizes the result.
 *
 * @throws ConfigurationError if the merged options do not form a valid policy
 */
Policy ResolvePolicy(const RetryOptions& options, ConfigProvider& provider);

/**
 * Resolves the option set stored under `name`. An unknown name is not an error: it
 * resolves to the defaults.
 */
Policy ResolvePolicy(const std::string& name, ConfigProvider& provider);

} // namespace retryable
