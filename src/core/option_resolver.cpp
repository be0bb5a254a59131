#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "retryable/policy.h"

namespace retryable {

namespace {

RetryOptions BuiltinDefaults() {
    RetryOptions defaults;
    defaults.on.emplace();
    defaults.message.emplace();
    defaults.tries = kDefaultTries;
    defaults.sleep = SleepSpec(kDefaultSleepSeconds);
    defaults.after = AfterHook([] {});
    return defaults;
}

template <typename T>
void AppendUnique(std::vector<T>& items, const T& item) {
    if (std::find(items.begin(), items.end(), item) == items.end()) {
        items.push_back(item);
    }
}

// Splits `on` into thrown-failure kinds and at most one error predicate. An explicit
// predicate wins over the bare sentinel.
void NormalizeOn(
    const std::vector<OnSelector>& on,
    std::vector<FailureKind>& failure_kinds,
    std::optional<ErrorPredicate>& error_predicate) {
    bool bare_error = false;
    for (const auto& selector : on) {
        if (!selector.IsError()) {
            AppendUnique(failure_kinds, *selector.Kind());
            continue;
        }
        const auto& predicate = *selector.Predicate();
        if (predicate.IsDefault()) {
            bare_error = true;
            continue;
        }
        if (error_predicate.has_value()) {
            throw ConfigurationError("At most one explicit error predicate is allowed in `on`");
        }
        error_predicate = predicate;
    }
    if (!error_predicate.has_value() && bare_error) {
        error_predicate = ErrorPredicate::Default();
    }
}

Policy Normalize(const RetryOptions& options) {
    std::vector<FailureKind> failure_kinds;
    std::optional<ErrorPredicate> error_predicate;
    NormalizeOn(*options.on, failure_kinds, error_predicate);

    std::vector<MessageMatcher> message_matchers;
    for (const auto& matcher : *options.message) {
        AppendUnique(message_matchers, matcher);
    }

    return Policy(
        *options.tries,
        std::move(failure_kinds),
        std::move(message_matchers),
        std::move(error_predicate),
        *options.sleep,
        *options.after);
}

} // namespace

Policy ResolvePolicy(const RetryOptions& options, ConfigProvider& provider) {
    RetryOptions merged = BuiltinDefaults();

    RetryOptions defaults;
    if (provider.GetConfig(kDefaultsScope, defaults)) {
        merged.Merge(defaults);
    }
    merged.Merge(options);

    Policy policy = Normalize(merged);
    SPDLOG_DEBUG("Resolved retry policy {}", policy.ToString());
    return policy;
}

Policy ResolvePolicy(const std::string& name, ConfigProvider& provider) {
    RetryOptions named;
    if (!provider.GetConfig(name, named)) {
        // Unknown names are allowed and inherit the defaults only.
        SPDLOG_DEBUG("Retry config {} not found, using defaults", name);
    }
    return ResolvePolicy(named, provider);
}

} // namespace retryable
