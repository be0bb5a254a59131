#include <utility>

#include "retryable/options.h"

namespace retryable {

RetryOptions& RetryOptions::WithOn(OnSelector selector) {
    if (!on.has_value()) {
        on.emplace();
    }
    on->push_back(std::move(selector));
    return *this;
}

RetryOptions& RetryOptions::WithMessage(MessageMatcher matcher) {
    if (!message.has_value()) {
        message.emplace();
    }
    message->push_back(std::move(matcher));
    return *this;
}

RetryOptions& RetryOptions::WithTries(int value) {
    tries = value;
    return *this;
}

RetryOptions& RetryOptions::WithSleep(double seconds) {
    sleep = SleepSpec(seconds);
    return *this;
}

RetryOptions& RetryOptions::WithSleep(SleepFunction function) {
    sleep = SleepSpec(std::move(function));
    return *this;
}

RetryOptions& RetryOptions::WithAfter(AfterHook hook) {
    after = std::move(hook);
    return *this;
}

RetryOptions& RetryOptions::Merge(const RetryOptions& overrides) {
    if (overrides.on.has_value()) {
        on = overrides.on;
    }
    if (overrides.message.has_value()) {
        message = overrides.message;
    }
    if (overrides.tries.has_value()) {
        tries = overrides.tries;
    }
    if (overrides.sleep.has_value()) {
        sleep = overrides.sleep;
    }
    if (overrides.after.has_value()) {
        after = overrides.after;
    }
    return *this;
}

bool RetryOptions::Empty() const {
    return !on.has_value() && !message.has_value() && !tries.has_value() && !sleep.has_value() && !after.has_value();
}

} // namespace retryable
