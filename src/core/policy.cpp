#include "retryable/policy.h"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

#include "common/time_utils.h"

namespace retryable {

Policy::Policy(
    int max_tries,
    std::vector<FailureKind> failure_kinds,
    std::vector<MessageMatcher> message_matchers,
    std::optional<ErrorPredicate> error_predicate,
    SleepSpec sleep,
    AfterHook after)
    : max_tries_(max_tries),
      failure_kinds_(std::move(failure_kinds)),
      message_matchers_(std::move(message_matchers)),
      error_predicate_(std::move(error_predicate)),
      sleep_(std::move(sleep)),
      after_(std::move(after)) {
    if (max_tries_ < 0) {
        throw ConfigurationError("Tries must be a non-negative number, got " + std::to_string(max_tries_));
    }
    if (const auto* seconds = std::get_if<double>(&sleep_)) {
        // validates the constant up front
        SecondsToMillis(*seconds);
    } else if (!std::get<SleepFunction>(sleep_)) {
        throw ConfigurationError("Sleep function must not be empty");
    }
    if (!after_) {
        after_ = [] {};
    }
}

bool Policy::MatchesFailureKind(const std::exception& failure) const {
    if (failure_kinds_.empty()) {
        return true;
    }
    return std::any_of(failure_kinds_.begin(), failure_kinds_.end(), [&failure](const FailureKind& kind) {
        return kind.Matches(failure);
    });
}

bool Policy::MatchesMessage(const std::string& message) const {
    if (message_matchers_.empty()) {
        return true;
    }
    return std::any_of(message_matchers_.begin(), message_matchers_.end(), [&message](const MessageMatcher& matcher) {
        return matcher.Matches(message);
    });
}

std::chrono::milliseconds Policy::GetSleepTime(int retry) const {
    if (const auto* function = std::get_if<SleepFunction>(&sleep_)) {
        return SecondsToMillis((*function)(retry));
    }
    return SecondsToMillis(std::get<double>(sleep_));
}

void Policy::RunAfterHook() const {
    after_();
}

std::string Policy::ToString() const {
    std::ostringstream oss;
    oss << "{tries: " << max_tries_ << ", on: [";
    for (size_t i = 0; i < failure_kinds_.size(); ++i) {
        oss << (i == 0 ? "" : ", ") << failure_kinds_[i].Name();
    }
    if (error_predicate_.has_value()) {
        oss << (failure_kinds_.empty() ? "" : ", ") << kErrorTag << (error_predicate_->IsDefault() ? "" : "(custom)");
    }
    oss << "], message: [";
    for (size_t i = 0; i < message_matchers_.size(); ++i) {
        oss << (i == 0 ? "" : ", ") << message_matchers_[i].ToString();
    }
    oss << "], sleep: ";
    if (const auto* seconds = std::get_if<double>(&sleep_)) {
        oss << *seconds << "s";
    } else {
        oss << "fn(retry)";
    }
    oss << "}";
    return oss.str();
}

} // namespace retryable
