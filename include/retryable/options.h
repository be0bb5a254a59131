#pragma once

#include <any>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>

#include "retryable/error.h"

namespace retryable {

/**
 * Time in seconds to sleep before a retry. Either a constant or a function of the
 * zero-based retry index.
 */
using SleepFunction = std::function<double(int)>;
using SleepSpec = std::variant<double, SleepFunction>;

/**
 * Code run exactly once after the whole retry sequence, like `finally`.
 */
using AfterHook = std::function<void()>;

/**
 * A kind of thrown failure. Matches failures of the exception type it was built
 * from and of any type derived from it.
 */
class FailureKind {
 public:
    template <typename E>
    static FailureKind Of(std::string name = typeid(E).name()) {
        static_assert(std::is_base_of_v<std::exception, E>, "failure kinds must derive from std::exception");
        return FailureKind(std::move(name), std::type_index(typeid(E)), [](const std::exception& failure) {
            return dynamic_cast<const E*>(&failure) != nullptr;
        });
    }

    [[nodiscard]] bool Matches(const std::exception& failure) const { return matcher_(failure); }

    [[nodiscard]] const std::string& Name() const { return name_; }

    [[nodiscard]] std::type_index Type() const { return type_; }

    bool operator==(const FailureKind& other) const { return type_ == other.type_; }
    bool operator!=(const FailureKind& other) const { return !(*this == other); }

 private:
    FailureKind(std::string name, std::type_index type, std::function<bool(const std::exception&)> matcher)
        : name_(std::move(name)),
          type_(type),
          matcher_(std::move(matcher)) {}

    std::string name_;
    std::type_index type_;
    std::function<bool(const std::exception&)> matcher_;
};

/**
 * Registers a failure kind so textual configuration can refer to it by name.
 * Re-registering a name with a different type replaces the old entry.
 */
void RegisterFailureKind(const FailureKind& kind);

template <typename E>
void RegisterFailureKind(const std::string& name) {
    RegisterFailureKind(FailureKind::Of<E>(name));
}

/**
 * Looks up a registered failure kind. The standard exception hierarchy is registered
 * under its qualified names, e.g. "std::runtime_error".
 */
std::optional<FailureKind> FindFailureKind(const std::string& name);

/**
 * Matches a failure message either by substring or by regular expression search.
 */
class MessageMatcher {
 public:
    enum class Kind : uint8_t { SUBSTRING = 0, PATTERN = 1 };

    // Implicit so plain strings read as substring matchers in option lists.
    MessageMatcher(std::string substring); // NOLINT(google-explicit-constructor)
    MessageMatcher(const char* substring); // NOLINT(google-explicit-constructor)

    static MessageMatcher Substring(std::string substring);

    /**
     * @throws ConfigurationError if the pattern is not a valid ECMAScript regex
     */
    static MessageMatcher Pattern(const std::string& pattern, bool ignore_case = false);

    /**
     * Parses the textual form: "/regex/" or "/regex/i" is a pattern, anything else a
     * substring.
     */
    static MessageMatcher Parse(const std::string& text);

    [[nodiscard]] bool Matches(const std::string& message) const;

    [[nodiscard]] Kind GetKind() const { return kind_; }

    [[nodiscard]] std::string ToString() const;

    bool operator==(const MessageMatcher& other) const {
        return kind_ == other.kind_ && source_ == other.source_ && ignore_case_ == other.ignore_case_;
    }
    bool operator!=(const MessageMatcher& other) const { return !(*this == other); }

 private:
    MessageMatcher(Kind kind, std::string source, bool ignore_case);

    Kind kind_;
    std::string source_;
    bool ignore_case_;
    std::shared_ptr<const std::regex> regex_;
};

/**
 * Decides which returned values are failures that should be retried.
 *
 * The default predicate follows ErrorValueTraits. An explicit predicate is bound to
 * one argument type; using it with work returning another type is a
 * ConfigurationError.
 */
class ErrorPredicate {
 public:
    static ErrorPredicate Default() { return ErrorPredicate(); }

    template <typename T, typename Fn>
    static ErrorPredicate Of(Fn&& predicate) {
        return ErrorPredicate(std::function<bool(const T&)>(std::forward<Fn>(predicate)), typeid(T).name());
    }

    [[nodiscard]] bool IsDefault() const { return !predicate_.has_value(); }

    template <typename T>
    std::function<bool(const T&)> For() const {
        if (IsDefault()) {
            return [](const T& value) { return IsErrorValue(value); };
        }
        const auto* predicate = std::any_cast<std::function<bool(const T&)>>(&predicate_);
        if (predicate == nullptr) {
            throw ConfigurationError(
                "Error predicate expects values of type " + type_name_ + " but the work returns "
                + typeid(T).name());
        }
        return *predicate;
    }

 private:
    ErrorPredicate() = default;

    ErrorPredicate(std::any predicate, std::string type_name)
        : predicate_(std::move(predicate)),
          type_name_(std::move(type_name)) {}

    std::any predicate_;
    std::string type_name_;
};

/**
 * One entry of the `on` option: a thrown failure kind, the bare error sentinel, or
 * the error sentinel paired with an explicit predicate.
 */
class OnSelector {
 public:
    OnSelector(FailureKind kind) // NOLINT(google-explicit-constructor)
        : kind_(std::move(kind)) {}

    static OnSelector Error() { return OnSelector(ErrorPredicate::Default()); }

    static OnSelector Error(ErrorPredicate predicate) { return OnSelector(std::move(predicate)); }

    template <typename T, typename Fn>
    static OnSelector Error(Fn&& predicate) {
        return OnSelector(ErrorPredicate::Of<T>(std::forward<Fn>(predicate)));
    }

    [[nodiscard]] bool IsError() const { return predicate_.has_value(); }

    [[nodiscard]] const std::optional<FailureKind>& Kind() const { return kind_; }

    [[nodiscard]] const std::optional<ErrorPredicate>& Predicate() const { return predicate_; }

 private:
    explicit OnSelector(ErrorPredicate predicate)
        : predicate_(std::move(predicate)) {}

    std::optional<FailureKind> kind_;
    std::optional<ErrorPredicate> predicate_;
};

template <typename E>
OnSelector On() {
    return OnSelector(FailureKind::Of<E>());
}

/**
 * A literal option set. Unset keys inherit from the defaults when resolved.
 *
 *   RetryOptions().WithOn(On<TimeoutError>()).WithTries(5).WithSleep(2)
 */
struct RetryOptions {
    std::optional<std::vector<OnSelector>> on;
    std::optional<std::vector<MessageMatcher>> message;
    std::optional<int> tries;
    std::optional<SleepSpec> sleep;
    std::optional<AfterHook> after;

    // Appends to the `on` list.
    RetryOptions& WithOn(OnSelector selector);
    // Appends to the `message` list.
    RetryOptions& WithMessage(MessageMatcher matcher);
    RetryOptions& WithTries(int value);
    RetryOptions& WithSleep(double seconds);
    RetryOptions& WithSleep(SleepFunction function);
    RetryOptions& WithAfter(AfterHook hook);

    /**
     * Keys set in `overrides` replace the keys set here; lists are replaced, not
     * concatenated.
     */
    RetryOptions& Merge(const RetryOptions& overrides);

    [[nodiscard]] bool Empty() const;
};

} // namespace retryable
