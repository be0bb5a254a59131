#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace retryable {

/**
 * Raised when retry options cannot be turned into a valid policy.
 * Failures thrown by the retried work are never wrapped into this type.
 */
class ConfigurationError : public std::invalid_argument {
 public:
    explicit ConfigurationError(const std::string& msg)
        : std::invalid_argument(msg) {}
};

// Tag recognized as the failure marker of returned values, e.g. "error" or ("error", reason).
constexpr std::string_view kErrorTag = "error";

/**
 * A tagged result for work that reports failures by value instead of by throwing.
 */
template <typename T>
class Outcome {
 public:
    static Outcome Ok(T value) { return Outcome(std::in_place_index<0>, std::move(value)); }

    static Outcome Error(std::string reason) { return Outcome(std::in_place_index<1>, std::move(reason)); }

    [[nodiscard]] bool IsOk() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool IsError() const noexcept { return data_.index() == 1; }

    const T& Value() const& {
        if (IsError()) {
            throw std::logic_error("Outcome holds an error: " + Reason());
        }
        return std::get<0>(data_);
    }

    T&& Value() && {
        if (IsError()) {
            throw std::logic_error("Outcome holds an error: " + Reason());
        }
        return std::get<0>(std::move(data_));
    }

    const std::string& Reason() const {
        if (IsOk()) {
            throw std::logic_error("Outcome holds a value, not an error");
        }
        return std::get<1>(data_);
    }

    bool operator==(const Outcome& other) const { return data_ == other.data_; }
    bool operator!=(const Outcome& other) const { return !(*this == other); }

 private:
    template <std::size_t I, typename U>
    Outcome(std::in_place_index_t<I> index, U&& value)
        : data_(index, std::forward<U>(value)) {}

    std::variant<T, std::string> data_;
};

template <typename T>
bool IsErrorTag(const T& tag) {
    if constexpr (std::is_pointer_v<T> && std::is_convertible_v<const T&, std::string_view>) {
        return tag != nullptr && std::string_view(tag) == kErrorTag;
    } else if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        return std::string_view(tag) == kErrorTag;
    } else {
        return false;
    }
}

/**
 * Decides whether a returned value is a failure under the default error predicate.
 * Specialize it to teach the default predicate about your own result types.
 */
template <typename T>
struct ErrorValueTraits {
    static bool IsError(const T& value) {
        // A bare sentinel, e.g. the string "error".
        return IsErrorTag(value);
    }
};

template <typename A, typename B>
struct ErrorValueTraits<std::pair<A, B>> {
    static bool IsError(const std::pair<A, B>& value) { return IsErrorTag(value.first); }
};

template <typename A, typename... Rest>
struct ErrorValueTraits<std::tuple<A, Rest...>> {
    static bool IsError(const std::tuple<A, Rest...>& value) { return IsErrorTag(std::get<0>(value)); }
};

template <typename... Ts>
struct ErrorValueTraits<std::variant<Ts...>> {
    static bool IsError(const std::variant<Ts...>& value) {
        return std::visit(
            [](const auto& alternative) {
                using Alternative = std::decay_t<decltype(alternative)>;
                return ErrorValueTraits<Alternative>::IsError(alternative);
            },
            value);
    }
};

template <>
struct ErrorValueTraits<std::error_code> {
    static bool IsError(const std::error_code& value) { return static_cast<bool>(value); }
};

template <typename T>
struct ErrorValueTraits<Outcome<T>> {
    static bool IsError(const Outcome<T>& value) { return value.IsError(); }
};

template <typename T>
bool IsErrorValue(const T& value) {
    return ErrorValueTraits<T>::IsError(value);
}

} // namespace retryable
