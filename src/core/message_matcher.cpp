#include <regex>
#include <string>
#include <utility>

#include "retryable/error.h"
#include "retryable/options.h"

namespace retryable {

MessageMatcher::MessageMatcher(std::string substring)
    : MessageMatcher(Kind::SUBSTRING, std::move(substring), false) {}

MessageMatcher::MessageMatcher(const char* substring)
    : MessageMatcher(Kind::SUBSTRING, std::string(substring), false) {}

MessageMatcher::MessageMatcher(Kind kind, std::string source, bool ignore_case)
    : kind_(kind),
      source_(std::move(source)),
      ignore_case_(ignore_case) {
    if (kind_ != Kind::PATTERN) {
        return;
    }
    auto flags = std::regex::ECMAScript;
    if (ignore_case_) {
        flags |= std::regex::icase;
    }
    try {
        regex_ = std::make_shared<const std::regex>(source_, flags);
    } catch (const std::regex_error& e) {
        throw ConfigurationError("Invalid message pattern '" + source_ + "': " + e.what());
    }
}

MessageMatcher MessageMatcher::Substring(std::string substring) {
    return MessageMatcher(Kind::SUBSTRING, std::move(substring), false);
}

MessageMatcher MessageMatcher::Pattern(const std::string& pattern, bool ignore_case) {
    return MessageMatcher(Kind::PATTERN, pattern, ignore_case);
}

MessageMatcher MessageMatcher::Parse(const std::string& text) {
    if (text.size() >= 2 && text.front() == '/') {
        auto closing = text.rfind('/');
        if (closing > 0) {
            auto flags = text.substr(closing + 1);
            if (flags.empty() || flags == "i") {
                return Pattern(text.substr(1, closing - 1), flags == "i");
            }
        }
    }
    return Substring(text);
}

bool MessageMatcher::Matches(const std::string& message) const {
    if (kind_ == Kind::SUBSTRING) {
        return message.find(source_) != std::string::npos;
    }
    return std::regex_search(message, *regex_);
}

std::string MessageMatcher::ToString() const {
    if (kind_ == Kind::SUBSTRING) {
        return source_;
    }
    return "/" + source_ + "/" + (ignore_case_ ? "i" : "");
}

} // namespace retryable
