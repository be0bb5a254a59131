#include "config/options_config_provider.h"

#include <any>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/string_utils.h"

namespace retryable {

std::vector<OnSelector> ParseOnSelectors(const std::vector<std::string>& tokens) {
    std::vector<OnSelector> selectors;
    selectors.reserve(tokens.size());
    for (const auto& token : tokens) {
        if (token == kErrorTag) {
            selectors.push_back(OnSelector::Error());
            continue;
        }
        auto kind = FindFailureKind(token);
        if (!kind.has_value()) {
            throw ConfigurationError(
                "Unknown failure kind '" + token + "' in " + ToString(tokens) + ", register it with RegisterFailureKind");
        }
        selectors.emplace_back(*kind);
    }
    return selectors;
}

std::vector<MessageMatcher> ParseMessageMatchers(const std::vector<std::string>& tokens) {
    std::vector<MessageMatcher> matchers;
    matchers.reserve(tokens.size());
    for (const auto& token : tokens) {
        matchers.push_back(MessageMatcher::Parse(token));
    }
    return matchers;
}

OptionsConfigProvider::OptionsConfigProvider(Options options)
    : options_(std::move(options)) {
    SPDLOG_DEBUG("OptionsConfigProvider initialized with options: {}", ToString(options_));
}

bool OptionsConfigProvider::GetConfig(const std::string& name, RetryOptions& options) {
    if (name == kDefaultsScope) {
        return GetDefaults(options);
    }
    return GetProfile(name, options);
}

bool OptionsConfigProvider::GetDefaults(RetryOptions& options) const {
    RetryOptions defaults;
    if (options_.count(RETRYABLE_DEFAULT_ON) != 0) {
        defaults.on = ParseOnSelectors(GetOptionValue<std::vector<std::string>>(options_, RETRYABLE_DEFAULT_ON));
    }
    if (options_.count(RETRYABLE_DEFAULT_MESSAGE) != 0) {
        defaults.message
            = ParseMessageMatchers(GetOptionValue<std::vector<std::string>>(options_, RETRYABLE_DEFAULT_MESSAGE));
    }
    if (options_.count(RETRYABLE_DEFAULT_TRIES) != 0) {
        defaults.tries = GetOptionValue<int>(options_, RETRYABLE_DEFAULT_TRIES);
    }
    if (options_.count(RETRYABLE_DEFAULT_SLEEP) != 0) {
        defaults.sleep = SleepSpec(GetOptionValue<double>(options_, RETRYABLE_DEFAULT_SLEEP));
    }

    if (defaults.Empty()) {
        return false;
    }
    options = std::move(defaults);
    return true;
}

bool OptionsConfigProvider::GetProfile(const std::string& name, RetryOptions& options) const {
    if (name.empty()) {
        SPDLOG_ERROR("Retry config name is empty");
        return false;
    }

    RetryOptions profile;
    auto lookup = [this, &name](const std::string& key, ValueType type) -> std::any {
        auto it = options_.find(ProfileOptionKey(name, key));
        if (it == options_.end()) {
            return {};
        }
        return ParseValue(type, it->second);
    };

    if (auto on = lookup("on", STRING_LIST); on.has_value()) {
        profile.on = ParseOnSelectors(std::any_cast<std::vector<std::string>>(on));
    }
    if (auto message = lookup("message", STRING_LIST); message.has_value()) {
        profile.message = ParseMessageMatchers(std::any_cast<std::vector<std::string>>(message));
    }
    if (auto tries = lookup("tries", INT); tries.has_value()) {
        profile.tries = std::any_cast<int>(tries);
    }
    if (auto sleep = lookup("sleep", DOUBLE); sleep.has_value()) {
        profile.sleep = SleepSpec(std::any_cast<double>(sleep));
    }

    if (profile.Empty()) {
        return false;
    }
    options = std::move(profile);
    return true;
}

} // namespace retryable
