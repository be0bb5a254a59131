#pragma once

#include <string>
#include <vector>

#include "common/option.h"
#include "retryable/config.h"

namespace retryable {

/**
 * Serves option sets written as text in an Options map.
 *
 * The defaults scope comes from the RETRYABLE_DEFAULT_* options; a named profile
 * comes from "<name>.on", "<name>.message", "<name>.tries" and "<name>.sleep".
 * Sleep functions and after hooks have no textual form.
 */
class OptionsConfigProvider : public ConfigProvider {
 public:
    explicit OptionsConfigProvider(Options options);

    /**
     * @throws ConfigurationError if a stored value is malformed
     */
    bool GetConfig(const std::string& name, RetryOptions& options) override;

    [[nodiscard]] const Options& GetOptions() const { return options_; }

 private:
    bool GetDefaults(RetryOptions& options) const;

    bool GetProfile(const std::string& name, RetryOptions& options) const;

    const Options options_;
};

/**
 * "error" is the error sentinel; any other token must name a registered failure kind.
 */
std::vector<OnSelector> ParseOnSelectors(const std::vector<std::string>& tokens);

std::vector<MessageMatcher> ParseMessageMatchers(const std::vector<std::string>& tokens);

} // namespace retryable
