#pragma once

#include <any>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "retryable/error.h"

namespace retryable {

// Options is a map of config items <config_name, config_value>
using Options = std::unordered_map<std::string, std::string>;

// Prints options ordered by name.
inline std::ostream& operator<<(std::ostream& os, const Options& options) {
    std::map<std::string, std::string> ordered(options.begin(), options.end());
    const char* separator = "";
    os << "{";
    for (const auto& [name, value] : ordered) {
        os << separator << name << ": " << value;
        separator = ", ";
    }
    return os << "}";
}

inline std::string ToString(const Options& options) {
    std::ostringstream oss;
    oss << options;
    return oss.str();
}

enum ValueType : uint8_t { INT = 0, STRING = 1, STRING_LIST = 2, BOOL = 3, DOUBLE = 4, UNKNOWN = 255 };

struct OptionDef {
    ValueType value_type;
    std::string default_value;
};

/**
 * Process-wide table of option definitions, filled at static initialization by
 * RETRYABLE_OPTION. Thread-safe.
 */
class OptionRegistry {
 public:
    static OptionRegistry& Instance();

    /**
     * Adds a definition. A name defined twice keeps its first definition; a
     * conflicting redefinition is logged.
     *
     * @return true if the name was not defined before
     */
    bool Define(const std::string& name, ValueType type, const std::string& default_value);

    [[nodiscard]] std::optional<OptionDef> Find(const std::string& name) const;

    [[nodiscard]] bool Contains(const std::string& name) const { return Find(name).has_value(); }

    [[nodiscard]] std::vector<std::string> Names() const;

 private:
    OptionRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, OptionDef> defs_;
};

#define RETRYABLE_OPTION(name, type, default_value) \
    inline const std::string name = #name; \
    inline const bool name##_defined = ::retryable::OptionRegistry::Instance().Define(name, type, default_value);

/********** Option definition: [Option Name, Option Type, Default Value] ***********/
RETRYABLE_OPTION(RETRYABLE_OPTIONS_LOAD_MODE, STRING, "ENV") // ENV, FILE
RETRYABLE_OPTION(RETRYABLE_OPTIONS_FILE_PATH, STRING, "") // Options file path

// Defaults scope, merged under every literal option set
RETRYABLE_OPTION(RETRYABLE_DEFAULT_ON, STRING_LIST, "") // e.g. "std::runtime_error,error"
RETRYABLE_OPTION(RETRYABLE_DEFAULT_MESSAGE, STRING_LIST, "") // e.g. "timeout,/throttl/i"
RETRYABLE_OPTION(RETRYABLE_DEFAULT_TRIES, INT, "1")
RETRYABLE_OPTION(RETRYABLE_DEFAULT_SLEEP, DOUBLE, "1") // seconds

// Log Options
RETRYABLE_OPTION(RETRYABLE_LOG_BACKEND, STRING, "SPDLOG") // SPDLOG, GLOG
RETRYABLE_OPTION(RETRYABLE_LOG_DIR, STRING, "/tmp/retryable")
RETRYABLE_OPTION(RETRYABLE_LOG_LEVEL, STRING, "INFO") // DEBUG, INFO, WARNING, ERROR
RETRYABLE_OPTION(RETRYABLE_LOG_TO_CONSOLE, BOOL, "true")
RETRYABLE_OPTION(RETRYABLE_LOG_TO_FILE, BOOL, "false")
RETRYABLE_OPTION(RETRYABLE_LOG_MAX_FILE_DAYS, INT, "5") // 5 days
/********** Option definition: [Option Name, Option Type, Default Value] ***********/

// Keys a named profile may set in an options file, as "<profile>.<key> = value".
inline const std::vector<std::string> kProfileOptionKeys = {"on", "message", "tries", "sleep"};

inline std::string ProfileOptionKey(const std::string& profile, const std::string& key) {
    return profile + "." + key;
}

bool IsProfileOptionKey(const std::string& name);

/**
 * Parses a textual value into the type the definition declares: int, std::string,
 * std::vector<std::string>, bool or double.
 *
 * @throws ConfigurationError if the text does not hold a value of that type
 */
std::any ParseValue(ValueType type, const std::string& value);

/**
 * Reads a defined option, falling back to its default when unset. Undefined
 * options and empty values yield T{}.
 *
 * @throws ConfigurationError if the stored text does not parse as the option's type
 */
template <typename T>
T GetOptionValue(const Options& options, const std::string& name) {
    auto def = OptionRegistry::Instance().Find(name);
    if (!def.has_value()) {
        SPDLOG_ERROR("Option definition for {} not found", name);
        return T{};
    }

    auto it = options.find(name);
    const std::string& text = it != options.end() ? it->second : def->default_value;
    if (text.empty()) {
        return T{};
    }
    return std::any_cast<T>(ParseValue(def->value_type, text));
}

void PutOptionValue(Options& options, const std::string& name, const std::string& value);

// Utils for config
std::string GetOptionFromEnv(const std::string& name);
void LoadOptions(Options& options);
void LoadOptionsFromEnv(Options& options);
void LoadOptionsFromFile(Options& options, std::string file_path = "");

} // namespace retryable
