#include "common/option.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "common/string_utils.h"

namespace retryable {

namespace {

int ParseInt(const std::string& value) {
    size_t pos = 0;
    int result = std::stoi(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

double ParseDouble(const std::string& value) {
    size_t pos = 0;
    double result = std::stod(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

bool ParseBool(const std::string& value) {
    if (value == "true" || value == "True" || value == "TRUE" || value == "1") {
        return true;
    }
    if (value == "false" || value == "False" || value == "FALSE" || value == "0") {
        return false;
    }
    throw std::invalid_argument("not a boolean");
}

} // namespace

OptionRegistry& OptionRegistry::Instance() {
    static OptionRegistry registry;
    return registry;
}

bool OptionRegistry::Define(const std::string& name, ValueType type, const std::string& default_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = defs_.emplace(name, OptionDef{type, default_value});
    if (!inserted && (it->second.value_type != type || it->second.default_value != default_value)) {
        SPDLOG_ERROR(
            "Option {} already defined as (type={}, default={}), ignoring (type={}, default={})",
            name,
            static_cast<int>(it->second.value_type),
            it->second.default_value,
            static_cast<int>(type),
            default_value);
    }
    return inserted;
}

std::optional<OptionDef> OptionRegistry::Find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = defs_.find(name);
    if (it == defs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> OptionRegistry::Names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(defs_.size());
    for (const auto& entry : defs_) {
        names.push_back(entry.first);
    }
    return names;
}

bool IsProfileOptionKey(const std::string& name) {
    auto dot = name.rfind(DOT);
    if (dot == std::string::npos || dot == 0 || dot + 1 == name.size()) {
        return false;
    }
    auto key = name.substr(dot + 1);
    return std::find(kProfileOptionKeys.begin(), kProfileOptionKeys.end(), key) != kProfileOptionKeys.end();
}

std::any ParseValue(ValueType type, const std::string& value) {
    std::string text = TrimCopy(value);
    try {
        switch (type) {
            case ValueType::INT:
                return ParseInt(text);
            case ValueType::STRING:
                return text;
            case ValueType::STRING_LIST:
                return SplitByComma(text);
            case ValueType::BOOL:
                return ParseBool(text);
            case ValueType::DOUBLE:
                return ParseDouble(text);
            default:
                break;
        }
    } catch (const std::invalid_argument& e) {
        throw ConfigurationError("Invalid value '" + value + "' for type " + std::to_string(type) + ": " + e.what());
    } catch (const std::out_of_range& e) {
        throw ConfigurationError("Value '" + value + "' out of range for type " + std::to_string(type));
    }
    throw ConfigurationError("Invalid type for value: " + std::to_string(type));
}

void PutOptionValue(Options& options, const std::string& name, const std::string& value) {
    if (!value.empty()) {
        if (options.find(name) != options.end()) {
            SPDLOG_WARN("Option {} exists! Update it to {}.", name, value);
        }
        options[name] = value;
    } else {
        SPDLOG_DEBUG("Option {} is empty! Skip it.", name);
    }
}

auto GetOptionFromEnv(const std::string& name) -> std::string {
    const char* env_value = std::getenv(name.c_str());
    return env_value != nullptr ? std::string(env_value) : "";
}

void LoadOptions(Options& options) {
    std::string load_mode = GetOptionFromEnv(RETRYABLE_OPTIONS_LOAD_MODE);
    load_mode = load_mode.empty() ? GetOptionValue<std::string>(options, RETRYABLE_OPTIONS_LOAD_MODE) : load_mode;
    if (load_mode == "ENV") {
        LoadOptionsFromEnv(options);
    } else if (load_mode == "FILE") {
        LoadOptionsFromFile(options);
    } else {
        SPDLOG_ERROR("Invalid load mode: {}", load_mode);
    }
}

// Load options from ENV
void LoadOptionsFromEnv(Options& options) {
    for (const auto& name : OptionRegistry::Instance().Names()) {
        const char* env_value = std::getenv(name.c_str());
        if (env_value != nullptr) {
            PutOptionValue(options, name, std::string(env_value));
        }
    }

    SPDLOG_DEBUG("Load options from ENV: {}", ToString(options));
}

constexpr const char* DEFAULT_RETRYABLE_OPTIONS_FILE = "retryable.conf";

void LoadOptionsFromFile(Options& options, std::string file_path) {
    file_path = file_path.empty() ? GetOptionFromEnv(RETRYABLE_OPTIONS_FILE_PATH) : file_path;

    // If file path was not specified in ENV, try to get it from options
    file_path = file_path.empty() ? GetOptionValue<std::string>(options, RETRYABLE_OPTIONS_FILE_PATH) : file_path;

    // If file path was not specified in ENV or options, use default
    file_path = file_path.empty() ? std::filesystem::current_path().string() + "/" + DEFAULT_RETRYABLE_OPTIONS_FILE
                                  : file_path;

    std::ifstream config_file(file_path);
    if (!config_file.is_open()) {
        SPDLOG_WARN("Options file not found: {}. Skip load options from file.", file_path);
        return;
    }

    std::string line;
    int line_number = 0;

    while (std::getline(config_file, line)) {
        line_number++;

        line = TrimCopy(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t const delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos) {
            SPDLOG_WARN("Invalid options line {} in {}: {} (missing '=')", line_number, file_path, line);
            continue;
        }

        std::string key = TrimCopy(std::string_view(line).substr(0, delimiter_pos));
        std::string value = TrimCopy(std::string_view(line).substr(delimiter_pos + 1));

        // Keys are either defined options or "<profile>.<key>" entries of a named profile
        if (OptionRegistry::Instance().Contains(key) || IsProfileOptionKey(key)) {
            PutOptionValue(options, key, value);
            SPDLOG_DEBUG("Loaded option from file: {} = {}", key, value);
        } else {
            SPDLOG_WARN("Unknown option in options file line {}: {} (skipping)", line_number, key);
        }
    }

    SPDLOG_INFO("Load options from file [{}]: {}", file_path, ToString(options));
}

} // namespace retryable
