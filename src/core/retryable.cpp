#include "retryable/retryable.h"

#include <mutex>

#include <spdlog/spdlog.h>

#include "common/log_utils.h"
#include "common/option.h"
#include "config/options_config_provider.h"

namespace retryable {

namespace {

struct DefaultEngineState {
    std::mutex mutex;
    std::shared_ptr<ConfigProvider> provider;
    std::shared_ptr<Sleeper> sleeper;
};

DefaultEngineState& GetDefaultEngineState() {
    static DefaultEngineState state;
    return state;
}

} // namespace

RetryEngine GetDefaultRetryEngine() {
    auto& state = GetDefaultEngineState();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.provider) {
        Options options;
        LoadOptions(options);
        state.provider = std::make_shared<OptionsConfigProvider>(std::move(options));
        SPDLOG_DEBUG("Default retry config provider loaded from options");
    }
    if (!state.sleeper) {
        state.sleeper = std::make_shared<ThreadSleeper>();
    }
    return RetryEngine(state.provider, state.sleeper);
}

void SetDefaultConfigProvider(std::shared_ptr<ConfigProvider> provider) {
    auto& state = GetDefaultEngineState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.provider = std::move(provider);
}

void SetDefaultSleeper(std::shared_ptr<Sleeper> sleeper) {
    auto& state = GetDefaultEngineState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.sleeper = std::move(sleeper);
}

void ResetDefaultRetryEngine() {
    auto& state = GetDefaultEngineState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.provider.reset();
    state.sleeper.reset();
}

bool InitRetryableLog(const std::string& app_name) {
    Options options;
    LoadOptions(options);
    return InitRetryableLog(app_name, options);
}

} // namespace retryable
