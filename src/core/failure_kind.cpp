#include <future>
#include <ios>
#include <mutex>
#include <new>
#include <stdexcept>
#include <string>
#include <system_error>
#include <typeinfo>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "retryable/options.h"

namespace retryable {

namespace {

using FailureKindRegistry = std::unordered_map<std::string, FailureKind>;

FailureKindRegistry& GetFailureKindRegistry() {
    static FailureKindRegistry registry = [] {
        FailureKindRegistry kinds;
        auto add = [&kinds](const FailureKind& kind) { kinds.emplace(kind.Name(), kind); };
        add(FailureKind::Of<std::exception>("std::exception"));
        add(FailureKind::Of<std::logic_error>("std::logic_error"));
        add(FailureKind::Of<std::invalid_argument>("std::invalid_argument"));
        add(FailureKind::Of<std::domain_error>("std::domain_error"));
        add(FailureKind::Of<std::length_error>("std::length_error"));
        add(FailureKind::Of<std::out_of_range>("std::out_of_range"));
        add(FailureKind::Of<std::future_error>("std::future_error"));
        add(FailureKind::Of<std::runtime_error>("std::runtime_error"));
        add(FailureKind::Of<std::range_error>("std::range_error"));
        add(FailureKind::Of<std::overflow_error>("std::overflow_error"));
        add(FailureKind::Of<std::underflow_error>("std::underflow_error"));
        add(FailureKind::Of<std::system_error>("std::system_error"));
        add(FailureKind::Of<std::ios_base::failure>("std::ios_base::failure"));
        add(FailureKind::Of<std::bad_alloc>("std::bad_alloc"));
        add(FailureKind::Of<std::bad_cast>("std::bad_cast"));
        return kinds;
    }();
    return registry;
}

std::mutex& GetFailureKindRegistryMutex() {
    static std::mutex m;
    return m;
}

} // namespace

void RegisterFailureKind(const FailureKind& kind) {
    std::lock_guard<std::mutex> lock(GetFailureKindRegistryMutex());
    auto& registry = GetFailureKindRegistry();

    auto it = registry.find(kind.Name());
    if (it == registry.end()) {
        registry.emplace(kind.Name(), kind);
        return;
    }
    if (it->second != kind) {
        SPDLOG_WARN("Failure kind {} already registered with another type, replacing it", kind.Name());
    }
    it->second = kind;
}

std::optional<FailureKind> FindFailureKind(const std::string& name) {
    std::lock_guard<std::mutex> lock(GetFailureKindRegistryMutex());
    auto& registry = GetFailureKindRegistry();

    auto it = registry.find(name);
    if (it == registry.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace retryable
