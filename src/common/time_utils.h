#pragma once

#include <chrono>
#include <cmath>
#include <string>

#include "retryable/error.h"

namespace retryable {

#define SEC_TO_MS(sec) ((sec) * 1000.0)

/**
 * Converts seconds to whole milliseconds, rounding to the nearest one.
 *
 * @throws ConfigurationError if seconds is negative, not finite or out of range
 */
inline std::chrono::milliseconds SecondsToMillis(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0) {
        throw ConfigurationError("Sleep must be a finite, non-negative number of seconds, got "
                                 + std::to_string(seconds));
    }
    // The largest double strictly below 2^63 ms
    constexpr double kMaxMillis = 9223372036854774784.0;
    if (SEC_TO_MS(seconds) > kMaxMillis) {
        throw ConfigurationError("Sleep of " + std::to_string(seconds) + " seconds is out of range");
    }
    return std::chrono::milliseconds(std::llround(SEC_TO_MS(seconds)));
}

} // namespace retryable
