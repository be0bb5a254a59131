#pragma once

#include <chrono>

namespace retryable {

/**
 * Blocking "sleep for duration" service used between attempts.
 */
class Sleeper {
 public:
    virtual ~Sleeper() = default;

    virtual void Sleep(std::chrono::milliseconds duration) = 0;
};

/**
 * Sleeps on the calling thread.
 */
class ThreadSleeper : public Sleeper {
 public:
    void Sleep(std::chrono::milliseconds duration) override;
};

} // namespace retryable
