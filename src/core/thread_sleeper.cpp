#include <thread>

#include "retryable/sleeper.h"

namespace retryable {

void ThreadSleeper::Sleep(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

} // namespace retryable
