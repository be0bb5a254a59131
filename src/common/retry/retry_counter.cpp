#include "common/retry/retry_counter.h"

#include <string>

#include "retryable/error.h"

namespace retryable {

RetryCounter::RetryCounter(int max_retries)
    : max_retries_(max_retries),
      retry_count_(0) {
    if (max_retries < 0) {
        throw ConfigurationError("Max retries must be a non-negative number, got " + std::to_string(max_retries));
    }
}

int RetryCounter::GetRetryCount() const {
    return retry_count_;
}

int RetryCounter::GetMaxRetries() const {
    return max_retries_;
}

int RetryCounter::GetAttemptCount() const {
    return retry_count_ + 1;
}

bool RetryCounter::IsExhausted() const {
    return retry_count_ == max_retries_;
}

void RetryCounter::Advance() {
    if (!IsExhausted()) {
        retry_count_++;
    }
}

} // namespace retryable
