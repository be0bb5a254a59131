#pragma once

namespace retryable {

/**
 * Counts retries against a maximum. The counter is zero based: it holds the number
 * of retries performed so far, so the first attempt runs at count 0.
 */
class RetryCounter {
 public:
    /**
     * @param max_retries number of retries allowed after the first attempt
     * @throws ConfigurationError if max_retries is negative
     */
    explicit RetryCounter(int max_retries);

    [[nodiscard]] int GetRetryCount() const;

    [[nodiscard]] int GetMaxRetries() const;

    // Total attempts made so far, counting the one in progress.
    [[nodiscard]] int GetAttemptCount() const;

    [[nodiscard]] bool IsExhausted() const;

    // Moves to the next retry. Does nothing once exhausted.
    void Advance();

 private:
    int max_retries_;
    int retry_count_;
};

} // namespace retryable
