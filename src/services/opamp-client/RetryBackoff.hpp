#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

struct RetryPolicy {
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{30000};
    double multiplier = 2.0;
    // Consecutive failed attempts of one message before it is abandoned
    // until the next scheduled cycle. 0 retries forever.
    int maxAttempts = 5;
};

bool ValidateRetryPolicy(const RetryPolicy& policy, std::string& error);

// Server retry hints are capped here before they become durations.
constexpr auto kMaxRetryHint = std::chrono::hours(24);

std::chrono::milliseconds RetryHintFromSeconds(uint64_t seconds);
std::chrono::milliseconds RetryHintFromNanoseconds(uint64_t nanoseconds);

// Retry-After in delta-seconds form. HTTP dates and anything else that is
// not a plain decimal number yield nullopt.
std::optional<std::chrono::milliseconds> ParseRetryAfter(const std::string& value);

// Exponential backoff state. One instance lives on the poll thread.
class RetryBackoff {
public:
    explicit RetryBackoff(RetryPolicy policy = RetryPolicy());

    // Records a failure and returns how long to wait before the next attempt.
    std::chrono::milliseconds NextDelay();

    // Same, but a server supplied retry-after wins when it is longer than
    // the computed delay, even past maxDelay.
    std::chrono::milliseconds NextDelay(std::chrono::milliseconds serverHint);

    void Reset();

    int Failures() const;
    const RetryPolicy& Policy() const;

private:
    RetryPolicy policy_;
    int failures_ = 0;
    std::chrono::milliseconds nextDelay_;
};
