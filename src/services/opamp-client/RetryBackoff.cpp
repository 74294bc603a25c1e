#include "RetryBackoff.hpp"

#include <algorithm>
#include <cctype>

namespace {
constexpr uint64_t kMaxRetryHintSeconds = std::chrono::duration_cast<std::chrono::seconds>(kMaxRetryHint).count();
constexpr uint64_t kMaxRetryHintMilliseconds =
    std::chrono::duration_cast<std::chrono::milliseconds>(kMaxRetryHint).count();
// More digits than this cannot be below the cap.
constexpr size_t kMaxRetryAfterDigits = 18;
} // namespace

bool ValidateRetryPolicy(const RetryPolicy& policy, std::string& error) {
    if (policy.initialDelay.count() <= 0) {
        error = "retry initial delay must be positive";
        return false;
    }
    if (policy.maxDelay < policy.initialDelay) {
        error = "retry max delay must not be below the initial delay";
        return false;
    }
    // Written so NaN fails too.
    if (!(policy.multiplier >= 1.0)) {
        error = "retry multiplier must be at least 1";
        return false;
    }
    if (policy.maxAttempts < 0) {
        error = "retry max attempts must not be negative";
        return false;
    }
    return true;
}

std::chrono::milliseconds RetryHintFromSeconds(uint64_t seconds) {
    if (seconds >= kMaxRetryHintSeconds) {
        return kMaxRetryHint;
    }
    return std::chrono::seconds(static_cast<long long>(seconds));
}

std::chrono::milliseconds RetryHintFromNanoseconds(uint64_t nanoseconds) {
    const uint64_t milliseconds = nanoseconds / 1000000;
    if (milliseconds >= kMaxRetryHintMilliseconds) {
        return kMaxRetryHint;
    }
    return std::chrono::milliseconds(static_cast<long long>(milliseconds));
}

std::optional<std::chrono::milliseconds> ParseRetryAfter(const std::string& value) {
    const size_t begin = value.find_first_not_of(" \t");
    const size_t end = value.find_last_not_of(" \t");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    const std::string digits = value.substr(begin, end - begin + 1);
    for (const char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    if (digits.size() > kMaxRetryAfterDigits) {
        return kMaxRetryHint;
    }
    return RetryHintFromSeconds(std::stoull(digits));
}

RetryBackoff::RetryBackoff(RetryPolicy policy)
    : policy_(policy),
      nextDelay_(policy.initialDelay) {}

std::chrono::milliseconds RetryBackoff::NextDelay() {
    const auto delay = std::min(nextDelay_, policy_.maxDelay);
    ++failures_;

    const double scaled = static_cast<double>(delay.count()) * policy_.multiplier;
    const double capped = std::min(scaled, static_cast<double>(policy_.maxDelay.count()));
    nextDelay_ = std::chrono::milliseconds(static_cast<long long>(capped));
    return delay;
}

std::chrono::milliseconds RetryBackoff::NextDelay(std::chrono::milliseconds serverHint) {
    const auto computed = NextDelay();
    return std::max(computed, serverHint);
}

void RetryBackoff::Reset() {
    failures_ = 0;
    nextDelay_ = policy_.initialDelay;
}

int RetryBackoff::Failures() const {
    return failures_;
}

const RetryPolicy& RetryBackoff::Policy() const {
    return policy_;
}
