#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

// Longest poll interval accepted from the application or the server.
constexpr auto kMaxPollInterval = std::chrono::hours(24);

enum class PollEvent {
    Tick,
    SendNow,
    Reschedule,
    Stop
};

const char* ToString(PollEvent event);

// Wait primitive of the poll thread. Any thread may signal; only the poll
// thread waits. Signals never block.
class PollTrigger {
public:
    using Clock = std::chrono::steady_clock;

    void RequestSend();
    void RequestStop();
    // Wakes the waiter so it recomputes its deadline (poll interval changed).
    void Reschedule();

    bool StopRequested() const;
    bool SendPending() const;

    // Stop wins over SendNow, SendNow over Reschedule; Tick once the
    // deadline passes. SendNow and Reschedule are consumed on return.
    PollEvent WaitUntil(Clock::time_point deadline);

    // Backoff sleep: only stop cuts it short. Returns false when stopped.
    bool SleepFor(std::chrono::milliseconds delay);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool sendPending_ = false;
    bool reschedulePending_ = false;
    bool stopRequested_ = false;
};
