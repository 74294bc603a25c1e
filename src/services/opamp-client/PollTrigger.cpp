#include "PollTrigger.hpp"

const char* ToString(PollEvent event) {
    switch (event) {
        case PollEvent::Tick: return "tick";
        case PollEvent::SendNow: return "send-now";
        case PollEvent::Reschedule: return "reschedule";
        case PollEvent::Stop: return "stop";
    }
    return "unknown";
}

void PollTrigger::RequestSend() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sendPending_ = true;
    }
    cv_.notify_all();
}

void PollTrigger::RequestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    cv_.notify_all();
}

void PollTrigger::Reschedule() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reschedulePending_ = true;
    }
    cv_.notify_all();
}

bool PollTrigger::StopRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopRequested_;
}

bool PollTrigger::SendPending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sendPending_;
}

PollEvent PollTrigger::WaitUntil(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] {
        return stopRequested_ || sendPending_ || reschedulePending_;
    });

    if (stopRequested_) {
        return PollEvent::Stop;
    }
    if (sendPending_) {
        sendPending_ = false;
        reschedulePending_ = false;
        return PollEvent::SendNow;
    }
    if (reschedulePending_) {
        reschedulePending_ = false;
        return PollEvent::Reschedule;
    }
    return PollEvent::Tick;
}

bool PollTrigger::SleepFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, delay, [this] { return stopRequested_; });
    return !stopRequested_;
}
