#pragma once

#include "ClientCallbacks.hpp"
#include "HttpTransport.hpp"
#include "PollTrigger.hpp"
#include "ReportAccumulator.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

struct DispatchResult {
    // The server answered with an error that should be retried.
    bool failed = false;
    // ReportFullState was requested; the next exchange should start at once.
    bool resendRequested = false;
    std::optional<std::chrono::milliseconds> retryAfter;
};

// Routes one decoded ServerToAgent to the application. Runs on the poll
// thread only; directives the agent did not declare a capability for are
// dropped and counted.
class ReplyDispatcher {
public:
    // Returns false when the interval was refused.
    using IntervalSetter = std::function<bool(std::chrono::seconds)>;

    ReplyDispatcher(
        ClientCallbacks& callbacks,
        ReportAccumulator& accumulator,
        HttpTransport& transport,
        IntervalSetter setInterval);

    DispatchResult Dispatch(const ServerToAgent& message);

    uint64_t IgnoredDirectiveCount() const;
    std::string LastRemoteConfigHash() const;

private:
    void HandleConnectionSettings(const ConnectionSettingsOffers& offers);
    void HandleIdentification(const std::string& newUid);
    void HandleFullState();
    void Ignore(const std::string& what);

    ClientCallbacks& callbacks_;
    ReportAccumulator& accumulator_;
    HttpTransport& transport_;
    IntervalSetter setInterval_;
    std::atomic<uint64_t> ignored_{0};
    mutable std::mutex hashMutex_;
    std::string lastRemoteConfigHash_;
};
