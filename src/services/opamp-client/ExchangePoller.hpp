#pragma once

#include "ClientCallbacks.hpp"
#include "HttpTransport.hpp"
#include "MessageCodec.hpp"
#include "PollTrigger.hpp"
#include "ReplyDispatcher.hpp"
#include "ReportAccumulator.hpp"
#include "RetryBackoff.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

enum class CycleState {
    Idle,
    Sending,
    AwaitingReply,
    Applying
};

const char* ToString(CycleState state);

struct StopPolicy {
    // How long Stop waits for an in-flight exchange before cancelling it.
    std::chrono::milliseconds gracePeriod{5000};
    // How long Stop waits after cancelling before it detaches the thread.
    std::chrono::milliseconds cancelWait{1000};
    // Send a final AgentDisconnect message on the way out.
    bool sendDisconnect = false;
};

// Owns the poll thread. Everything the thread touches is held by
// shared_ptr so a thread stuck in the transport can be detached on Stop.
class ExchangePoller : public std::enable_shared_from_this<ExchangePoller> {
public:
    ExchangePoller(
        std::shared_ptr<ClientCallbacks> callbacks,
        std::shared_ptr<HttpTransport> transport,
        std::shared_ptr<MessageCodec> codec,
        std::shared_ptr<ReportAccumulator> accumulator,
        std::shared_ptr<PollTrigger> trigger,
        std::chrono::milliseconds pollInterval,
        RetryPolicy retryPolicy);
    ~ExchangePoller();

    bool Start(std::string& error);

    // Returns false when the thread had to be detached.
    bool Stop(const StopPolicy& policy);

    // Returns false, keeping the current interval, outside (0, 24h].
    bool SetPollInterval(std::chrono::milliseconds interval);
    std::chrono::milliseconds PollInterval() const;

    CycleState State() const;
    uint64_t IgnoredDirectiveCount() const;
    std::string LastRemoteConfigHash() const;

private:
    struct AttemptResult {
        bool delivered = false;
        // Retrying cannot help (the message does not encode).
        bool abandon = false;
        bool resendRequested = false;
        std::optional<std::chrono::milliseconds> retryAfter;
    };

    void Run();
    bool RunCycle();
    AttemptResult Attempt(const OutboundSnapshot& snapshot, int attempt);
    void SendDisconnect();
    void ReportFailure(const ExchangeError& error);
    bool WaitFinished(std::chrono::milliseconds timeout);

    std::shared_ptr<ClientCallbacks> callbacks_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<MessageCodec> codec_;
    std::shared_ptr<ReportAccumulator> accumulator_;
    std::shared_ptr<PollTrigger> trigger_;
    ReplyDispatcher dispatcher_;
    RetryBackoff backoff_;

    std::atomic<long long> pollIntervalMs_;
    std::atomic<CycleState> state_{CycleState::Idle};
    std::atomic<bool> running_{false};
    std::atomic<bool> sendDisconnect_{false};
    std::thread worker_;

    std::mutex finishedMutex_;
    std::condition_variable finishedCv_;
    bool finished_ = false;
};
