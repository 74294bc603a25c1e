#include "ExchangePoller.hpp"
#include "Tracing.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <system_error>
#include <utility>

namespace {
void LogRetry(int attempt, int maxAttempts, std::chrono::milliseconds delay) {
    std::cerr << "[OpAMP] Exchange failed (Attempt " << attempt << "/";
    if (maxAttempts > 0) {
        std::cerr << maxAttempts;
    } else {
        std::cerr << "unlimited";
    }
    std::cerr << "). Retrying in " << delay.count() << "ms..." << std::endl;
}

std::optional<std::chrono::milliseconds> RetryAfterHeader(const HttpHeaders& headers) {
    for (const auto& [key, value] : headers) {
        std::string lowered = key;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "retry-after") {
            return ParseRetryAfter(value);
        }
    }
    return std::nullopt;
}

std::string UidText(const std::string& bytes) {
    InstanceUid uid;
    return InstanceUid::FromBytes(bytes, uid) ? uid.ToString() : std::string();
}
} // namespace

const char* ToString(CycleState state) {
    switch (state) {
        case CycleState::Idle: return "idle";
        case CycleState::Sending: return "sending";
        case CycleState::AwaitingReply: return "awaiting-reply";
        case CycleState::Applying: return "applying";
    }
    return "unknown";
}

ExchangePoller::ExchangePoller(
    std::shared_ptr<ClientCallbacks> callbacks,
    std::shared_ptr<HttpTransport> transport,
    std::shared_ptr<MessageCodec> codec,
    std::shared_ptr<ReportAccumulator> accumulator,
    std::shared_ptr<PollTrigger> trigger,
    std::chrono::milliseconds pollInterval,
    RetryPolicy retryPolicy)
    : callbacks_(std::move(callbacks)),
      transport_(std::move(transport)),
      codec_(std::move(codec)),
      accumulator_(std::move(accumulator)),
      trigger_(std::move(trigger)),
      dispatcher_(*callbacks_, *accumulator_, *transport_, [this](std::chrono::seconds interval) {
          return SetPollInterval(interval);
      }),
      backoff_(retryPolicy),
      pollIntervalMs_(pollInterval.count()) {}

ExchangePoller::~ExchangePoller() {
    if (!worker_.joinable()) {
        return;
    }
    // The last reference may be dropped by the poll thread itself.
    if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
        return;
    }
    trigger_->RequestStop();
    worker_.join();
}

bool ExchangePoller::Start(std::string& error) {
    if (running_.exchange(true)) {
        error = "poller already running";
        return false;
    }

    try {
        worker_ = std::thread([self = shared_from_this()] { self->Run(); });
    } catch (const std::system_error& ex) {
        running_ = false;
        error = std::string("failed to spawn poll thread: ") + ex.what();
        return false;
    }
    return true;
}

bool ExchangePoller::Stop(const StopPolicy& policy) {
    if (!running_.exchange(false)) {
        return true;
    }

    sendDisconnect_ = policy.sendDisconnect;
    trigger_->RequestStop();

    if (!WaitFinished(policy.gracePeriod)) {
        std::cerr << "[OpAMP] Exchange still " << ToString(state_.load()) << " after "
                  << policy.gracePeriod.count() << "ms; cancelling" << std::endl;
        // A forced stop skips the disconnect message.
        sendDisconnect_ = false;
        transport_->Cancel();

        if (!WaitFinished(policy.cancelWait)) {
            std::cerr << "[OpAMP] Transport did not honour cancel; detaching poll thread" << std::endl;
            worker_.detach();
            return false;
        }
    }

    if (worker_.joinable()) {
        worker_.join();
    }
    return true;
}

bool ExchangePoller::SetPollInterval(std::chrono::milliseconds interval) {
    if (interval.count() <= 0 || interval > kMaxPollInterval) {
        std::cerr << "[OpAMP] Ignoring poll interval of " << interval.count() << "ms; it must be in (0, 24h]"
                  << std::endl;
        return false;
    }
    if (pollIntervalMs_.exchange(interval.count()) == interval.count()) {
        return true;
    }
    std::cout << "[OpAMP] Poll interval set to " << interval.count() << "ms" << std::endl;
    trigger_->Reschedule();
    return true;
}

std::chrono::milliseconds ExchangePoller::PollInterval() const {
    return std::chrono::milliseconds(pollIntervalMs_.load());
}

CycleState ExchangePoller::State() const {
    return state_.load();
}

uint64_t ExchangePoller::IgnoredDirectiveCount() const {
    return dispatcher_.IgnoredDirectiveCount();
}

std::string ExchangePoller::LastRemoteConfigHash() const {
    return dispatcher_.LastRemoteConfigHash();
}

void ExchangePoller::Run() {
    auto lastCycle = PollTrigger::Clock::now();

    while (true) {
        const PollEvent event = trigger_->WaitUntil(lastCycle + PollInterval());
        if (event == PollEvent::Stop) {
            break;
        }
        if (event == PollEvent::Reschedule) {
            continue;
        }
        if (event == PollEvent::SendNow && !accumulator_->HasDirtyFields()) {
            // The change already went out with the previous exchange.
            continue;
        }

        const bool resend = RunCycle();
        lastCycle = PollTrigger::Clock::now();
        if (trigger_->StopRequested()) {
            break;
        }
        if (resend) {
            trigger_->RequestSend();
        }
    }

    if (sendDisconnect_) {
        SendDisconnect();
    }

    state_ = CycleState::Idle;
    {
        std::lock_guard<std::mutex> lock(finishedMutex_);
        finished_ = true;
    }
    finishedCv_.notify_all();
}

bool ExchangePoller::RunCycle() {
    const OutboundSnapshot snapshot = accumulator_->Snapshot();
    const int maxAttempts = backoff_.Policy().maxAttempts;

    for (int attempt = 0;; ++attempt) {
        const AttemptResult result = Attempt(snapshot, attempt);
        if (result.delivered) {
            backoff_.Reset();
            accumulator_->Acknowledge(snapshot);
            return result.resendRequested;
        }

        if (result.abandon || trigger_->StopRequested()) {
            return false;
        }
        if (maxAttempts > 0 && attempt + 1 >= maxAttempts) {
            std::cerr << "[OpAMP] Giving up on message after " << maxAttempts
                      << " attempts; pending fields stay queued for the next cycle" << std::endl;
            return false;
        }

        const auto delay = result.retryAfter ? backoff_.NextDelay(*result.retryAfter) : backoff_.NextDelay();
        LogRetry(attempt + 1, maxAttempts, delay);
        if (!trigger_->SleepFor(delay)) {
            return false;
        }
    }
}

ExchangePoller::AttemptResult ExchangePoller::Attempt(const OutboundSnapshot& snapshot, int attempt) {
    AttemptResult result;
    state_ = CycleState::Sending;

    AgentToServer message = snapshot.message;
    const uint64_t sequence = accumulator_->Stamp(message);

    std::string body;
    std::string error;
    if (!codec_->Encode(message, body, error)) {
        state_ = CycleState::Idle;
        ReportFailure(ExchangeError{ExchangeErrorKind::Encode, error, 0});
        result.abandon = true;
        return result;
    }

    ExchangeAttributes attributes;
    attributes.sequenceNum = sequence;
    attributes.attempt = attempt + 1;
    attributes.heartbeat = snapshot.IsHeartbeat();
    attributes.instanceUid = UidText(message.instanceUid);
    attributes.bodyBytes = body.size();
    ExchangeSpan span = Tracer::Instance().StartExchange(attributes);

    HttpHeaders headers{{"Content-Type", codec_->ContentType()}, {"traceparent", span.TraceParent()}};

    state_ = CycleState::AwaitingReply;
    const TransportResponse response = transport_->Post(body, headers);
    span.RecordHttpStatus(response.statusCode);

    if (!response.RequestOk()) {
        span.Finish(false, ToString(response.error));
        state_ = CycleState::Idle;
        ReportFailure(ExchangeError{
            ExchangeErrorKind::Transport,
            std::string(ToString(response.error)) + ": " + response.errorMessage,
            0});
        return result;
    }

    if (!response.StatusOk()) {
        span.Finish(false, std::to_string(response.statusCode));
        state_ = CycleState::Idle;
        if (response.statusCode == 429 || response.statusCode == 503) {
            result.retryAfter = RetryAfterHeader(response.headers);
        }
        ReportFailure(ExchangeError{
            ExchangeErrorKind::HttpStatus,
            "HTTP " + std::to_string(response.statusCode),
            response.statusCode});
        return result;
    }

    state_ = CycleState::Applying;
    ServerToAgent reply;
    if (!codec_->Decode(response.body, reply, error)) {
        span.Finish(false, ToString(ExchangeErrorKind::Decode));
        state_ = CycleState::Idle;
        ReportFailure(ExchangeError{ExchangeErrorKind::Decode, error, response.statusCode});
        return result;
    }

    const DispatchResult dispatched = dispatcher_.Dispatch(reply);
    state_ = CycleState::Idle;

    if (dispatched.failed) {
        span.Finish(false, "server_unavailable");
        result.retryAfter = dispatched.retryAfter;
        return result;
    }

    span.Finish(true);
    InvokeCallback("OnConnect", [this] { callbacks_->OnConnect(); });
    result.delivered = true;
    result.resendRequested = dispatched.resendRequested;
    return result;
}

void ExchangePoller::SendDisconnect() {
    AgentToServer message;
    message.agentDisconnect = true;
    const uint64_t sequence = accumulator_->Stamp(message);

    std::string body;
    std::string error;
    if (!codec_->Encode(message, body, error)) {
        std::cerr << "[OpAMP] Failed to encode disconnect: " << error << std::endl;
        return;
    }

    ExchangeAttributes attributes;
    attributes.kind = ExchangeKind::Disconnect;
    attributes.sequenceNum = sequence;
    attributes.instanceUid = UidText(message.instanceUid);
    attributes.bodyBytes = body.size();
    ExchangeSpan span = Tracer::Instance().StartExchange(attributes);
    HttpHeaders headers{{"Content-Type", codec_->ContentType()}, {"traceparent", span.TraceParent()}};

    state_ = CycleState::AwaitingReply;
    const TransportResponse response = transport_->Post(body, headers);
    const bool ok = response.RequestOk() && response.StatusOk();
    span.RecordHttpStatus(response.statusCode);
    span.Finish(ok, ok ? std::string() : std::string(ToString(response.error)));

    if (ok) {
        std::cout << "[OpAMP] Disconnect sent." << std::endl;
    } else {
        std::cerr << "[OpAMP] Disconnect failed: "
                  << (response.RequestOk() ? "HTTP " + std::to_string(response.statusCode) : response.errorMessage)
                  << std::endl;
    }
}

void ExchangePoller::ReportFailure(const ExchangeError& error) {
    std::cerr << "[OpAMP] Exchange failed (" << ToString(error.kind) << "): " << error.message << std::endl;
    InvokeCallback("OnConnectFailed", [&] { callbacks_->OnConnectFailed(error); });
}

bool ExchangePoller::WaitFinished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(finishedMutex_);
    return finishedCv_.wait_for(lock, timeout, [this] { return finished_; });
}
