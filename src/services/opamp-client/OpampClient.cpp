#include "OpampClient.hpp"
#include "ReportValidation.hpp"

#include <iostream>
#include <utility>

bool ValidateStartSettings(const StartSettings& settings, std::string& error) {
    if (!ValidateAgentDescription(settings.agentDescription, error)) {
        return false;
    }

    InstanceUid uid;
    if (!settings.instanceUid.empty() && !InstanceUid::Parse(settings.instanceUid, uid)) {
        error = "instance uid '" + settings.instanceUid + "' is not 16 bytes of hex";
        return false;
    }
    if (!settings.instanceUid.empty() && uid.IsNil()) {
        error = "instance uid must not be nil";
        return false;
    }

    if (settings.pollInterval.count() <= 0) {
        error = "poll interval must be positive";
        return false;
    }
    if (settings.pollInterval > kMaxPollInterval) {
        error = "poll interval must not exceed 24h";
        return false;
    }

    if (!ValidateRetryPolicy(settings.retryPolicy, error)) {
        return false;
    }
    if (settings.stopPolicy.gracePeriod.count() < 0 || settings.stopPolicy.cancelWait.count() < 0) {
        error = "stop policy waits must not be negative";
        return false;
    }

    if (settings.initialHealth && !ValidateHealth(*settings.initialHealth, error)) {
        return false;
    }
    if (settings.customCapabilities && !ValidateCustomCapabilities(*settings.customCapabilities, error)) {
        return false;
    }
    return true;
}

OpampClient::OpampClient(std::unique_ptr<HttpTransport> transport, std::unique_ptr<MessageCodec> codec)
    : transport_(std::move(transport)),
      codec_(std::move(codec)) {}

OpampClient::~OpampClient() {
    if (session_.Current() != SessionState::Started) {
        return;
    }
    const ClientResult stopped = Stop();
    if (!stopped) {
        std::cerr << "[OpAMP] Stop on destruction failed: " << stopped.message << std::endl;
    }
}

ClientResult OpampClient::Start(std::shared_ptr<ClientCallbacks> callbacks, const StartSettings& settings) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);

    const ClientErrorCode allowed = CheckTransition(session_.Current(), SessionState::Started);
    if (allowed != ClientErrorCode::Ok) {
        return ClientResult::Failure(
            allowed, std::string("client cannot start from ") + ToString(session_.Current()));
    }

    if (!callbacks) {
        return ClientResult::Failure(ClientErrorCode::InvalidConfiguration, "callbacks are required");
    }
    if (!transport_ || !codec_) {
        return ClientResult::Failure(ClientErrorCode::InvalidConfiguration, "transport and codec are required");
    }

    std::string error;
    if (!ValidateStartSettings(settings, error)) {
        return ClientResult::Failure(ClientErrorCode::InvalidConfiguration, error);
    }

    InstanceUid uid;
    if (settings.instanceUid.empty()) {
        uid = InstanceUid::Generate();
    } else if (!InstanceUid::Parse(settings.instanceUid, uid)) {
        return ClientResult::Failure(ClientErrorCode::InvalidConfiguration, "invalid instance uid");
    }

    Capabilities capabilities = settings.capabilities;
    capabilities.Add(AgentCapability::ReportsStatus);

    auto trigger = std::make_shared<PollTrigger>();
    auto accumulator = std::make_shared<ReportAccumulator>(capabilities, uid, [trigger] { trigger->RequestSend(); });

    // The first message carries everything the agent starts with.
    ClientResult seeded = accumulator->SetAgentDescription(settings.agentDescription);
    if (seeded && settings.initialHealth) {
        seeded = accumulator->SetHealth(*settings.initialHealth);
    }
    if (seeded && settings.customCapabilities) {
        seeded = accumulator->SetCustomCapabilities(*settings.customCapabilities);
    }
    if (!seeded) {
        return ClientResult::Failure(ClientErrorCode::InvalidConfiguration, seeded.message);
    }

    auto poller = std::make_shared<ExchangePoller>(
        callbacks, transport_, codec_, accumulator, trigger, settings.pollInterval, settings.retryPolicy);
    if (!poller->Start(error)) {
        std::cerr << "[OpAMP] " << error << std::endl;
        return ClientResult::Failure(ClientErrorCode::StartFailed, error);
    }

    callbacks_ = std::move(callbacks);
    trigger_ = std::move(trigger);
    accumulator_ = std::move(accumulator);
    poller_ = std::move(poller);
    stopPolicy_ = settings.stopPolicy;

    const ClientResult started = session_.TransitionTo(SessionState::Started);
    trigger_->RequestSend();

    std::cout << "[OpAMP] Client started. Instance " << uid.ToString()
              << ", capabilities " << capabilities.ToString()
              << ", poll interval " << settings.pollInterval.count() << "ms" << std::endl;
    return started;
}

ClientResult OpampClient::Stop() {
    std::shared_ptr<ExchangePoller> poller;
    StopPolicy policy;
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        const ClientResult stopping = session_.TransitionTo(SessionState::Stopping);
        if (!stopping) {
            return stopping;
        }
        poller = poller_;
        policy = stopPolicy_;
    }

    const bool joined = poller->Stop(policy);

    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    const ClientResult stopped = session_.TransitionTo(SessionState::Stopped);
    std::cout << "[OpAMP] Client stopped" << (joined ? "." : " (poll thread detached).") << std::endl;
    return stopped;
}

template <typename Fn>
ClientResult OpampClient::WhileStarted(Fn&& fn) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    const SessionState current = session_.Current();
    if (current != SessionState::Started) {
        return ClientResult::Failure(ClientErrorCode::NotRunning, std::string("client is ") + ToString(current));
    }
    return fn();
}

ClientResult OpampClient::SetAgentDescription(const AgentDescription& description) {
    return WhileStarted([&] { return accumulator_->SetAgentDescription(description); });
}

ClientResult OpampClient::SetHealth(const ComponentHealth& health) {
    return WhileStarted([&] { return accumulator_->SetHealth(health); });
}

ClientResult OpampClient::SetRemoteConfigStatus(const RemoteConfigStatus& status) {
    return WhileStarted([&] { return accumulator_->SetRemoteConfigStatus(status); });
}

ClientResult OpampClient::SetEffectiveConfig(const EffectiveConfig& config) {
    return WhileStarted([&] { return accumulator_->SetEffectiveConfig(config); });
}

ClientResult OpampClient::UpdateEffectiveConfig() {
    std::shared_ptr<ClientCallbacks> callbacks;
    {
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (session_.Current() != SessionState::Started) {
            return ClientResult::Failure(
                ClientErrorCode::NotRunning, std::string("client is ") + ToString(session_.Current()));
        }
        if (!accumulator_->GetCapabilities().Has(AgentCapability::ReportsEffectiveConfig)) {
            return ClientResult::Failure(
                ClientErrorCode::MissingCapability, "capability ReportsEffectiveConfig was not declared at start");
        }
        callbacks = callbacks_;
    }

    // The hook runs outside the lifecycle lock; it may take its time.
    const std::optional<EffectiveConfig> config = callbacks->GetEffectiveConfig();
    if (!config) {
        return ClientResult::Failure(ClientErrorCode::InvalidArgument, "GetEffectiveConfig returned no config");
    }
    return SetEffectiveConfig(*config);
}

ClientResult OpampClient::SetPackageStatuses(const PackageStatuses& statuses) {
    return WhileStarted([&] { return accumulator_->SetPackageStatuses(statuses); });
}

ClientResult OpampClient::SetCustomCapabilities(const CustomCapabilities& capabilities) {
    return WhileStarted([&] { return accumulator_->SetCustomCapabilities(capabilities); });
}

ClientResult OpampClient::SendCustomMessage(const CustomMessage& message) {
    return WhileStarted([&] { return accumulator_->QueueCustomMessage(message); });
}

ClientResult OpampClient::RequestInstanceUid() {
    return WhileStarted([&] {
        accumulator_->RequestInstanceUid();
        return ClientResult::Success();
    });
}

ClientResult OpampClient::SetPollInterval(std::chrono::milliseconds interval) {
    if (interval.count() <= 0 || interval > kMaxPollInterval) {
        return ClientResult::Failure(ClientErrorCode::InvalidArgument, "poll interval must be in (0, 24h]");
    }
    return WhileStarted([&] {
        if (!poller_->SetPollInterval(interval)) {
            return ClientResult::Failure(ClientErrorCode::InvalidArgument, "poll interval must be in (0, 24h]");
        }
        return ClientResult::Success();
    });
}

SessionState OpampClient::State() const {
    return session_.Current();
}

InstanceUid OpampClient::GetInstanceUid() const {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return accumulator_ ? accumulator_->CurrentInstanceUid() : InstanceUid();
}

uint64_t OpampClient::IgnoredDirectiveCount() const {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return poller_ ? poller_->IgnoredDirectiveCount() : 0;
}

std::string OpampClient::LastRemoteConfigHash() const {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return poller_ ? poller_->LastRemoteConfigHash() : std::string();
}
