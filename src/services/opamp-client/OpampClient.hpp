#pragma once

#include "Capabilities.hpp"
#include "ClientCallbacks.hpp"
#include "ClientResult.hpp"
#include "ExchangePoller.hpp"
#include "HttpTransport.hpp"
#include "InstanceUid.hpp"
#include "MessageCodec.hpp"
#include "Messages.hpp"
#include "PollTrigger.hpp"
#include "ReportAccumulator.hpp"
#include "RetryBackoff.hpp"
#include "SessionState.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct StartSettings {
    AgentDescription agentDescription;
    // ReportsStatus is always added.
    Capabilities capabilities{AgentCapability::ReportsStatus};
    // Hex text; a UUIDv7 is generated when empty.
    std::string instanceUid;
    std::chrono::milliseconds pollInterval{std::chrono::seconds(30)};
    RetryPolicy retryPolicy;
    StopPolicy stopPolicy;
    std::optional<ComponentHealth> initialHealth;
    std::optional<CustomCapabilities> customCapabilities;
};

bool ValidateStartSettings(const StartSettings& settings, std::string& error);

// Agent-side OpAMP session: NotStarted -> Started -> Stopping -> Stopped.
// A stopped client cannot be restarted; build a new one.
class OpampClient {
public:
    OpampClient(std::unique_ptr<HttpTransport> transport, std::unique_ptr<MessageCodec> codec);
    ~OpampClient();

    OpampClient(const OpampClient&) = delete;
    OpampClient& operator=(const OpampClient&) = delete;

    ClientResult Start(std::shared_ptr<ClientCallbacks> callbacks, const StartSettings& settings);
    ClientResult Stop();

    ClientResult SetAgentDescription(const AgentDescription& description);
    ClientResult SetHealth(const ComponentHealth& health);
    ClientResult SetRemoteConfigStatus(const RemoteConfigStatus& status);
    ClientResult SetEffectiveConfig(const EffectiveConfig& config);
    // Pulls the current effective config from ClientCallbacks::GetEffectiveConfig.
    ClientResult UpdateEffectiveConfig();
    ClientResult SetPackageStatuses(const PackageStatuses& statuses);
    ClientResult SetCustomCapabilities(const CustomCapabilities& capabilities);
    ClientResult SendCustomMessage(const CustomMessage& message);
    ClientResult RequestInstanceUid();
    ClientResult SetPollInterval(std::chrono::milliseconds interval);

    SessionState State() const;
    InstanceUid GetInstanceUid() const;
    uint64_t IgnoredDirectiveCount() const;
    std::string LastRemoteConfigHash() const;

private:
    // Runs `fn` against the accumulator only while Started.
    template <typename Fn>
    ClientResult WhileStarted(Fn&& fn);

    SessionStateMachine session_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<MessageCodec> codec_;

    // Setters hold it across the state check and the forward, so none
    // lands after Stop has moved the session to Stopping.
    mutable std::mutex lifecycleMutex_;
    std::shared_ptr<ClientCallbacks> callbacks_;
    std::shared_ptr<PollTrigger> trigger_;
    std::shared_ptr<ReportAccumulator> accumulator_;
    std::shared_ptr<ExchangePoller> poller_;
    StopPolicy stopPolicy_;
};
