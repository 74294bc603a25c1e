#include "ReplyDispatcher.hpp"
#include "RetryBackoff.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace {
constexpr uint64_t kKnownServerFlags = kServerToAgentFlagReportFullState;
constexpr uint64_t kMaxHeartbeatSeconds = std::chrono::duration_cast<std::chrono::seconds>(kMaxPollInterval).count();
} // namespace

ReplyDispatcher::ReplyDispatcher(
    ClientCallbacks& callbacks,
    ReportAccumulator& accumulator,
    HttpTransport& transport,
    IntervalSetter setInterval)
    : callbacks_(callbacks),
      accumulator_(accumulator),
      transport_(transport),
      setInterval_(std::move(setInterval)) {}

DispatchResult ReplyDispatcher::Dispatch(const ServerToAgent& message) {
    DispatchResult result;
    const auto& capabilities = accumulator_.GetCapabilities();

    // A command excludes every other directive in the same message.
    if (message.command) {
        if (capabilities.Has(AgentCapability::AcceptsRestartCommand)) {
            std::cout << "[OpAMP] Command received: " << ToString(message.command->type) << std::endl;
            InvokeCallback("OnCommand", [&] { callbacks_.OnCommand(*message.command); });
        } else {
            Ignore("command (AcceptsRestartCommand not declared)");
        }
        return result;
    }

    if (message.unknownFieldCount > 0) {
        ignored_ += static_cast<uint64_t>(message.unknownFieldCount);
        std::cerr << "[OpAMP] Reply carried " << message.unknownFieldCount << " unrecognised field(s)" << std::endl;
    }

    if (message.errorResponse) {
        const auto& error = *message.errorResponse;
        std::cerr << "[OpAMP] Server error (" << ToString(error.type) << "): " << error.errorMessage << std::endl;
        InvokeCallback("OnError", [&] { callbacks_.OnError(error); });
        if (error.type == ServerErrorType::Unavailable) {
            result.failed = true;
            if (error.retryAfterNanoseconds) {
                result.retryAfter = RetryHintFromNanoseconds(*error.retryAfterNanoseconds);
            }
            return result;
        }
    }

    if (message.newInstanceUid) {
        HandleIdentification(*message.newInstanceUid);
    }

    if ((message.flags & kServerToAgentFlagReportFullState) != 0) {
        HandleFullState();
        result.resendRequested = true;
    }
    if ((message.flags & ~kKnownServerFlags) != 0) {
        Ignore("unknown server flags " + std::to_string(message.flags & ~kKnownServerFlags));
    }

    if (message.remoteConfig) {
        if (capabilities.Has(AgentCapability::AcceptsRemoteConfig)) {
            {
                std::lock_guard<std::mutex> lock(hashMutex_);
                lastRemoteConfigHash_ = message.remoteConfig->configHash;
            }
            InvokeCallback("OnRemoteConfig", [&] { callbacks_.OnRemoteConfig(*message.remoteConfig); });
        } else {
            Ignore("remote config (AcceptsRemoteConfig not declared)");
        }
    }

    if (message.connectionSettings) {
        HandleConnectionSettings(*message.connectionSettings);
    }

    if (message.packagesAvailable) {
        if (capabilities.Has(AgentCapability::AcceptsPackages)) {
            InvokeCallback("OnPackagesAvailable", [&] { callbacks_.OnPackagesAvailable(*message.packagesAvailable); });
        } else {
            Ignore("packages available (AcceptsPackages not declared)");
        }
    }

    if (message.customCapabilities) {
        InvokeCallback("OnCustomCapabilities", [&] { callbacks_.OnCustomCapabilities(*message.customCapabilities); });
    }

    if (message.customMessage) {
        const auto declared = accumulator_.CurrentCustomCapabilities();
        const bool supported = declared
            && std::find(
                   declared->capabilities.begin(), declared->capabilities.end(), message.customMessage->capability)
                != declared->capabilities.end();
        if (supported) {
            InvokeCallback("OnCustomMessage", [&] { callbacks_.OnCustomMessage(*message.customMessage); });
        } else {
            Ignore("custom message for undeclared capability '" + message.customMessage->capability + "'");
        }
    }

    return result;
}

uint64_t ReplyDispatcher::IgnoredDirectiveCount() const {
    return ignored_.load();
}

std::string ReplyDispatcher::LastRemoteConfigHash() const {
    std::lock_guard<std::mutex> lock(hashMutex_);
    return lastRemoteConfigHash_;
}

void ReplyDispatcher::HandleConnectionSettings(const ConnectionSettingsOffers& offers) {
    const auto& capabilities = accumulator_.GetCapabilities();

    if (offers.opamp) {
        if (capabilities.Has(AgentCapability::AcceptsOpAmpConnectionSettings)) {
            bool accepted = false;
            InvokeCallback("OnOpampConnectionSettings", [&] {
                accepted = callbacks_.OnOpampConnectionSettings(*offers.opamp);
            });
            if (accepted && !transport_.Reconfigure(*offers.opamp)) {
                std::cerr << "[OpAMP] Transport rejected connection settings for "
                          << offers.opamp->destinationEndpoint << std::endl;
                accepted = false;
            }
            if (accepted) {
                const uint64_t heartbeat = offers.opamp->heartbeatIntervalSeconds;
                if (heartbeat > kMaxHeartbeatSeconds) {
                    Ignore("heartbeat interval of " + std::to_string(heartbeat) + "s (above 24h)");
                } else if (heartbeat > 0 && !setInterval_(std::chrono::seconds(static_cast<long long>(heartbeat)))) {
                    Ignore("heartbeat interval of " + std::to_string(heartbeat) + "s");
                }
                InvokeCallback("OnOpampConnectionSettingsAccepted", [&] {
                    callbacks_.OnOpampConnectionSettingsAccepted(*offers.opamp);
                });
            }
        } else {
            Ignore("OpAMP connection settings (AcceptsOpAmpConnectionSettings not declared)");
        }
    }

    ConnectionSettingsOffers forwarded;
    forwarded.hash = offers.hash;
    bool any = false;

    const auto take = [&](const std::optional<TelemetryConnectionSettings>& offer,
                          std::optional<TelemetryConnectionSettings>& target,
                          AgentCapability capability,
                          const char* name) {
        if (!offer) {
            return;
        }
        if (!capabilities.Has(capability)) {
            Ignore(std::string(name) + " settings (" + Capabilities::Name(capability) + " not declared)");
            return;
        }
        target = offer;
        any = true;
    };
    take(offers.ownMetrics, forwarded.ownMetrics, AgentCapability::ReportsOwnMetrics, "own metrics");
    take(offers.ownTraces, forwarded.ownTraces, AgentCapability::ReportsOwnTraces, "own traces");
    take(offers.ownLogs, forwarded.ownLogs, AgentCapability::ReportsOwnLogs, "own logs");

    if (!offers.otherConnections.empty()) {
        if (capabilities.Has(AgentCapability::AcceptsOtherConnectionSettings)) {
            forwarded.otherConnections = offers.otherConnections;
            any = true;
        } else {
            Ignore("other connection settings (AcceptsOtherConnectionSettings not declared)");
        }
    }

    if (any) {
        InvokeCallback("OnConnectionSettings", [&] { callbacks_.OnConnectionSettings(forwarded); });
    }
}

void ReplyDispatcher::HandleIdentification(const std::string& newUid) {
    InstanceUid uid;
    if (!InstanceUid::FromBytes(newUid, uid) || uid.IsNil()) {
        Ignore("agent identification with invalid instance uid (" + std::to_string(newUid.size()) + " bytes)");
        return;
    }

    std::cout << "[OpAMP] Server assigned instance uid " << uid.ToString() << std::endl;
    accumulator_.SetInstanceUid(uid);
    InvokeCallback("OnAgentIdentification", [&] { callbacks_.OnAgentIdentification(uid); });
}

void ReplyDispatcher::HandleFullState() {
    std::optional<EffectiveConfig> effective;
    if (accumulator_.GetCapabilities().Has(AgentCapability::ReportsEffectiveConfig)) {
        InvokeCallback("GetEffectiveConfig", [&] { effective = callbacks_.GetEffectiveConfig(); });
    }

    std::cout << "[OpAMP] Server requested full state" << std::endl;
    accumulator_.MarkFullState(effective);
}

void ReplyDispatcher::Ignore(const std::string& what) {
    ++ignored_;
    std::cerr << "[OpAMP] Ignoring " << what << std::endl;
}
