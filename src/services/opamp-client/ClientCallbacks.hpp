#pragma once

#include "InstanceUid.hpp"
#include "Messages.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <string>

enum class ExchangeErrorKind {
    Transport,
    HttpStatus,
    Encode,
    Decode
};

const char* ToString(ExchangeErrorKind kind);

struct ExchangeError {
    ExchangeErrorKind kind = ExchangeErrorKind::Transport;
    std::string message;
    long statusCode = 0;
};

// Application hooks. Every method is invoked on the poll thread and must
// not block for long; the defaults do nothing.
class ClientCallbacks {
public:
    virtual ~ClientCallbacks() = default;

    // An exchange completed and the reply decoded.
    virtual void OnConnect() {}
    virtual void OnConnectFailed(const ExchangeError& error) {}
    virtual void OnError(const ServerErrorResponse& error) {}

    // The application is expected to report back with SetRemoteConfigStatus.
    virtual void OnRemoteConfig(const AgentRemoteConfig& config) {}

    // Return false to reject the offer; the current connection is kept.
    virtual bool OnOpampConnectionSettings(const OpampConnectionSettings& settings) { return true; }
    virtual void OnOpampConnectionSettingsAccepted(const OpampConnectionSettings& settings) {}
    // Telemetry and other connection offers the agent advertised support for.
    virtual void OnConnectionSettings(const ConnectionSettingsOffers& offers) {}

    virtual void OnPackagesAvailable(const PackagesAvailable& packages) {}
    virtual void OnCommand(const ServerToAgentCommand& command) {}
    virtual void OnAgentIdentification(const InstanceUid& newUid) {}
    virtual void OnCustomCapabilities(const CustomCapabilities& capabilities) {}
    virtual void OnCustomMessage(const CustomMessage& message) {}

    // Queried when the server asks for the full state and by
    // OpampClient::UpdateEffectiveConfig.
    virtual std::optional<EffectiveConfig> GetEffectiveConfig() { return std::nullopt; }
};

// Runs one application hook on the poll thread. An exception escaping the
// hook is logged and the exchange carries on.
template <typename Fn>
void InvokeCallback(const char* name, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& ex) {
        std::cerr << "[OpAMP] callback " << name << " threw: " << ex.what() << std::endl;
    }
}
