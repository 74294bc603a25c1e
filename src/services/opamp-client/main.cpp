#include "ClientConfig.hpp"
#include "CprHttpTransport.hpp"
#include "HostSampler.hpp"
#include "MessageCodec.hpp"
#include "OpampClient.hpp"
#include "Tracing.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace {
constexpr const char* kServiceName = "opamp-agent";
constexpr const char* kServiceVersion = "0.1.0";
constexpr auto kHealthInterval = std::chrono::seconds(15);

std::atomic<bool> stopRequested{false};

void HandleSignal(int) {
    stopRequested = true;
}

// Accepts every remote config as-is and echoes it back as the effective one.
class AgentCallbacks : public ClientCallbacks {
public:
    void Attach(OpampClient* client) {
        client_ = client;
    }

    void OnConnect() override {
        if (!connected_.exchange(true)) {
            std::cout << "[Agent] Connected to OpAMP server." << std::endl;
        }
    }

    void OnConnectFailed(const ExchangeError& error) override {
        connected_ = false;
        std::cerr << "[Agent] Server unreachable: " << error.message << std::endl;
    }

    void OnError(const ServerErrorResponse& error) override {
        std::cerr << "[Agent] Server reported " << ToString(error.type) << ": " << error.errorMessage << std::endl;
    }

    void OnRemoteConfig(const AgentRemoteConfig& config) override {
        std::cout << "[Agent] Remote config received with " << config.config.configMap.size() << " file(s)."
                  << std::endl;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            effective_.configMap = config.config;
        }

        RemoteConfigStatus status;
        status.lastRemoteConfigHash = config.configHash;
        status.status = config.configHash.empty() ? RemoteConfigState::Failed : RemoteConfigState::Applied;
        if (config.configHash.empty()) {
            status.errorMessage = "remote config carried no hash";
        }

        const ClientResult reported = client_->SetRemoteConfigStatus(status);
        if (!reported) {
            std::cerr << "[Agent] Failed to report config status: " << reported.message << std::endl;
            return;
        }
        const ClientResult updated = client_->UpdateEffectiveConfig();
        if (!updated) {
            std::cerr << "[Agent] Failed to report effective config: " << updated.message << std::endl;
        }
    }

    void OnCommand(const ServerToAgentCommand& command) override {
        std::cout << "[Agent] Command " << ToString(command.type) << " received; shutting down for restart."
                  << std::endl;
        stopRequested = true;
    }

    void OnAgentIdentification(const InstanceUid& newUid) override {
        std::cout << "[Agent] Instance uid is now " << newUid.ToString() << std::endl;
    }

    std::optional<EffectiveConfig> GetEffectiveConfig() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return effective_;
    }

private:
    OpampClient* client_ = nullptr;
    std::atomic<bool> connected_{false};
    std::mutex mutex_;
    EffectiveConfig effective_;
};
} // namespace

int main() {
    std::cout << "OpAMP Agent Starting..." << std::endl;

    ClientConfig config;
    std::string error;
    if (!LoadClientConfigFromEnv(config, error)) {
        std::cerr << "[Agent] " << error << std::endl;
        return 1;
    }

    if (config.tls.enabled && !WaitForTlsFiles(config.tls, 30)) {
        std::cerr << "[Agent] mTLS enabled but certificate files are missing." << std::endl;
        return 1;
    }

    Tracer::Instance().Configure(config.trace);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    auto codec = MakeCodec(config.codec);
    auto transport = std::make_unique<CprHttpTransport>(ToTransportSettings(config));
    OpampClient client(std::move(transport), std::move(codec));

    auto callbacks = std::make_shared<AgentCallbacks>();
    callbacks->Attach(&client);

    HostSampler sampler;
    const uint64_t startTime = NowUnixNano();

    StartSettings settings;
    settings.agentDescription = sampler.Describe(kServiceName, kServiceVersion);
    settings.capabilities = Capabilities{
        AgentCapability::ReportsStatus,
        AgentCapability::AcceptsRemoteConfig,
        AgentCapability::ReportsRemoteConfig,
        AgentCapability::ReportsEffectiveConfig,
        AgentCapability::ReportsHealth,
        AgentCapability::AcceptsRestartCommand,
        AgentCapability::AcceptsOpAmpConnectionSettings,
        AgentCapability::ReportsHeartbeat};
    settings.instanceUid = config.instanceUid;
    settings.pollInterval = config.pollInterval;
    settings.initialHealth = sampler.SampleHealth(startTime);
    settings.stopPolicy.sendDisconnect = true;

    const ClientResult started = client.Start(callbacks, settings);
    if (!started) {
        std::cerr << "[Agent] Failed to start OpAMP client: " << started.message << std::endl;
        return 1;
    }

    auto nextHealth = std::chrono::steady_clock::now() + kHealthInterval;
    while (!stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() < nextHealth) {
            continue;
        }
        nextHealth += kHealthInterval;

        const ClientResult reported = client.SetHealth(sampler.SampleHealth(startTime));
        if (!reported) {
            std::cerr << "[Agent] Failed to report health: " << reported.message << std::endl;
        }
    }

    const ClientResult stopped = client.Stop();
    if (!stopped) {
        std::cerr << "[Agent] Stop failed: " << stopped.message << std::endl;
    }
    Tracer::Instance().Shutdown();
    std::cout << "[Agent] Shutdown complete." << std::endl;
    return 0;
}
