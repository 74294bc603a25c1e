#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Plain in-memory forms of the OpAMP messages. Byte fields (hashes,
// config bodies, instance uids) are carried in std::string.

constexpr uint64_t kAgentToServerFlagRequestInstanceUid = 0x00000001;
constexpr uint64_t kServerToAgentFlagReportFullState = 0x00000001;

struct AttributeValue {
    enum class Type {
        String,
        Bool,
        Int,
        Double,
        Bytes
    };

    Type type = Type::String;
    std::string stringValue;
    bool boolValue = false;
    int64_t intValue = 0;
    double doubleValue = 0.0;

    static AttributeValue String(std::string value);
    static AttributeValue Bool(bool value);
    static AttributeValue Int(int64_t value);
    static AttributeValue Double(double value);
    static AttributeValue Bytes(std::string value);

    bool operator==(const AttributeValue& other) const;
};

struct KeyValue {
    std::string key;
    AttributeValue value;

    bool operator==(const KeyValue& other) const;
};

struct AgentDescription {
    std::vector<KeyValue> identifyingAttributes;
    std::vector<KeyValue> nonIdentifyingAttributes;

    bool operator==(const AgentDescription& other) const;
};

struct ComponentHealth {
    bool healthy = false;
    uint64_t startTimeUnixNano = 0;
    std::string lastError;
    std::string status;
    uint64_t statusTimeUnixNano = 0;
    std::map<std::string, ComponentHealth> componentHealthMap;

    bool operator==(const ComponentHealth& other) const;
};

struct AgentConfigFile {
    std::string body;
    std::string contentType;

    bool operator==(const AgentConfigFile& other) const;
};

struct AgentConfigMap {
    std::map<std::string, AgentConfigFile> configMap;

    bool operator==(const AgentConfigMap& other) const;
};

struct EffectiveConfig {
    AgentConfigMap configMap;

    bool operator==(const EffectiveConfig& other) const;
};

enum class RemoteConfigState {
    Unset = 0,
    Applied = 1,
    Applying = 2,
    Failed = 3
};

struct RemoteConfigStatus {
    std::string lastRemoteConfigHash;
    RemoteConfigState status = RemoteConfigState::Unset;
    std::string errorMessage;

    bool operator==(const RemoteConfigStatus& other) const;
};

enum class PackageState {
    Installed = 0,
    InstallPending = 1,
    Installing = 2,
    InstallFailed = 3
};

struct PackageStatus {
    std::string name;
    std::string agentHasVersion;
    std::string agentHasHash;
    std::string serverOfferedVersion;
    std::string serverOfferedHash;
    PackageState status = PackageState::Installed;
    std::string errorMessage;

    bool operator==(const PackageStatus& other) const;
};

struct PackageStatuses {
    std::map<std::string, PackageStatus> packages;
    std::string serverProvidedAllPackagesHash;
    std::string errorMessage;

    bool operator==(const PackageStatuses& other) const;
};

struct CustomCapabilities {
    std::vector<std::string> capabilities;

    bool operator==(const CustomCapabilities& other) const;
};

struct CustomMessage {
    std::string capability;
    std::string type;
    std::string data;

    bool operator==(const CustomMessage& other) const;
};

struct AgentToServer {
    std::string instanceUid;
    uint64_t sequenceNum = 0;
    uint64_t capabilities = 0;
    uint64_t flags = 0;
    std::optional<AgentDescription> agentDescription;
    std::optional<ComponentHealth> health;
    std::optional<EffectiveConfig> effectiveConfig;
    std::optional<RemoteConfigStatus> remoteConfigStatus;
    std::optional<PackageStatuses> packageStatuses;
    std::optional<CustomCapabilities> customCapabilities;
    std::optional<CustomMessage> customMessage;
    bool agentDisconnect = false;
};

struct Header {
    std::string key;
    std::string value;

    bool operator==(const Header& other) const;
};

struct TlsCertificate {
    std::string cert;
    std::string privateKey;
    std::string caCert;
};

struct OpampConnectionSettings {
    std::string destinationEndpoint;
    std::vector<Header> headers;
    std::optional<TlsCertificate> certificate;
    uint64_t heartbeatIntervalSeconds = 0;
};

struct TelemetryConnectionSettings {
    std::string destinationEndpoint;
    std::vector<Header> headers;
    std::optional<TlsCertificate> certificate;
};

struct OtherConnectionSettings {
    std::string destinationEndpoint;
    std::vector<Header> headers;
    std::optional<TlsCertificate> certificate;
    std::map<std::string, std::string> otherSettings;
};

struct ConnectionSettingsOffers {
    std::string hash;
    std::optional<OpampConnectionSettings> opamp;
    std::optional<TelemetryConnectionSettings> ownMetrics;
    std::optional<TelemetryConnectionSettings> ownTraces;
    std::optional<TelemetryConnectionSettings> ownLogs;
    std::map<std::string, OtherConnectionSettings> otherConnections;
};

enum class PackageType {
    TopLevel = 0,
    Addon = 1
};

struct DownloadableFile {
    std::string downloadUrl;
    std::string contentHash;
    std::string signature;
};

struct PackageAvailable {
    PackageType type = PackageType::TopLevel;
    std::string version;
    std::optional<DownloadableFile> file;
    std::string hash;
};

struct PackagesAvailable {
    std::map<std::string, PackageAvailable> packages;
    std::string allPackagesHash;
};

enum class ServerErrorType {
    Unknown = 0,
    BadRequest = 1,
    Unavailable = 2
};

struct ServerErrorResponse {
    ServerErrorType type = ServerErrorType::Unknown;
    std::string errorMessage;
    std::optional<uint64_t> retryAfterNanoseconds;
};

enum class CommandType {
    Restart = 0
};

struct ServerToAgentCommand {
    CommandType type = CommandType::Restart;
};

struct AgentRemoteConfig {
    AgentConfigMap config;
    std::string configHash;
};

struct ServerToAgent {
    std::string instanceUid;
    std::optional<ServerErrorResponse> errorResponse;
    std::optional<AgentRemoteConfig> remoteConfig;
    std::optional<ConnectionSettingsOffers> connectionSettings;
    std::optional<PackagesAvailable> packagesAvailable;
    uint64_t flags = 0;
    uint64_t capabilities = 0;
    std::optional<std::string> newInstanceUid;
    std::optional<ServerToAgentCommand> command;
    std::optional<CustomCapabilities> customCapabilities;
    std::optional<CustomMessage> customMessage;

    // Top-level fields the codec could not map; forward-compatible servers
    // may send them.
    int unknownFieldCount = 0;
};

const char* ToString(RemoteConfigState state);
const char* ToString(PackageState state);
const char* ToString(ServerErrorType type);
const char* ToString(CommandType type);
