#include "Messages.hpp"

#include <utility>

AttributeValue AttributeValue::String(std::string value) {
    AttributeValue result;
    result.type = Type::String;
    result.stringValue = std::move(value);
    return result;
}

AttributeValue AttributeValue::Bool(bool value) {
    AttributeValue result;
    result.type = Type::Bool;
    result.boolValue = value;
    return result;
}

AttributeValue AttributeValue::Int(int64_t value) {
    AttributeValue result;
    result.type = Type::Int;
    result.intValue = value;
    return result;
}

AttributeValue AttributeValue::Double(double value) {
    AttributeValue result;
    result.type = Type::Double;
    result.doubleValue = value;
    return result;
}

AttributeValue AttributeValue::Bytes(std::string value) {
    AttributeValue result;
    result.type = Type::Bytes;
    result.stringValue = std::move(value);
    return result;
}

bool AttributeValue::operator==(const AttributeValue& other) const {
    if (type != other.type) {
        return false;
    }

    switch (type) {
        case Type::String:
        case Type::Bytes:
            return stringValue == other.stringValue;
        case Type::Bool:
            return boolValue == other.boolValue;
        case Type::Int:
            return intValue == other.intValue;
        case Type::Double:
            return doubleValue == other.doubleValue;
    }
    return false;
}

bool KeyValue::operator==(const KeyValue& other) const {
    return key == other.key && value == other.value;
}

bool AgentDescription::operator==(const AgentDescription& other) const {
    return identifyingAttributes == other.identifyingAttributes
        && nonIdentifyingAttributes == other.nonIdentifyingAttributes;
}

bool ComponentHealth::operator==(const ComponentHealth& other) const {
    return healthy == other.healthy
        && startTimeUnixNano == other.startTimeUnixNano
        && lastError == other.lastError
        && status == other.status
        && statusTimeUnixNano == other.statusTimeUnixNano
        && componentHealthMap == other.componentHealthMap;
}

bool AgentConfigFile::operator==(const AgentConfigFile& other) const {
    return body == other.body && contentType == other.contentType;
}

bool AgentConfigMap::operator==(const AgentConfigMap& other) const {
    return configMap == other.configMap;
}

bool EffectiveConfig::operator==(const EffectiveConfig& other) const {
    return configMap == other.configMap;
}

bool RemoteConfigStatus::operator==(const RemoteConfigStatus& other) const {
    return lastRemoteConfigHash == other.lastRemoteConfigHash
        && status == other.status
        && errorMessage == other.errorMessage;
}

bool PackageStatus::operator==(const PackageStatus& other) const {
    return name == other.name
        && agentHasVersion == other.agentHasVersion
        && agentHasHash == other.agentHasHash
        && serverOfferedVersion == other.serverOfferedVersion
        && serverOfferedHash == other.serverOfferedHash
        && status == other.status
        && errorMessage == other.errorMessage;
}

bool PackageStatuses::operator==(const PackageStatuses& other) const {
    return packages == other.packages
        && serverProvidedAllPackagesHash == other.serverProvidedAllPackagesHash
        && errorMessage == other.errorMessage;
}

bool CustomCapabilities::operator==(const CustomCapabilities& other) const {
    return capabilities == other.capabilities;
}

bool CustomMessage::operator==(const CustomMessage& other) const {
    return capability == other.capability && type == other.type && data == other.data;
}

bool Header::operator==(const Header& other) const {
    return key == other.key && value == other.value;
}

const char* ToString(RemoteConfigState state) {
    switch (state) {
        case RemoteConfigState::Unset: return "UNSET";
        case RemoteConfigState::Applied: return "APPLIED";
        case RemoteConfigState::Applying: return "APPLYING";
        case RemoteConfigState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

const char* ToString(PackageState state) {
    switch (state) {
        case PackageState::Installed: return "INSTALLED";
        case PackageState::InstallPending: return "INSTALL_PENDING";
        case PackageState::Installing: return "INSTALLING";
        case PackageState::InstallFailed: return "INSTALL_FAILED";
    }
    return "UNKNOWN";
}

const char* ToString(ServerErrorType type) {
    switch (type) {
        case ServerErrorType::Unknown: return "UNKNOWN";
        case ServerErrorType::BadRequest: return "BAD_REQUEST";
        case ServerErrorType::Unavailable: return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

const char* ToString(CommandType type) {
    switch (type) {
        case CommandType::Restart: return "RESTART";
    }
    return "UNKNOWN";
}
