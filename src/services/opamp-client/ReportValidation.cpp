#include "ReportValidation.hpp"

#include <set>

namespace {
bool ValidateAttributes(const std::vector<KeyValue>& attributes, const char* listName, std::string& error) {
    std::set<std::string> seen;
    for (const auto& attribute : attributes) {
        if (attribute.key.empty()) {
            error = std::string(listName) + " contains an attribute with an empty key";
            return false;
        }
        if (!seen.insert(attribute.key).second) {
            error = std::string(listName) + " contains duplicate key '" + attribute.key + "'";
            return false;
        }
    }
    return true;
}

bool ValidateHealthTree(const ComponentHealth& health, const std::string& path, int depth, std::string& error) {
    constexpr int kMaxDepth = 32;
    if (depth > kMaxDepth) {
        error = "component health nesting is too deep at '" + path + "'";
        return false;
    }

    for (const auto& [name, component] : health.componentHealthMap) {
        if (name.empty()) {
            error = "component health map contains an empty component name under '" + path + "'";
            return false;
        }
        if (!ValidateHealthTree(component, path + "/" + name, depth + 1, error)) {
            return false;
        }
    }
    return true;
}

bool IsKnownRemoteConfigState(RemoteConfigState state) {
    switch (state) {
        case RemoteConfigState::Unset:
        case RemoteConfigState::Applied:
        case RemoteConfigState::Applying:
        case RemoteConfigState::Failed:
            return true;
    }
    return false;
}

bool IsKnownPackageState(PackageState state) {
    switch (state) {
        case PackageState::Installed:
        case PackageState::InstallPending:
        case PackageState::Installing:
        case PackageState::InstallFailed:
            return true;
    }
    return false;
}
} // namespace

bool ValidateAgentDescription(const AgentDescription& description, std::string& error) {
    if (description.identifyingAttributes.empty()) {
        error = "agent description must contain identifying attributes";
        return false;
    }
    return ValidateAttributes(description.identifyingAttributes, "identifying attributes", error)
        && ValidateAttributes(description.nonIdentifyingAttributes, "non-identifying attributes", error);
}

bool ValidateHealth(const ComponentHealth& health, std::string& error) {
    return ValidateHealthTree(health, "", 0, error);
}

bool ValidateRemoteConfigStatus(const RemoteConfigStatus& status, std::string& error) {
    if (!IsKnownRemoteConfigState(status.status)) {
        error = "remote config status value " + std::to_string(static_cast<int>(status.status)) + " is not defined";
        return false;
    }
    if (status.status != RemoteConfigState::Unset && status.lastRemoteConfigHash.empty()) {
        error = std::string("remote config status ") + ToString(status.status) + " requires the config hash";
        return false;
    }
    return true;
}

bool ValidateEffectiveConfig(const EffectiveConfig& config, std::string& error) {
    for (const auto& entry : config.configMap.configMap) {
        if (entry.first.empty()) {
            error = "effective config contains a file with an empty name";
            return false;
        }
    }
    return true;
}

bool ValidatePackageStatuses(const PackageStatuses& statuses, std::string& error) {
    for (const auto& [key, package] : statuses.packages) {
        if (key.empty()) {
            error = "package statuses contain an entry with an empty name";
            return false;
        }
        if (package.name != key) {
            error = "package status '" + key + "' carries mismatching name '" + package.name + "'";
            return false;
        }
        if (!IsKnownPackageState(package.status)) {
            error = "package status '" + key + "' has undefined status value";
            return false;
        }
    }
    return true;
}

bool ValidateCustomCapabilities(const CustomCapabilities& capabilities, std::string& error) {
    std::set<std::string> seen;
    for (const auto& capability : capabilities.capabilities) {
        if (capability.empty()) {
            error = "custom capabilities contain an empty entry";
            return false;
        }
        if (!seen.insert(capability).second) {
            error = "custom capability '" + capability + "' is listed twice";
            return false;
        }
    }
    return true;
}

bool ValidateCustomMessage(const CustomMessage& message, std::string& error) {
    if (message.capability.empty()) {
        error = "custom message requires a capability";
        return false;
    }
    if (message.type.empty()) {
        error = "custom message requires a type";
        return false;
    }
    return true;
}
