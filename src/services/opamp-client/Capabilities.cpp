#include "Capabilities.hpp"

#include <sstream>

namespace {
constexpr AgentCapability kAllCapabilities[] = {
    AgentCapability::ReportsStatus,
    AgentCapability::AcceptsRemoteConfig,
    AgentCapability::ReportsEffectiveConfig,
    AgentCapability::AcceptsPackages,
    AgentCapability::ReportsPackageStatuses,
    AgentCapability::ReportsOwnTraces,
    AgentCapability::ReportsOwnMetrics,
    AgentCapability::ReportsOwnLogs,
    AgentCapability::AcceptsOpAmpConnectionSettings,
    AgentCapability::AcceptsOtherConnectionSettings,
    AgentCapability::AcceptsRestartCommand,
    AgentCapability::ReportsHealth,
    AgentCapability::ReportsRemoteConfig,
    AgentCapability::ReportsHeartbeat
};
} // namespace

Capabilities::Capabilities(std::initializer_list<AgentCapability> capabilities) {
    for (const auto capability : capabilities) {
        Add(capability);
    }
}

Capabilities Capabilities::FromBits(uint64_t bits) {
    Capabilities capabilities;
    capabilities.bits_ = bits;
    return capabilities;
}

Capabilities& Capabilities::Add(AgentCapability capability) {
    bits_ |= static_cast<uint64_t>(capability);
    return *this;
}

bool Capabilities::Has(AgentCapability capability) const {
    return (bits_ & static_cast<uint64_t>(capability)) != 0;
}

uint64_t Capabilities::Bits() const {
    return bits_;
}

std::string Capabilities::ToString() const {
    std::string result;
    uint64_t known = 0;
    for (const auto capability : kAllCapabilities) {
        known |= static_cast<uint64_t>(capability);
        if (!Has(capability)) {
            continue;
        }
        if (!result.empty()) {
            result += "|";
        }
        result += Name(capability);
    }

    const uint64_t unknown = bits_ & ~known;
    if (unknown != 0) {
        std::ostringstream out;
        out << "0x" << std::hex << unknown;
        if (!result.empty()) {
            result += "|";
        }
        result += out.str();
    }

    return result.empty() ? "none" : result;
}

const char* Capabilities::Name(AgentCapability capability) {
    switch (capability) {
        case AgentCapability::ReportsStatus: return "ReportsStatus";
        case AgentCapability::AcceptsRemoteConfig: return "AcceptsRemoteConfig";
        case AgentCapability::ReportsEffectiveConfig: return "ReportsEffectiveConfig";
        case AgentCapability::AcceptsPackages: return "AcceptsPackages";
        case AgentCapability::ReportsPackageStatuses: return "ReportsPackageStatuses";
        case AgentCapability::ReportsOwnTraces: return "ReportsOwnTraces";
        case AgentCapability::ReportsOwnMetrics: return "ReportsOwnMetrics";
        case AgentCapability::ReportsOwnLogs: return "ReportsOwnLogs";
        case AgentCapability::AcceptsOpAmpConnectionSettings: return "AcceptsOpAmpConnectionSettings";
        case AgentCapability::AcceptsOtherConnectionSettings: return "AcceptsOtherConnectionSettings";
        case AgentCapability::AcceptsRestartCommand: return "AcceptsRestartCommand";
        case AgentCapability::ReportsHealth: return "ReportsHealth";
        case AgentCapability::ReportsRemoteConfig: return "ReportsRemoteConfig";
        case AgentCapability::ReportsHeartbeat: return "ReportsHeartbeat";
    }
    return "Unknown";
}

bool Capabilities::operator==(const Capabilities& other) const {
    return bits_ == other.bits_;
}

bool Capabilities::operator!=(const Capabilities& other) const {
    return bits_ != other.bits_;
}
