#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>

// Bit values are fixed by the OpAMP AgentCapabilities enum.
enum class AgentCapability : uint64_t {
    ReportsStatus = 0x00000001,
    AcceptsRemoteConfig = 0x00000002,
    ReportsEffectiveConfig = 0x00000004,
    AcceptsPackages = 0x00000008,
    ReportsPackageStatuses = 0x00000010,
    ReportsOwnTraces = 0x00000020,
    ReportsOwnMetrics = 0x00000040,
    ReportsOwnLogs = 0x00000080,
    AcceptsOpAmpConnectionSettings = 0x00000100,
    AcceptsOtherConnectionSettings = 0x00000200,
    AcceptsRestartCommand = 0x00000400,
    ReportsHealth = 0x00000800,
    ReportsRemoteConfig = 0x00001000,
    ReportsHeartbeat = 0x00002000
};

class Capabilities {
public:
    Capabilities() = default;
    Capabilities(std::initializer_list<AgentCapability> capabilities);

    static Capabilities FromBits(uint64_t bits);

    Capabilities& Add(AgentCapability capability);
    bool Has(AgentCapability capability) const;
    uint64_t Bits() const;

    // "ReportsStatus|AcceptsRemoteConfig"; unknown bits are rendered in hex.
    std::string ToString() const;

    static const char* Name(AgentCapability capability);

    bool operator==(const Capabilities& other) const;
    bool operator!=(const Capabilities& other) const;

private:
    uint64_t bits_ = 0;
};
