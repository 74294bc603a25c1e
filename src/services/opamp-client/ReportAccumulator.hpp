#pragma once

#include "Capabilities.hpp"
#include "ClientResult.hpp"
#include "InstanceUid.hpp"
#include "Messages.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

enum class ReportField : uint32_t {
    AgentDescription = 1u << 0,
    Health = 1u << 1,
    RemoteConfigStatus = 1u << 2,
    EffectiveConfig = 1u << 3,
    PackageStatuses = 1u << 4,
    CustomCapabilities = 1u << 5,
    CustomMessage = 1u << 6,
    Flags = 1u << 7
};

constexpr size_t kReportFieldCount = 8;

const char* ToString(ReportField field);

// Dirty fields copied out for one logical message. `versions` records the
// field versions seen so a later acknowledge only clears what was sent.
struct OutboundSnapshot {
    AgentToServer message;
    uint32_t fields = 0;
    std::array<uint64_t, kReportFieldCount> versions{};

    bool Includes(ReportField field) const;
    bool IsHeartbeat() const { return fields == 0; }
};

template <typename T>
struct PendingField {
    std::optional<T> value;
    bool dirty = false;
    uint64_t version = 0;
};

// PendingReport of the session. Setters run on application threads, the
// poll thread snapshots, stamps and acknowledges. All state sits behind
// one mutex that is never held while calling out (wake signal included).
class ReportAccumulator {
public:
    using WakeFn = std::function<void()>;

    ReportAccumulator(Capabilities capabilities, InstanceUid instanceUid, WakeFn wake = {});

    ClientResult SetAgentDescription(const AgentDescription& description);
    ClientResult SetHealth(const ComponentHealth& health);
    ClientResult SetRemoteConfigStatus(const RemoteConfigStatus& status);
    ClientResult SetEffectiveConfig(const EffectiveConfig& config);
    ClientResult SetPackageStatuses(const PackageStatuses& statuses);
    ClientResult SetCustomCapabilities(const CustomCapabilities& capabilities);
    ClientResult QueueCustomMessage(const CustomMessage& message);
    void RequestInstanceUid();

    void SetInstanceUid(const InstanceUid& uid);
    InstanceUid CurrentInstanceUid() const;
    const Capabilities& GetCapabilities() const;

    // Marks every held field dirty again; `effectiveConfig` replaces the
    // stored one when present.
    void MarkFullState(const std::optional<EffectiveConfig>& effectiveConfig);

    OutboundSnapshot Snapshot() const;

    // Assigns the next sequence number and the current instance uid to one
    // send attempt. Returns the sequence number.
    uint64_t Stamp(AgentToServer& message);

    // The exchange that carried `snapshot` was delivered.
    void Acknowledge(const OutboundSnapshot& snapshot);

    uint64_t LastSequenceNumber() const;
    bool IsDirty(ReportField field) const;
    bool HasDirtyFields() const;
    std::optional<CustomCapabilities> CurrentCustomCapabilities() const;

private:
    template <typename T>
    ClientResult Store(PendingField<T>& field, const T& value);

    void Wake() const;

    const Capabilities capabilities_;
    WakeFn wake_;

    mutable std::mutex mutex_;
    InstanceUid instanceUid_;
    uint64_t sequenceNum_ = 0;
    PendingField<AgentDescription> description_;
    PendingField<ComponentHealth> health_;
    PendingField<RemoteConfigStatus> remoteConfigStatus_;
    PendingField<EffectiveConfig> effectiveConfig_;
    PendingField<PackageStatuses> packageStatuses_;
    PendingField<CustomCapabilities> customCapabilities_;
    PendingField<CustomMessage> customMessage_;
    PendingField<uint64_t> flags_;
};
