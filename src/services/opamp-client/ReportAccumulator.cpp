#include "ReportAccumulator.hpp"
#include "ReportValidation.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace {
size_t IndexOf(ReportField field) {
    const auto bits = static_cast<uint32_t>(field);
    size_t index = 0;
    while (index < kReportFieldCount && (bits >> index) != 1u) {
        ++index;
    }
    return index;
}

template <typename T>
void Collect(const PendingField<T>& field, ReportField kind, std::optional<T>& out, OutboundSnapshot& snapshot) {
    if (!field.dirty || !field.value) {
        return;
    }
    out = *field.value;
    snapshot.fields |= static_cast<uint32_t>(kind);
    snapshot.versions[IndexOf(kind)] = field.version;
}

template <typename T>
void Clear(PendingField<T>& field, ReportField kind, const OutboundSnapshot& snapshot) {
    if (!snapshot.Includes(kind) || field.version != snapshot.versions[IndexOf(kind)]) {
        return;
    }
    field.dirty = false;
}

template <typename T>
void Remark(PendingField<T>& field) {
    if (!field.value) {
        return;
    }
    field.dirty = true;
    ++field.version;
}

ClientResult Invalid(std::string error) {
    return ClientResult::Failure(ClientErrorCode::InvalidArgument, std::move(error));
}

ClientResult Missing(AgentCapability capability) {
    return ClientResult::Failure(
        ClientErrorCode::MissingCapability,
        std::string("capability ") + Capabilities::Name(capability) + " was not declared at start");
}
} // namespace

const char* ToString(ReportField field) {
    switch (field) {
        case ReportField::AgentDescription: return "agent_description";
        case ReportField::Health: return "health";
        case ReportField::RemoteConfigStatus: return "remote_config_status";
        case ReportField::EffectiveConfig: return "effective_config";
        case ReportField::PackageStatuses: return "package_statuses";
        case ReportField::CustomCapabilities: return "custom_capabilities";
        case ReportField::CustomMessage: return "custom_message";
        case ReportField::Flags: return "flags";
    }
    return "unknown";
}

bool OutboundSnapshot::Includes(ReportField field) const {
    return (fields & static_cast<uint32_t>(field)) != 0;
}

ReportAccumulator::ReportAccumulator(Capabilities capabilities, InstanceUid instanceUid, WakeFn wake)
    : capabilities_(capabilities),
      wake_(std::move(wake)),
      instanceUid_(std::move(instanceUid)) {}

template <typename T>
ClientResult ReportAccumulator::Store(PendingField<T>& field, const T& value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (field.value && *field.value == value) {
            return ClientResult::Success();
        }
        field.value = value;
        field.dirty = true;
        ++field.version;
    }
    Wake();
    return ClientResult::Success();
}

ClientResult ReportAccumulator::SetAgentDescription(const AgentDescription& description) {
    std::string error;
    if (!ValidateAgentDescription(description, error)) {
        return Invalid(error);
    }
    return Store(description_, description);
}

ClientResult ReportAccumulator::SetHealth(const ComponentHealth& health) {
    std::string error;
    if (!ValidateHealth(health, error)) {
        return Invalid(error);
    }
    return Store(health_, health);
}

ClientResult ReportAccumulator::SetRemoteConfigStatus(const RemoteConfigStatus& status) {
    if (!capabilities_.Has(AgentCapability::ReportsRemoteConfig)) {
        return Missing(AgentCapability::ReportsRemoteConfig);
    }
    std::string error;
    if (!ValidateRemoteConfigStatus(status, error)) {
        return Invalid(error);
    }
    return Store(remoteConfigStatus_, status);
}

ClientResult ReportAccumulator::SetEffectiveConfig(const EffectiveConfig& config) {
    if (!capabilities_.Has(AgentCapability::ReportsEffectiveConfig)) {
        return Missing(AgentCapability::ReportsEffectiveConfig);
    }
    std::string error;
    if (!ValidateEffectiveConfig(config, error)) {
        return Invalid(error);
    }
    return Store(effectiveConfig_, config);
}

ClientResult ReportAccumulator::SetPackageStatuses(const PackageStatuses& statuses) {
    if (!capabilities_.Has(AgentCapability::ReportsPackageStatuses)) {
        return Missing(AgentCapability::ReportsPackageStatuses);
    }
    std::string error;
    if (!ValidatePackageStatuses(statuses, error)) {
        return Invalid(error);
    }
    return Store(packageStatuses_, statuses);
}

ClientResult ReportAccumulator::SetCustomCapabilities(const CustomCapabilities& capabilities) {
    std::string error;
    if (!ValidateCustomCapabilities(capabilities, error)) {
        return Invalid(error);
    }
    return Store(customCapabilities_, capabilities);
}

ClientResult ReportAccumulator::QueueCustomMessage(const CustomMessage& message) {
    std::string error;
    if (!ValidateCustomMessage(message, error)) {
        return Invalid(error);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto& declared = customCapabilities_.value;
        if (!declared
            || std::find(declared->capabilities.begin(), declared->capabilities.end(), message.capability)
                == declared->capabilities.end()) {
            return Invalid("custom capability '" + message.capability + "' is not declared");
        }
        if (customMessage_.value) {
            return ClientResult::Failure(ClientErrorCode::Busy, "a custom message is already waiting to be sent");
        }
        customMessage_.value = message;
        customMessage_.dirty = true;
        ++customMessage_.version;
    }
    Wake();
    return ClientResult::Success();
}

void ReportAccumulator::RequestInstanceUid() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        flags_.value = flags_.value.value_or(0) | kAgentToServerFlagRequestInstanceUid;
        flags_.dirty = true;
        ++flags_.version;
    }
    Wake();
}

void ReportAccumulator::SetInstanceUid(const InstanceUid& uid) {
    std::lock_guard<std::mutex> lock(mutex_);
    instanceUid_ = uid;
}

InstanceUid ReportAccumulator::CurrentInstanceUid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instanceUid_;
}

const Capabilities& ReportAccumulator::GetCapabilities() const {
    return capabilities_;
}

void ReportAccumulator::MarkFullState(const std::optional<EffectiveConfig>& effectiveConfig) {
    std::lock_guard<std::mutex> lock(mutex_);
    Remark(description_);
    Remark(health_);
    Remark(remoteConfigStatus_);
    Remark(packageStatuses_);
    Remark(customCapabilities_);
    if (effectiveConfig && capabilities_.Has(AgentCapability::ReportsEffectiveConfig)) {
        effectiveConfig_.value = *effectiveConfig;
    }
    Remark(effectiveConfig_);
}

OutboundSnapshot ReportAccumulator::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    OutboundSnapshot snapshot;
    snapshot.message.capabilities = capabilities_.Bits();
    Collect(description_, ReportField::AgentDescription, snapshot.message.agentDescription, snapshot);
    Collect(health_, ReportField::Health, snapshot.message.health, snapshot);
    Collect(remoteConfigStatus_, ReportField::RemoteConfigStatus, snapshot.message.remoteConfigStatus, snapshot);
    Collect(effectiveConfig_, ReportField::EffectiveConfig, snapshot.message.effectiveConfig, snapshot);
    Collect(packageStatuses_, ReportField::PackageStatuses, snapshot.message.packageStatuses, snapshot);
    Collect(customCapabilities_, ReportField::CustomCapabilities, snapshot.message.customCapabilities, snapshot);
    Collect(customMessage_, ReportField::CustomMessage, snapshot.message.customMessage, snapshot);

    if (flags_.dirty && flags_.value) {
        snapshot.message.flags = *flags_.value;
        snapshot.fields |= static_cast<uint32_t>(ReportField::Flags);
        snapshot.versions[IndexOf(ReportField::Flags)] = flags_.version;
    }
    return snapshot;
}

uint64_t ReportAccumulator::Stamp(AgentToServer& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    message.sequenceNum = ++sequenceNum_;
    message.instanceUid = instanceUid_.Bytes();
    message.capabilities = capabilities_.Bits();
    return message.sequenceNum;
}

void ReportAccumulator::Acknowledge(const OutboundSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    Clear(description_, ReportField::AgentDescription, snapshot);
    Clear(health_, ReportField::Health, snapshot);
    Clear(remoteConfigStatus_, ReportField::RemoteConfigStatus, snapshot);
    Clear(effectiveConfig_, ReportField::EffectiveConfig, snapshot);
    Clear(packageStatuses_, ReportField::PackageStatuses, snapshot);
    Clear(customCapabilities_, ReportField::CustomCapabilities, snapshot);

    // One-shot entries are dropped once delivered.
    Clear(customMessage_, ReportField::CustomMessage, snapshot);
    if (!customMessage_.dirty) {
        customMessage_.value.reset();
    }
    Clear(flags_, ReportField::Flags, snapshot);
    if (!flags_.dirty) {
        flags_.value.reset();
    }
}

uint64_t ReportAccumulator::LastSequenceNumber() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequenceNum_;
}

bool ReportAccumulator::IsDirty(ReportField field) const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (field) {
        case ReportField::AgentDescription: return description_.dirty;
        case ReportField::Health: return health_.dirty;
        case ReportField::RemoteConfigStatus: return remoteConfigStatus_.dirty;
        case ReportField::EffectiveConfig: return effectiveConfig_.dirty;
        case ReportField::PackageStatuses: return packageStatuses_.dirty;
        case ReportField::CustomCapabilities: return customCapabilities_.dirty;
        case ReportField::CustomMessage: return customMessage_.dirty;
        case ReportField::Flags: return flags_.dirty;
    }
    return false;
}

bool ReportAccumulator::HasDirtyFields() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return description_.dirty || health_.dirty || remoteConfigStatus_.dirty || effectiveConfig_.dirty
        || packageStatuses_.dirty || customCapabilities_.dirty || customMessage_.dirty || flags_.dirty;
}

std::optional<CustomCapabilities> ReportAccumulator::CurrentCustomCapabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return customCapabilities_.value;
}

void ReportAccumulator::Wake() const {
    if (wake_) {
        wake_();
    }
}
