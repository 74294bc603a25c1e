#include "ReportAccumulator.hpp"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

AgentDescription Description(const std::string& name) {
    AgentDescription description;
    description.identifyingAttributes.push_back({"service.name", AttributeValue::String(name)});
    return description;
}

ComponentHealth Healthy() {
    ComponentHealth health;
    health.healthy = true;
    health.status = "running";
    return health;
}

int TestOnlyDirtyFieldsAreSent() {
    int wakes = 0;
    ReportAccumulator accumulator(
        Capabilities{AgentCapability::ReportsStatus, AgentCapability::ReportsRemoteConfig},
        InstanceUid::Generate(),
        [&] { ++wakes; });

    OutboundSnapshot empty = accumulator.Snapshot();
    if (!empty.IsHeartbeat() || empty.message.agentDescription || empty.message.health) {
        return Fail("Untouched fields must be omitted.");
    }

    if (!accumulator.SetHealth(Healthy())) {
        return Fail("SetHealth rejected a valid value.");
    }
    RemoteConfigStatus status;
    status.lastRemoteConfigHash = "abc";
    status.status = RemoteConfigState::Applied;
    if (!accumulator.SetRemoteConfigStatus(status)) {
        return Fail("SetRemoteConfigStatus rejected a valid value.");
    }
    if (wakes != 2) {
        return Fail("Each accepted change should wake the poller once, got " + std::to_string(wakes));
    }

    const OutboundSnapshot snapshot = accumulator.Snapshot();
    if (!snapshot.Includes(ReportField::Health) || !snapshot.Includes(ReportField::RemoteConfigStatus)) {
        return Fail("Snapshot is missing dirty fields.");
    }
    if (snapshot.Includes(ReportField::AgentDescription) || snapshot.message.agentDescription) {
        return Fail("Snapshot carries a field that was never set.");
    }
    if (snapshot.message.capabilities != 0x1001) {
        return Fail("Capabilities must be carried in every message.");
    }

    accumulator.Acknowledge(snapshot);
    if (accumulator.HasDirtyFields()) {
        return Fail("Acknowledged fields should be clean.");
    }
    if (!accumulator.Snapshot().IsHeartbeat()) {
        return Fail("Nothing should be sent again after acknowledge.");
    }

    // Same value again: nothing to report.
    if (!accumulator.SetHealth(Healthy()) || accumulator.IsDirty(ReportField::Health) || wakes != 2) {
        return Fail("Re-setting an identical value should be a no-op.");
    }
    return 0;
}

int TestLastWriteWins() {
    ReportAccumulator accumulator(Capabilities{AgentCapability::ReportsStatus}, InstanceUid::Generate());
    if (!accumulator.SetAgentDescription(Description("a")) || !accumulator.SetAgentDescription(Description("b"))) {
        return Fail("SetAgentDescription rejected a valid value.");
    }
    const OutboundSnapshot snapshot = accumulator.Snapshot();
    if (!snapshot.message.agentDescription || !(*snapshot.message.agentDescription == Description("b"))) {
        return Fail("The latest description should win.");
    }
    return 0;
}

int TestChangeDuringExchangeStaysDirty() {
    ReportAccumulator accumulator(Capabilities{AgentCapability::ReportsStatus}, InstanceUid::Generate());
    if (!accumulator.SetAgentDescription(Description("a"))) {
        return Fail("SetAgentDescription rejected a valid value.");
    }
    const OutboundSnapshot inFlight = accumulator.Snapshot();
    if (!accumulator.SetAgentDescription(Description("b"))) {
        return Fail("SetAgentDescription rejected a valid value.");
    }

    accumulator.Acknowledge(inFlight);
    if (!accumulator.IsDirty(ReportField::AgentDescription)) {
        return Fail("A change made after the snapshot must survive its acknowledge.");
    }
    const OutboundSnapshot next = accumulator.Snapshot();
    if (!next.message.agentDescription || !(*next.message.agentDescription == Description("b"))) {
        return Fail("The newer description should be sent next.");
    }
    return 0;
}

int TestValidation() {
    int wakes = 0;
    ReportAccumulator accumulator(Capabilities{AgentCapability::ReportsStatus}, InstanceUid::Generate(), [&] {
        ++wakes;
    });

    AgentDescription duplicate = Description("a");
    duplicate.identifyingAttributes.push_back({"service.name", AttributeValue::String("b")});
    if (accumulator.SetAgentDescription(duplicate).code != ClientErrorCode::InvalidArgument) {
        return Fail("Duplicate attribute keys should be rejected.");
    }
    if (accumulator.SetAgentDescription(AgentDescription()).code != ClientErrorCode::InvalidArgument) {
        return Fail("A description without identifying attributes should be rejected.");
    }

    ComponentHealth health = Healthy();
    health.componentHealthMap[""] = Healthy();
    if (accumulator.SetHealth(health).code != ClientErrorCode::InvalidArgument) {
        return Fail("Unnamed health components should be rejected.");
    }

    RemoteConfigStatus status;
    status.status = RemoteConfigState::Applied;
    if (accumulator.SetRemoteConfigStatus(status).code != ClientErrorCode::MissingCapability) {
        return Fail("Remote config status needs ReportsRemoteConfig.");
    }
    if (accumulator.SetEffectiveConfig(EffectiveConfig()).code != ClientErrorCode::MissingCapability) {
        return Fail("Effective config needs ReportsEffectiveConfig.");
    }
    if (accumulator.SetPackageStatuses(PackageStatuses()).code != ClientErrorCode::MissingCapability) {
        return Fail("Package statuses need ReportsPackageStatuses.");
    }

    if (accumulator.HasDirtyFields() || wakes != 0) {
        return Fail("Rejected input must leave the pending report untouched.");
    }

    ReportAccumulator reporting(
        Capabilities{AgentCapability::ReportsStatus, AgentCapability::ReportsRemoteConfig},
        InstanceUid::Generate());
    if (reporting.SetRemoteConfigStatus(status).code != ClientErrorCode::InvalidArgument) {
        return Fail("Applied status without a hash should be rejected.");
    }
    return 0;
}

int TestCustomMessages() {
    ReportAccumulator accumulator(Capabilities{AgentCapability::ReportsStatus}, InstanceUid::Generate());
    CustomMessage message{"io.example.ping", "ping", "1"};
    if (accumulator.QueueCustomMessage(message).code != ClientErrorCode::InvalidArgument) {
        return Fail("Custom messages need a declared capability.");
    }

    if (!accumulator.SetCustomCapabilities(CustomCapabilities{{"io.example.ping"}})) {
        return Fail("SetCustomCapabilities rejected a valid value.");
    }
    if (!accumulator.QueueCustomMessage(message)) {
        return Fail("Declared custom message rejected.");
    }
    if (accumulator.QueueCustomMessage(message).code != ClientErrorCode::Busy) {
        return Fail("A second pending custom message should report Busy.");
    }

    const OutboundSnapshot snapshot = accumulator.Snapshot();
    accumulator.Acknowledge(snapshot);
    if (!accumulator.QueueCustomMessage(message)) {
        return Fail("Queue should accept a new message once the previous one was delivered.");
    }
    return 0;
}

int TestStampingAndFullState() {
    ReportAccumulator accumulator(
        Capabilities{AgentCapability::ReportsStatus, AgentCapability::ReportsEffectiveConfig},
        InstanceUid::Generate());

    AgentToServer first;
    AgentToServer second;
    if (accumulator.Stamp(first) != 1 || accumulator.Stamp(second) != 2 || accumulator.LastSequenceNumber() != 2) {
        return Fail("Sequence numbers should start at 1 and grow by one per attempt.");
    }
    if (first.instanceUid != accumulator.CurrentInstanceUid().Bytes()) {
        return Fail("Stamp should carry the instance uid.");
    }

    InstanceUid assigned;
    if (!InstanceUid::Parse("00000000000000000000000000000042", assigned)) {
        return Fail("Test uid rejected.");
    }
    accumulator.SetInstanceUid(assigned);
    AgentToServer third;
    accumulator.Stamp(third);
    if (third.instanceUid != assigned.Bytes()) {
        return Fail("A new instance uid should apply to later messages.");
    }

    accumulator.RequestInstanceUid();
    OutboundSnapshot flags = accumulator.Snapshot();
    if ((flags.message.flags & kAgentToServerFlagRequestInstanceUid) == 0) {
        return Fail("RequestInstanceUid should set the request flag.");
    }
    accumulator.Acknowledge(flags);
    if (accumulator.Snapshot().message.flags != 0) {
        return Fail("Request flag should be sent once.");
    }

    if (!accumulator.SetAgentDescription(Description("a")) || !accumulator.SetHealth(Healthy())) {
        return Fail("Setters rejected valid values.");
    }
    accumulator.Acknowledge(accumulator.Snapshot());

    EffectiveConfig effective;
    effective.configMap.configMap["main.yaml"] = AgentConfigFile{"a: 1", "text/yaml"};
    accumulator.MarkFullState(effective);
    const OutboundSnapshot full = accumulator.Snapshot();
    if (!full.Includes(ReportField::AgentDescription) || !full.Includes(ReportField::Health)
        || !full.Includes(ReportField::EffectiveConfig)) {
        return Fail("Full state should resend every held field.");
    }
    if (full.Includes(ReportField::PackageStatuses) || full.Includes(ReportField::RemoteConfigStatus)) {
        return Fail("Full state should not invent fields that were never set.");
    }
    return 0;
}
} // namespace

int main() {
    if (const int rc = TestOnlyDirtyFieldsAreSent()) {
        return rc;
    }
    if (const int rc = TestLastWriteWins()) {
        return rc;
    }
    if (const int rc = TestChangeDuringExchangeStaysDirty()) {
        return rc;
    }
    if (const int rc = TestValidation()) {
        return rc;
    }
    if (const int rc = TestCustomMessages()) {
        return rc;
    }
    return TestStampingAndFullState();
}
