#include "ProtoMapping.hpp"

#include <google/protobuf/unknown_field_set.h>

#include <utility>

namespace {
void FillValue(const AttributeValue& value, opamp::proto::AnyValue* out) {
    switch (value.type) {
        case AttributeValue::Type::String:
            out->set_string_value(value.stringValue);
            break;
        case AttributeValue::Type::Bool:
            out->set_bool_value(value.boolValue);
            break;
        case AttributeValue::Type::Int:
            out->set_int_value(value.intValue);
            break;
        case AttributeValue::Type::Double:
            out->set_double_value(value.doubleValue);
            break;
        case AttributeValue::Type::Bytes:
            out->set_bytes_value(value.stringValue);
            break;
    }
}

void FillAttributes(
    const std::vector<KeyValue>& attributes,
    google::protobuf::RepeatedPtrField<opamp::proto::KeyValue>* out) {
    for (const auto& attribute : attributes) {
        auto* entry = out->Add();
        entry->set_key(attribute.key);
        FillValue(attribute.value, entry->mutable_value());
    }
}

void FillHealth(const ComponentHealth& health, opamp::proto::ComponentHealth* out) {
    out->set_healthy(health.healthy);
    out->set_start_time_unix_nano(health.startTimeUnixNano);
    out->set_last_error(health.lastError);
    out->set_status(health.status);
    out->set_status_time_unix_nano(health.statusTimeUnixNano);
    for (const auto& [name, component] : health.componentHealthMap) {
        FillHealth(component, &(*out->mutable_component_health_map())[name]);
    }
}

void FillConfigMap(const AgentConfigMap& config, opamp::proto::AgentConfigMap* out) {
    for (const auto& [name, file] : config.configMap) {
        auto& entry = (*out->mutable_config_map())[name];
        entry.set_body(file.body);
        entry.set_content_type(file.contentType);
    }
}

AgentConfigMap ReadConfigMap(const opamp::proto::AgentConfigMap& config) {
    AgentConfigMap out;
    for (const auto& [name, file] : config.config_map()) {
        out.configMap[name] = AgentConfigFile{file.body(), file.content_type()};
    }
    return out;
}

std::vector<Header> ReadHeaders(const opamp::proto::Headers& headers) {
    std::vector<Header> out;
    for (const auto& header : headers.headers()) {
        out.push_back(Header{header.key(), header.value()});
    }
    return out;
}

std::optional<TlsCertificate> ReadCertificate(bool present, const opamp::proto::TLSCertificate& certificate) {
    if (!present) {
        return std::nullopt;
    }
    return TlsCertificate{certificate.cert(), certificate.private_key(), certificate.ca_cert()};
}

template <typename Proto>
TelemetryConnectionSettings ReadTelemetry(const Proto& settings) {
    TelemetryConnectionSettings out;
    out.destinationEndpoint = settings.destination_endpoint();
    out.headers = ReadHeaders(settings.headers());
    out.certificate = ReadCertificate(settings.has_certificate(), settings.certificate());
    return out;
}

ConnectionSettingsOffers ReadOffers(const opamp::proto::ConnectionSettingsOffers& offers) {
    ConnectionSettingsOffers out;
    out.hash = offers.hash();
    if (offers.has_opamp()) {
        const auto& opamp = offers.opamp();
        OpampConnectionSettings settings;
        settings.destinationEndpoint = opamp.destination_endpoint();
        settings.headers = ReadHeaders(opamp.headers());
        settings.certificate = ReadCertificate(opamp.has_certificate(), opamp.certificate());
        settings.heartbeatIntervalSeconds = opamp.heartbeat_interval_seconds();
        out.opamp = std::move(settings);
    }
    if (offers.has_own_metrics()) {
        out.ownMetrics = ReadTelemetry(offers.own_metrics());
    }
    if (offers.has_own_traces()) {
        out.ownTraces = ReadTelemetry(offers.own_traces());
    }
    if (offers.has_own_logs()) {
        out.ownLogs = ReadTelemetry(offers.own_logs());
    }
    for (const auto& [name, other] : offers.other_connections()) {
        OtherConnectionSettings settings;
        settings.destinationEndpoint = other.destination_endpoint();
        settings.headers = ReadHeaders(other.headers());
        settings.certificate = ReadCertificate(other.has_certificate(), other.certificate());
        settings.otherSettings.insert(other.other_settings().begin(), other.other_settings().end());
        out.otherConnections[name] = std::move(settings);
    }
    return out;
}

PackagesAvailable ReadPackages(const opamp::proto::PackagesAvailable& packages) {
    PackagesAvailable out;
    out.allPackagesHash = packages.all_packages_hash();
    for (const auto& [name, package] : packages.packages()) {
        PackageAvailable entry;
        entry.type = package.type() == opamp::proto::PackageType_Addon ? PackageType::Addon : PackageType::TopLevel;
        entry.version = package.version();
        entry.hash = package.hash();
        if (package.has_file()) {
            entry.file = DownloadableFile{
                package.file().download_url(), package.file().content_hash(), package.file().signature()};
        }
        out.packages[name] = std::move(entry);
    }
    return out;
}

ServerErrorType ReadErrorType(int type) {
    switch (type) {
        case opamp::proto::ServerErrorResponseType_BadRequest: return ServerErrorType::BadRequest;
        case opamp::proto::ServerErrorResponseType_Unavailable: return ServerErrorType::Unavailable;
        default: return ServerErrorType::Unknown;
    }
}
} // namespace

void ToProto(const AgentToServer& message, opamp::proto::AgentToServer& proto) {
    proto.set_instance_uid(message.instanceUid);
    proto.set_sequence_num(message.sequenceNum);
    proto.set_capabilities(message.capabilities);
    proto.set_flags(message.flags);

    if (message.agentDescription) {
        auto* description = proto.mutable_agent_description();
        FillAttributes(message.agentDescription->identifyingAttributes, description->mutable_identifying_attributes());
        FillAttributes(
            message.agentDescription->nonIdentifyingAttributes, description->mutable_non_identifying_attributes());
    }
    if (message.health) {
        FillHealth(*message.health, proto.mutable_health());
    }
    if (message.effectiveConfig) {
        FillConfigMap(message.effectiveConfig->configMap, proto.mutable_effective_config()->mutable_config_map());
    }
    if (message.remoteConfigStatus) {
        auto* status = proto.mutable_remote_config_status();
        status->set_last_remote_config_hash(message.remoteConfigStatus->lastRemoteConfigHash);
        status->set_status(static_cast<opamp::proto::RemoteConfigStatuses>(message.remoteConfigStatus->status));
        status->set_error_message(message.remoteConfigStatus->errorMessage);
    }
    if (message.packageStatuses) {
        auto* statuses = proto.mutable_package_statuses();
        statuses->set_server_provided_all_packages_hash(message.packageStatuses->serverProvidedAllPackagesHash);
        statuses->set_error_message(message.packageStatuses->errorMessage);
        for (const auto& [name, package] : message.packageStatuses->packages) {
            auto& entry = (*statuses->mutable_packages())[name];
            entry.set_name(package.name);
            entry.set_agent_has_version(package.agentHasVersion);
            entry.set_agent_has_hash(package.agentHasHash);
            entry.set_server_offered_version(package.serverOfferedVersion);
            entry.set_server_offered_hash(package.serverOfferedHash);
            entry.set_status(static_cast<opamp::proto::PackageStatusEnum>(package.status));
            entry.set_error_message(package.errorMessage);
        }
    }
    if (message.customCapabilities) {
        for (const auto& capability : message.customCapabilities->capabilities) {
            proto.mutable_custom_capabilities()->add_capabilities(capability);
        }
    }
    if (message.customMessage) {
        auto* custom = proto.mutable_custom_message();
        custom->set_capability(message.customMessage->capability);
        custom->set_type(message.customMessage->type);
        custom->set_data(message.customMessage->data);
    }
    if (message.agentDisconnect) {
        proto.mutable_agent_disconnect();
    }

}

void FromProto(const opamp::proto::ServerToAgent& proto, ServerToAgent& out) {
    out = ServerToAgent();
    out.instanceUid = proto.instance_uid();
    out.flags = proto.flags();
    out.capabilities = proto.capabilities();

    if (proto.has_error_response()) {
        ServerErrorResponse response;
        response.type = ReadErrorType(proto.error_response().type());
        response.errorMessage = proto.error_response().error_message();
        if (proto.error_response().has_retry_info()) {
            response.retryAfterNanoseconds = proto.error_response().retry_info().retry_after_nanoseconds();
        }
        out.errorResponse = std::move(response);
    }
    if (proto.has_remote_config()) {
        out.remoteConfig = AgentRemoteConfig{ReadConfigMap(proto.remote_config().config()), proto.remote_config().config_hash()};
    }
    if (proto.has_connection_settings()) {
        out.connectionSettings = ReadOffers(proto.connection_settings());
    }
    if (proto.has_packages_available()) {
        out.packagesAvailable = ReadPackages(proto.packages_available());
    }
    if (proto.has_agent_identification()) {
        out.newInstanceUid = proto.agent_identification().new_instance_uid();
    }
    if (proto.has_command()) {
        if (proto.command().type() == opamp::proto::CommandType_Restart) {
            out.command = ServerToAgentCommand{CommandType::Restart};
        } else {
            ++out.unknownFieldCount;
        }
    }
    if (proto.has_custom_capabilities()) {
        CustomCapabilities capabilities;
        capabilities.capabilities.assign(
            proto.custom_capabilities().capabilities().begin(), proto.custom_capabilities().capabilities().end());
        out.customCapabilities = std::move(capabilities);
    }
    if (proto.has_custom_message()) {
        out.customMessage = CustomMessage{
            proto.custom_message().capability(), proto.custom_message().type(), proto.custom_message().data()};
    }

    out.unknownFieldCount += proto.GetReflection()->GetUnknownFields(proto).field_count();
}
