#include "ProtobufCodec.hpp"
#include "JsonCodec.hpp"
#include "ProtoMapping.hpp"

bool ProtobufCodec::Encode(const AgentToServer& message, std::string& out, std::string& error) const {
    opamp::proto::AgentToServer proto;
    ToProto(message, proto);

    if (!proto.SerializeToString(&out)) {
        error = "failed to serialize AgentToServer";
        return false;
    }
    return true;
}

bool ProtobufCodec::Decode(const std::string& body, ServerToAgent& out, std::string& error) const {
    opamp::proto::ServerToAgent proto;
    if (!proto.ParseFromArray(body.data(), static_cast<int>(body.size()))) {
        error = "malformed ServerToAgent (" + std::to_string(body.size()) + " bytes)";
        return false;
    }

    FromProto(proto, out);
    return true;
}

const char* ProtobufCodec::ContentType() const {
    return "application/x-protobuf";
}

std::unique_ptr<MessageCodec> MakeCodec(const std::string& name) {
    if (name.empty() || name == "protobuf") {
        return std::make_unique<ProtobufCodec>();
    }
    if (name == "json") {
        return std::make_unique<JsonCodec>();
    }
    return nullptr;
}
