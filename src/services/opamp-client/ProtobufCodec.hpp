#pragma once

#include "MessageCodec.hpp"

// OpAMP binary wire format, backed by the protoc output of proto/opamp.proto.
class ProtobufCodec : public MessageCodec {
public:
    bool Encode(const AgentToServer& message, std::string& out, std::string& error) const override;
    bool Decode(const std::string& body, ServerToAgent& out, std::string& error) const override;
    const char* ContentType() const override;
};
