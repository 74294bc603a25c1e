#pragma once

#include "MessageCodec.hpp"

// Protobuf JSON mapping of the OpAMP messages: camelCase keys, byte fields
// base64, 64-bit integers as decimal strings, enums by name. Replies may use
// numbers for 64-bit fields and either base64 alphabet.
class JsonCodec : public MessageCodec {
public:
    bool Encode(const AgentToServer& message, std::string& out, std::string& error) const override;
    bool Decode(const std::string& body, ServerToAgent& out, std::string& error) const override;
    const char* ContentType() const override;
};
