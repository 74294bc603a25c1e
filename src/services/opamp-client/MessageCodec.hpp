#pragma once

#include "Messages.hpp"

#include <memory>
#include <string>

class MessageCodec {
public:
    virtual ~MessageCodec() = default;

    virtual bool Encode(const AgentToServer& message, std::string& out, std::string& error) const = 0;
    virtual bool Decode(const std::string& body, ServerToAgent& out, std::string& error) const = 0;
    virtual const char* ContentType() const = 0;
};

// "protobuf" (default) or "json". Returns nullptr for anything else.
std::unique_ptr<MessageCodec> MakeCodec(const std::string& name);
