#pragma once

#include "Messages.hpp"

#include "opamp.pb.h"

// Conversions between the client's message structs and the protoc classes.
// Both wire codecs go through them.
void ToProto(const AgentToServer& message, opamp::proto::AgentToServer& proto);

// Replaces `out`. Unknown protobuf fields and command types the client does
// not implement are counted in out.unknownFieldCount.
void FromProto(const opamp::proto::ServerToAgent& proto, ServerToAgent& out);
