#include "JsonCodec.hpp"
#include "ProtoMapping.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/util/json_util.h>
#include <nlohmann/json.hpp>

#include <utility>

namespace {
using nlohmann::json;
using google::protobuf::Descriptor;
using google::protobuf::FieldDescriptor;

// Outside every OpAMP enum; FromProto treats it like any unsupported value.
constexpr int kUnknownEnumNumber = 0x7fffffff;

int StripUnknown(json& object, const Descriptor& descriptor);

int StripFieldValue(json& value, const FieldDescriptor& field) {
    int unknown = 0;
    if (field.is_map()) {
        const FieldDescriptor* mapped = field.message_type()->map_value();
        if (mapped->cpp_type() != FieldDescriptor::CPPTYPE_MESSAGE || !value.is_object()) {
            return 0;
        }
        for (auto& entry : value.items()) {
            if (entry.value().is_object()) {
                unknown += StripUnknown(entry.value(), *mapped->message_type());
            }
        }
        return unknown;
    }
    if (field.is_repeated()) {
        if (value.is_array()) {
            for (auto& element : value) {
                if (element.is_object()) {
                    unknown += StripUnknown(element, *field.message_type());
                }
            }
        }
        return unknown;
    }
    if (value.is_object()) {
        unknown += StripUnknown(value, *field.message_type());
    }
    return unknown;
}

// Removes and counts the keys the schema does not define, so a newer server
// does not make the whole reply unreadable. Unknown enum names become a
// number no enum uses.
int StripUnknown(json& object, const Descriptor& descriptor) {
    int unknown = 0;
    for (auto it = object.begin(); it != object.end();) {
        const FieldDescriptor* field = descriptor.FindFieldByCamelcaseName(it.key());
        if (field == nullptr) {
            field = descriptor.FindFieldByName(it.key());
        }
        if (field == nullptr) {
            ++unknown;
            it = object.erase(it);
            continue;
        }

        json& value = it.value();
        if (field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE) {
            unknown += StripFieldValue(value, *field);
        } else if (field->cpp_type() == FieldDescriptor::CPPTYPE_ENUM && !field->is_repeated() && value.is_string()
                   && field->enum_type()->FindValueByName(value.get<std::string>()) == nullptr) {
            value = kUnknownEnumNumber;
        }
        ++it;
    }
    return unknown;
}
} // namespace

bool JsonCodec::Encode(const AgentToServer& message, std::string& out, std::string& error) const {
    opamp::proto::AgentToServer proto;
    ToProto(message, proto);

    google::protobuf::util::JsonPrintOptions options;
    const auto status = google::protobuf::util::MessageToJsonString(proto, &out, options);
    if (!status.ok()) {
        error = "failed to serialize AgentToServer: " + status.ToString();
        return false;
    }
    return true;
}

bool JsonCodec::Decode(const std::string& body, ServerToAgent& out, std::string& error) const {
    auto root = json::parse(body, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        error = "reply is not a JSON object";
        return false;
    }

    const int unknown = StripUnknown(root, *opamp::proto::ServerToAgent::descriptor());

    opamp::proto::ServerToAgent proto;
    const auto status = google::protobuf::util::JsonStringToMessage(root.dump(), &proto);
    if (!status.ok()) {
        error = "malformed ServerToAgent: " + status.ToString();
        return false;
    }

    FromProto(proto, out);
    out.unknownFieldCount += unknown;
    return true;
}

const char* JsonCodec::ContentType() const {
    return "application/json";
}
