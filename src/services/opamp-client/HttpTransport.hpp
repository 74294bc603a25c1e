#pragma once

#include "Messages.hpp"

#include <map>
#include <string>

using HttpHeaders = std::map<std::string, std::string>;

enum class TransportErrorCode {
    None,
    ConnectionFailed,
    Timeout,
    Cancelled,
    Other
};

const char* ToString(TransportErrorCode code);

struct TransportResponse {
    long statusCode = 0;
    std::string body;
    HttpHeaders headers;
    TransportErrorCode error = TransportErrorCode::None;
    std::string errorMessage;

    bool RequestOk() const { return error == TransportErrorCode::None; }
    bool StatusOk() const { return statusCode >= 200 && statusCode < 300; }
};

// One POST per AgentToServer message; the reply body carries ServerToAgent.
// Only the poll thread calls Post. Cancel may be called from any thread and
// makes an in-flight Post return with TransportErrorCode::Cancelled.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual TransportResponse Post(const std::string& body, const HttpHeaders& headers) = 0;
    virtual void Cancel() {}

    // Applies an accepted OpAMP connection offer. Returns false when the
    // transport cannot honour it.
    virtual bool Reconfigure(const OpampConnectionSettings& settings) { return true; }
};
