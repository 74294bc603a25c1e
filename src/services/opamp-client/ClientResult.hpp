#pragma once

#include <string>

enum class ClientErrorCode {
    Ok,
    InvalidConfiguration,
    AlreadyStarted,
    AlreadyStopped,
    NotRunning,
    InvalidArgument,
    MissingCapability,
    Busy,
    StartFailed
};

const char* ToString(ClientErrorCode code);

struct ClientResult {
    ClientErrorCode code = ClientErrorCode::Ok;
    std::string message;

    static ClientResult Success();
    static ClientResult Failure(ClientErrorCode code, std::string message);

    bool IsOk() const;
    explicit operator bool() const;
};
