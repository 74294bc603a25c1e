#include "ClientResult.hpp"

#include <utility>

const char* ToString(ClientErrorCode code) {
    switch (code) {
        case ClientErrorCode::Ok: return "Ok";
        case ClientErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case ClientErrorCode::AlreadyStarted: return "AlreadyStarted";
        case ClientErrorCode::AlreadyStopped: return "AlreadyStopped";
        case ClientErrorCode::NotRunning: return "NotRunning";
        case ClientErrorCode::InvalidArgument: return "InvalidArgument";
        case ClientErrorCode::MissingCapability: return "MissingCapability";
        case ClientErrorCode::Busy: return "Busy";
        case ClientErrorCode::StartFailed: return "StartFailed";
    }
    return "Unknown";
}

ClientResult ClientResult::Success() {
    return ClientResult{};
}

ClientResult ClientResult::Failure(ClientErrorCode code, std::string message) {
    ClientResult result;
    result.code = code;
    result.message = std::move(message);
    return result;
}

bool ClientResult::IsOk() const {
    return code == ClientErrorCode::Ok;
}

ClientResult::operator bool() const {
    return IsOk();
}
