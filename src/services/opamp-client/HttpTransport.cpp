#include "HttpTransport.hpp"

const char* ToString(TransportErrorCode code) {
    switch (code) {
        case TransportErrorCode::None: return "none";
        case TransportErrorCode::ConnectionFailed: return "connection-failed";
        case TransportErrorCode::Timeout: return "timeout";
        case TransportErrorCode::Cancelled: return "cancelled";
        case TransportErrorCode::Other: return "other";
    }
    return "unknown";
}
