#include "ClientCallbacks.hpp"

const char* ToString(ExchangeErrorKind kind) {
    switch (kind) {
        case ExchangeErrorKind::Transport: return "transport";
        case ExchangeErrorKind::HttpStatus: return "http-status";
        case ExchangeErrorKind::Encode: return "encode";
        case ExchangeErrorKind::Decode: return "decode";
    }
    return "unknown";
}
