// File: src/core/errors.cpp
#include "core/errors.hpp"

namespace engram {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "ValidationError";
        case ErrorKind::NOT_FOUND: return "NotFoundError";
        case ErrorKind::DIMENSION_MISMATCH: return "DimensionMismatch";
        case ErrorKind::UPSTREAM_UNAVAILABLE: return "UpstreamUnavailable";
        case ErrorKind::CORRUPTED_STATE: return "CorruptedState";
        case ErrorKind::INVALID_RECORD_STATE: return "InvalidRecordState";
        case ErrorKind::CANCELLED: return "OperationCancelled";
        default: return "UnknownError";
    }
}

const char* ToString(UpstreamKind kind) {
    switch (kind) {
        case UpstreamKind::UNAVAILABLE: return "UNAVAILABLE";
        case UpstreamKind::RATE_LIMITED: return "RATE_LIMITED";
        case UpstreamKind::TIMEOUT: return "TIMEOUT";
        case UpstreamKind::INVALID_RESPONSE: return "INVALID_RESPONSE";
        default: return "UNKNOWN";
    }
}

} // namespace engram
