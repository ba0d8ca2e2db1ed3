// File: src/core/errors.hpp
//
// Error taxonomy for the engram engine.
//
// Every failure the engine reports to a caller is an EngramError subclass
// carrying an ErrorKind, so callers can branch on the kind without string
// matching. Configuration problems keep using std::invalid_argument.

#pragma once

#include <stdexcept>
#include <string>

namespace engram {

enum class ErrorKind {
    VALIDATION,           ///< Malformed input, rejected before any store call
    NOT_FOUND,            ///< Identifier unknown
    DIMENSION_MISMATCH,   ///< Embedding size mismatch
    UPSTREAM_UNAVAILABLE, ///< Store or language model unreachable, retryable
    CORRUPTED_STATE,      ///< Timestamp or hash invariant violated
    INVALID_RECORD_STATE, ///< Record cannot be scored (unknown tier, clock skew)
    CANCELLED,            ///< Caller aborted the operation
};

const char* ToString(ErrorKind kind);

/// Base class of all engine errors
class EngramError : public std::runtime_error {
public:
    EngramError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ValidationError : public EngramError {
public:
    explicit ValidationError(const std::string& message)
        : EngramError(ErrorKind::VALIDATION, message) {}
};

class NotFoundError : public EngramError {
public:
    explicit NotFoundError(const std::string& message)
        : EngramError(ErrorKind::NOT_FOUND, message) {}
};

class DimensionMismatch : public EngramError {
public:
    DimensionMismatch(size_t expected, size_t actual)
        : EngramError(ErrorKind::DIMENSION_MISMATCH,
                      "Embedding dimension mismatch: expected " + std::to_string(expected) +
                      ", got " + std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

/// Why an upstream call failed
enum class UpstreamKind {
    UNAVAILABLE,
    RATE_LIMITED,
    TIMEOUT,
    INVALID_RESPONSE,
};

const char* ToString(UpstreamKind kind);

class UpstreamUnavailable : public EngramError {
public:
    UpstreamUnavailable(UpstreamKind upstream_kind, const std::string& message)
        : EngramError(ErrorKind::UPSTREAM_UNAVAILABLE,
                      std::string(ToString(upstream_kind)) + ": " + message),
          upstream_kind_(upstream_kind) {}

    UpstreamKind upstream_kind() const { return upstream_kind_; }

    /// INVALID_RESPONSE will not improve on retry
    bool IsRetryable() const { return upstream_kind_ != UpstreamKind::INVALID_RESPONSE; }

private:
    UpstreamKind upstream_kind_;
};

class CorruptedState : public EngramError {
public:
    explicit CorruptedState(const std::string& message)
        : EngramError(ErrorKind::CORRUPTED_STATE, message) {}
};

class InvalidRecordState : public EngramError {
public:
    explicit InvalidRecordState(const std::string& message)
        : EngramError(ErrorKind::INVALID_RECORD_STATE, message) {}
};

class OperationCancelled : public EngramError {
public:
    explicit OperationCancelled(const std::string& message)
        : EngramError(ErrorKind::CANCELLED, message) {}
};

} // namespace engram
