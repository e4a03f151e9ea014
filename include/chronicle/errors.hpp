#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace chronicle {

/**
 * Error taxonomy shared by exceptions and result values.
 */
enum class ErrorKind {
    None,
    ValidationError,
    VersionConflict,
    StorageFailure,
    ProjectionHandlerError,
    SagaStepFailure,
    SagaCompensationFailure
};

const char* error_kind_name(ErrorKind kind);

/**
 * Map an error kind to the gRPC status code used at the command boundary.
 */
grpc::StatusCode to_grpc_code(ErrorKind kind);

/**
 * Base exception for all Chronicle runtime errors.
 */
class ChronicleError : public std::runtime_error {
public:
    ChronicleError(const std::string& message, ErrorKind kind)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    /**
     * Returns true if the command or event was malformed.
     */
    bool is_validation_error() const { return kind_ == ErrorKind::ValidationError; }

    /**
     * Returns true if an optimistic-concurrency check failed.
     */
    bool is_version_conflict() const { return kind_ == ErrorKind::VersionConflict; }

    /**
     * Returns true if the caller may retry the same request with backoff.
     */
    bool is_retryable() const { return kind_ == ErrorKind::StorageFailure; }

    /**
     * Returns true if the failure needs an operator to resolve it.
     */
    bool requires_operator() const { return kind_ == ErrorKind::SagaCompensationFailure; }

    grpc::Status to_grpc_status() const {
        return grpc::Status(to_grpc_code(kind_), what());
    }

private:
    ErrorKind kind_;
};

/**
 * Thrown when a command or event payload is malformed.
 * Nothing is persisted.
 */
class ValidationError : public ChronicleError {
public:
    explicit ValidationError(const std::string& message)
        : ChronicleError(message, ErrorKind::ValidationError) {}
};

/**
 * Thrown when a stream's current version differs from the expected one.
 * The caller must reload and resubmit.
 */
class VersionConflictError : public ChronicleError {
public:
    VersionConflictError(const std::string& stream_id, uint64_t expected, uint64_t actual)
        : ChronicleError("Version conflict on stream " + stream_id + ": expected " +
                         std::to_string(expected) + ", actual " + std::to_string(actual),
                         ErrorKind::VersionConflict),
          stream_id_(stream_id), expected_(expected), actual_(actual) {}

    const std::string& stream_id() const { return stream_id_; }
    uint64_t expected_version() const { return expected_; }
    uint64_t actual_version() const { return actual_; }

private:
    std::string stream_id_;
    uint64_t expected_;
    uint64_t actual_;
};

/**
 * Thrown by storage backends on I/O or transport faults.
 */
class StorageError : public ChronicleError {
public:
    explicit StorageError(const std::string& message)
        : ChronicleError(message, ErrorKind::StorageFailure) {}
};

/**
 * Business-logic fault inside a projection handler.
 */
class ProjectionHandlerError : public ChronicleError {
public:
    ProjectionHandlerError(const std::string& projection, const std::string& message)
        : ChronicleError("Projection " + projection + ": " + message,
                         ErrorKind::ProjectionHandlerError),
          projection_(projection) {}

    const std::string& projection() const { return projection_; }

private:
    std::string projection_;
};

/**
 * A saga step failed or timed out. Triggers compensation.
 */
class SagaStepError : public ChronicleError {
public:
    explicit SagaStepError(const std::string& message)
        : ChronicleError(message, ErrorKind::SagaStepFailure) {}
};

/**
 * A compensation action failed or timed out. Terminal.
 */
class SagaCompensationError : public ChronicleError {
public:
    explicit SagaCompensationError(const std::string& message)
        : ChronicleError(message, ErrorKind::SagaCompensationFailure) {}
};

} // namespace chronicle
