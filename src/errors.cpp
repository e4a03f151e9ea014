#include "chronicle/errors.hpp"

namespace chronicle {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::ValidationError: return "ValidationError";
        case ErrorKind::VersionConflict: return "VersionConflict";
        case ErrorKind::StorageFailure: return "StorageFailure";
        case ErrorKind::ProjectionHandlerError: return "ProjectionHandlerError";
        case ErrorKind::SagaStepFailure: return "SagaStepFailure";
        case ErrorKind::SagaCompensationFailure: return "SagaCompensationFailure";
    }
    return "Unknown";
}

grpc::StatusCode to_grpc_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return grpc::StatusCode::OK;
        case ErrorKind::ValidationError: return grpc::StatusCode::INVALID_ARGUMENT;
        case ErrorKind::VersionConflict: return grpc::StatusCode::ABORTED;
        case ErrorKind::StorageFailure: return grpc::StatusCode::UNAVAILABLE;
        case ErrorKind::ProjectionHandlerError: return grpc::StatusCode::INTERNAL;
        case ErrorKind::SagaStepFailure: return grpc::StatusCode::FAILED_PRECONDITION;
        case ErrorKind::SagaCompensationFailure: return grpc::StatusCode::INTERNAL;
    }
    return grpc::StatusCode::UNKNOWN;
}

} // namespace chronicle
