#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <google/protobuf/any.pb.h>
#include "chronicle/types.pb.h"
#include "chronicle/errors.hpp"
#include "chronicle/helpers.hpp"

namespace chronicle {

/// Committed events are shared, never copied, between the store and readers.
using EventPtr = std::shared_ptr<const EventRecord>;

/// Set of event types a reader is interested in; empty means all.
using EventTypeFilter = std::set<std::string>;

/// Skip the optimistic-concurrency check on append.
constexpr uint64_t kAnyVersion = std::numeric_limits<uint64_t>::max();

/// Upper bound for read_all meaning "the head at the time of the call".
constexpr uint64_t kEndOfLog = std::numeric_limits<uint64_t>::max();

/**
 * An event that has not been committed yet.
 *
 * The store assigns stream version, global position and timestamp; it also
 * fills event_id when left empty.
 */
struct NewEvent {
    std::string event_type;
    google::protobuf::Any payload;
    std::string event_id;
    std::string causation_id;
    std::string correlation_id;
    std::map<std::string, std::string> metadata;

    /**
     * Build a pending event from a protobuf message. For tagged-union
     * messages the type is the name of the member that is set.
     */
    template<typename T>
    static NewEvent of(const T& message) {
        NewEvent event;
        event.event_type = helpers::oneof_type_name(message);
        event.payload = helpers::pack_any(message);
        return event;
    }
};

/**
 * Outcome of EventStore::append.
 *
 * Write-path failures come back as values; throw_if_error() converts them to
 * the matching ChronicleError for callers that prefer exceptions.
 */
class AppendResult {
public:
    static AppendResult success(const std::string& stream_id, uint64_t version,
                                uint64_t first_position, uint64_t last_position) {
        AppendResult result;
        result.stream_id_ = stream_id;
        result.version_ = version;
        result.first_position_ = first_position;
        result.last_position_ = last_position;
        return result;
    }

    static AppendResult version_conflict(const std::string& stream_id, uint64_t expected,
                                         uint64_t actual) {
        VersionConflictError error(stream_id, expected, actual);
        AppendResult result;
        result.stream_id_ = stream_id;
        result.kind_ = ErrorKind::VersionConflict;
        result.message_ = error.what();
        result.expected_version_ = expected;
        result.version_ = actual;
        return result;
    }

    static AppendResult failure(const std::string& stream_id, ErrorKind kind,
                                const std::string& message) {
        AppendResult result;
        result.stream_id_ = stream_id;
        result.kind_ = kind;
        result.message_ = message;
        return result;
    }

    bool ok() const { return kind_ == ErrorKind::None; }
    ErrorKind error() const { return kind_; }
    const std::string& message() const { return message_; }
    const std::string& stream_id() const { return stream_id_; }

    bool is_version_conflict() const { return kind_ == ErrorKind::VersionConflict; }
    bool is_validation_error() const { return kind_ == ErrorKind::ValidationError; }
    bool is_storage_failure() const { return kind_ == ErrorKind::StorageFailure; }

    /**
     * New stream version on success; the stream's actual version on conflict.
     */
    uint64_t version() const { return version_; }
    uint64_t expected_version() const { return expected_version_; }

    uint64_t first_position() const { return first_position_; }
    uint64_t last_position() const { return last_position_; }

    grpc::Status to_grpc_status() const {
        if (ok()) return grpc::Status::OK;
        return grpc::Status(to_grpc_code(kind_), message_);
    }

    void throw_if_error() const {
        switch (kind_) {
            case ErrorKind::None:
                return;
            case ErrorKind::VersionConflict:
                throw VersionConflictError(stream_id_, expected_version_, version_);
            case ErrorKind::ValidationError:
                throw ValidationError(message_);
            case ErrorKind::StorageFailure:
                throw StorageError(message_);
            default:
                throw ChronicleError(message_, kind_);
        }
    }

private:
    AppendResult() = default;

    std::string stream_id_;
    ErrorKind kind_ = ErrorKind::None;
    std::string message_;
    uint64_t version_ = 0;
    uint64_t expected_version_ = 0;
    uint64_t first_position_ = 0;
    uint64_t last_position_ = 0;
};

} // namespace chronicle
