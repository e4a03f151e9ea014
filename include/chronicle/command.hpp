#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <grpcpp/grpcpp.h>
#include "chronicle/errors.hpp"
#include "chronicle/event.hpp"
#include "chronicle/repository.hpp"

namespace chronicle {

enum class CommandOutcome {
    Success,
    VersionConflict,
    ValidationError,
    StorageFailure
};

/**
 * What an external caller receives for a submitted command.
 */
struct CommandResult {
    CommandOutcome outcome = CommandOutcome::Success;
    uint64_t new_version = 0;
    std::string message;

    bool ok() const { return outcome == CommandOutcome::Success; }

    static CommandResult success(uint64_t version) {
        return {CommandOutcome::Success, version, ""};
    }

    static CommandResult from_append(const AppendResult& result) {
        switch (result.error()) {
            case ErrorKind::None:
                return success(result.version());
            case ErrorKind::VersionConflict:
                return {CommandOutcome::VersionConflict, result.version(), result.message()};
            case ErrorKind::ValidationError:
                return {CommandOutcome::ValidationError, 0, result.message()};
            default:
                return {CommandOutcome::StorageFailure, 0, result.message()};
        }
    }

    grpc::Status to_grpc_status() const {
        switch (outcome) {
            case CommandOutcome::Success:
                return grpc::Status::OK;
            case CommandOutcome::VersionConflict:
                return grpc::Status(to_grpc_code(ErrorKind::VersionConflict), message);
            case CommandOutcome::ValidationError:
                return grpc::Status(to_grpc_code(ErrorKind::ValidationError), message);
            case CommandOutcome::StorageFailure:
                return grpc::Status(to_grpc_code(ErrorKind::StorageFailure), message);
        }
        return grpc::Status(grpc::StatusCode::UNKNOWN, message);
    }
};

/**
 * Load an aggregate, run a command against it and save the resulting events.
 *
 * `decide` receives the loaded aggregate and raises events on it; it rejects
 * the command by throwing ValidationError. Conflicts are reported, not
 * retried.
 *
 * Example:
 *   auto result = execute_command(accounts, "acc-1", [](Account& account) {
 *       account.withdraw(250);
 *   });
 */
template<typename AggregateT, typename Decide>
CommandResult execute_command(AggregateRepository<AggregateT>& repository,
                              const std::string& stream_id,
                              Decide&& decide) {
    try {
        auto aggregate = repository.load(stream_id);
        std::forward<Decide>(decide)(aggregate);
        return CommandResult::from_append(repository.save(aggregate));
    } catch (const VersionConflictError& e) {
        return {CommandOutcome::VersionConflict, e.actual_version(), e.what()};
    } catch (const ValidationError& e) {
        return {CommandOutcome::ValidationError, 0, e.what()};
    } catch (const StorageError& e) {
        return {CommandOutcome::StorageFailure, 0, e.what()};
    }
}

/**
 * As above, but rejects the command up front when the stream has moved past
 * the version the caller based its decision on.
 */
template<typename AggregateT, typename Decide>
CommandResult execute_command(AggregateRepository<AggregateT>& repository,
                              const std::string& stream_id,
                              uint64_t expected_version,
                              Decide&& decide) {
    return execute_command(repository, stream_id,
        [&](AggregateT& aggregate) {
            if (aggregate.version() != expected_version) {
                throw VersionConflictError(stream_id, expected_version, aggregate.version());
            }
            std::forward<Decide>(decide)(aggregate);
        });
}

} // namespace chronicle
