#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include "chronicle/event.hpp"
#include "chronicle/helpers.hpp"
#include "chronicle/logging.hpp"
#include "chronicle/runtime_context.hpp"

namespace chronicle {

/**
 * Loads and saves aggregates by combining snapshots with event replay.
 *
 * save() is synchronous and never retries: a VersionConflict is handed back
 * unchanged and the caller reloads and reapplies its command. Snapshots are
 * handed to the runtime's SnapshotWriter every `snapshot_interval` committed
 * events and never affect the outcome of save().
 *
 * Example:
 *   AggregateRepository<Account> accounts(runtime);
 *   auto account = accounts.load("acc-1");
 *   account.withdraw(250);
 *   auto result = accounts.save(account);
 *   if (result.is_version_conflict()) { ... reload and retry ... }
 */
template<typename AggregateT>
class AggregateRepository {
public:
    using State = typename AggregateT::State;

    explicit AggregateRepository(RuntimeContext& runtime)
        : AggregateRepository(runtime, runtime.config().snapshot_interval) {}

    AggregateRepository(RuntimeContext& runtime, uint64_t snapshot_interval)
        : runtime_(runtime), snapshot_interval_(snapshot_interval) {}

    uint64_t snapshot_interval() const { return snapshot_interval_; }

    /**
     * Reconstruct the current state of a stream. A stream with no events
     * yields an aggregate with version 0.
     * @throws StorageError if the stream cannot be read or decoded
     */
    AggregateT load(const std::string& stream_id) const {
        return load_at(stream_id, kLatestVersion);
    }

    /**
     * Reconstruct the state of a stream as of `version`.
     */
    AggregateT load_at(const std::string& stream_id, uint64_t version) const {
        AggregateT aggregate;
        aggregate.initialize(stream_id);

        uint64_t from_version = 0;
        auto snapshot = runtime_.snapshots().latest(stream_id, version);
        if (snapshot) {
            State state;
            if (snapshot->state().UnpackTo(&state)) {
                aggregate.restore(state, snapshot->version());
                from_version = snapshot->version();
            } else {
                log_warn(COMPONENT, "snapshot_unreadable", {
                    {"stream_id", stream_id},
                    {"version", snapshot->version()},
                    {"type", snapshot->state().type_url()}
                });
            }
        }

        for (const auto& record : runtime_.events().read_stream(stream_id, from_version)) {
            if (record.stream_version() > version) break;
            aggregate.replay(record);
        }
        return aggregate;
    }

    /**
     * Append the aggregate's pending events at the version it was loaded at.
     */
    AppendResult save(AggregateT& aggregate) {
        const uint64_t loaded_version = aggregate.version();
        if (!aggregate.has_pending_events()) {
            return AppendResult::success(aggregate.id(), loaded_version, 0, 0);
        }

        AppendResult result = append(aggregate, loaded_version);
        if (!result.ok()) {
            log_info(COMPONENT, "save_rejected", {
                {"stream_id", aggregate.id()},
                {"error", error_kind_name(result.error())},
                {"reason", result.message()}
            });
            return result;
        }

        aggregate.mark_committed(result.version());
        maybe_snapshot(aggregate, loaded_version);
        return result;
    }

private:
    static constexpr const char* COMPONENT = "repository";

    AppendResult append(const AggregateT& aggregate, uint64_t expected_version) {
        try {
            return runtime_.events().append(aggregate.id(), expected_version,
                                            aggregate.pending_events());
        } catch (const StorageError& e) {
            return AppendResult::failure(aggregate.id(), ErrorKind::StorageFailure, e.what());
        }
    }

    void maybe_snapshot(const AggregateT& aggregate, uint64_t previous_version) {
        if (snapshot_interval_ == 0) return;
        if (previous_version / snapshot_interval_ == aggregate.version() / snapshot_interval_) {
            return;
        }

        SnapshotRecord snapshot;
        snapshot.set_stream_id(aggregate.id());
        snapshot.set_version(aggregate.version());
        *snapshot.mutable_state() = helpers::pack_any(aggregate.state());
        *snapshot.mutable_timestamp() = helpers::now();
        runtime_.snapshot_writer().submit(std::move(snapshot));
    }

    RuntimeContext& runtime_;
    uint64_t snapshot_interval_;
};

} // namespace chronicle
