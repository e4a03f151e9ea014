#pragma once

#include <atomic>
#include <memory>
#include "chronicle/checkpoint_store.hpp"
#include "chronicle/config.hpp"
#include "chronicle/event_store.hpp"
#include "chronicle/snapshot_store.hpp"
#include "chronicle/snapshot_writer.hpp"

namespace chronicle {

/**
 * Owns the durable stores and background workers of one service.
 *
 * There is no ambient global state: the context is created at service start,
 * passed explicitly to every repository, projection engine and saga
 * coordinator, and stopped at shutdown.
 *
 * Example:
 *   RuntimeContext runtime(RuntimeConfig::load());
 *   runtime.start();
 *   AggregateRepository<Account> accounts(runtime);
 */
class RuntimeContext {
public:
    /**
     * Create a context backed by in-memory stores.
     */
    explicit RuntimeContext(RuntimeConfig config = {});

    /**
     * Create a context over caller-provided stores.
     */
    RuntimeContext(RuntimeConfig config,
                   std::shared_ptr<EventStore> events,
                   std::shared_ptr<SnapshotStore> snapshots,
                   std::shared_ptr<CheckpointStore> checkpoints,
                   std::shared_ptr<DeadLetterStore> dead_letters);

    ~RuntimeContext();

    RuntimeContext(const RuntimeContext&) = delete;
    RuntimeContext& operator=(const RuntimeContext&) = delete;

    void start();
    void stop();
    bool running() const { return running_.load(); }

    const RuntimeConfig& config() const { return config_; }

    EventStore& events() { return *events_; }
    const EventStore& events() const { return *events_; }
    SnapshotStore& snapshots() { return *snapshots_; }
    CheckpointStore& checkpoints() { return *checkpoints_; }
    DeadLetterStore& dead_letters() { return *dead_letters_; }
    SnapshotWriter& snapshot_writer() { return *snapshot_writer_; }

private:
    RuntimeConfig config_;
    std::shared_ptr<EventStore> events_;
    std::shared_ptr<SnapshotStore> snapshots_;
    std::shared_ptr<CheckpointStore> checkpoints_;
    std::shared_ptr<DeadLetterStore> dead_letters_;
    std::unique_ptr<SnapshotWriter> snapshot_writer_;
    std::atomic<bool> running_{false};
};

} // namespace chronicle
