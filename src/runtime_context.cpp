#include "chronicle/runtime_context.hpp"

#include "chronicle/errors.hpp"
#include "chronicle/in_memory_event_store.hpp"
#include "chronicle/logging.hpp"

namespace chronicle {

namespace {

constexpr const char* COMPONENT = "runtime";

} // anonymous namespace

RuntimeContext::RuntimeContext(RuntimeConfig config)
    : config_(std::move(config)) {
    config_.validate();
    auto events = std::make_shared<InMemoryEventStore>(config_.read_page_size);
    events_ = events;
    snapshots_ = std::make_shared<InMemorySnapshotStore>(*events);
    checkpoints_ = std::make_shared<InMemoryCheckpointStore>();
    dead_letters_ = std::make_shared<InMemoryDeadLetterStore>();
    snapshot_writer_ = std::make_unique<SnapshotWriter>(*snapshots_, config_.snapshot_queue_capacity);
}

RuntimeContext::RuntimeContext(RuntimeConfig config,
                               std::shared_ptr<EventStore> events,
                               std::shared_ptr<SnapshotStore> snapshots,
                               std::shared_ptr<CheckpointStore> checkpoints,
                               std::shared_ptr<DeadLetterStore> dead_letters)
    : config_(std::move(config)),
      events_(std::move(events)),
      snapshots_(std::move(snapshots)),
      checkpoints_(std::move(checkpoints)),
      dead_letters_(std::move(dead_letters)) {
    config_.validate();
    if (!events_ || !snapshots_ || !checkpoints_ || !dead_letters_) {
        throw ValidationError("RuntimeContext requires all stores");
    }
    snapshot_writer_ = std::make_unique<SnapshotWriter>(*snapshots_, config_.snapshot_queue_capacity);
}

RuntimeContext::~RuntimeContext() {
    stop();
}

void RuntimeContext::start() {
    if (running_.exchange(true)) return;
    set_log_level(config_.log_level);
    snapshot_writer_->start();
    log_info(COMPONENT, "runtime_started", config_.to_json());
}

void RuntimeContext::stop() {
    if (!running_.exchange(false)) return;
    snapshot_writer_->stop();
    log_info(COMPONENT, "runtime_stopped", {
        {"snapshots_written", snapshot_writer_->written()},
        {"snapshots_failed", snapshot_writer_->failed()}
    });
}

} // namespace chronicle
