#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "chronicle/event.hpp"
#include "chronicle/event_stream.hpp"

namespace chronicle {

/**
 * External distribution channel for committed events (message bus or
 * equivalent). Receives batches in commit order; delivery is at-least-once,
 * so subscribers deduplicate on event_id.
 *
 * Throwing from publish() leaves the batch unacknowledged; it is offered
 * again after the next successful append.
 */
class EventPublisher {
public:
    virtual ~EventPublisher() = default;

    virtual std::string name() const = 0;

    virtual void publish(const std::vector<EventPtr>& batch) = 0;
};

/**
 * Called with the new head position after every successful append, on the
 * appending thread. Listeners must return quickly and must not append.
 */
using CommitListener = std::function<void(uint64_t head_position)>;

/**
 * Durable, append-only, per-stream ordered event log with a global order.
 *
 * Appends are serialized per stream only. Readers see a monotonically growing
 * committed prefix and never observe part of a batch.
 */
class EventStore {
public:
    virtual ~EventStore() = default;

    /**
     * Append a batch to a stream.
     *
     * On success the events get versions expected_version+1..expected_version+N
     * and consecutive global positions, and become visible atomically.
     *
     * @param stream_id Target stream; created by the first append
     * @param expected_version Version the caller last saw, or kAnyVersion
     * @param events One or more pending events
     * @return The new version, or VersionConflict / ValidationError / StorageFailure
     */
    virtual AppendResult append(const std::string& stream_id,
                                uint64_t expected_version,
                                const std::vector<NewEvent>& events) = 0;

    /**
     * Events of one stream with stream_version > from_version, in order.
     */
    virtual EventStream read_stream(const std::string& stream_id,
                                    uint64_t from_version = 0) const = 0;

    /**
     * Events of all streams with from_position < global_position <= to_position,
     * ordered by global position and restricted to `filter` when non-empty.
     */
    virtual EventStream read_all(uint64_t from_position = 0,
                                 uint64_t to_position = kEndOfLog,
                                 const EventTypeFilter& filter = {}) const = 0;

    /**
     * Current version of a stream; 0 if it has no events.
     */
    virtual uint64_t stream_version(const std::string& stream_id) const = 0;

    /**
     * Global position of the last committed event; 0 if the store is empty.
     */
    virtual uint64_t head_position() const = 0;

    virtual void add_publisher(std::shared_ptr<EventPublisher> publisher) = 0;

    /**
     * Register a wake-up hook.
     * @return Handle for remove_commit_listener()
     */
    virtual uint64_t add_commit_listener(CommitListener listener) = 0;

    virtual void remove_commit_listener(uint64_t handle) = 0;
};

} // namespace chronicle
