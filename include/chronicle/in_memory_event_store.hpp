#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "chronicle/event_store.hpp"

namespace chronicle {

/**
 * EventStore kept in process memory.
 *
 * Each stream has its own append mutex, so appends to different streams only
 * meet in the short sequencer section that assigns global positions. Commit
 * listeners and publishers run after the stream lock is released; publishers
 * see batches in commit order and may themselves append to the store. Event
 * streams returned by the read methods refer to this store and must not
 * outlive it.
 */
class InMemoryEventStore : public EventStore {
public:
    explicit InMemoryEventStore(std::size_t page_size = 256);

    AppendResult append(const std::string& stream_id,
                        uint64_t expected_version,
                        const std::vector<NewEvent>& events) override;

    EventStream read_stream(const std::string& stream_id,
                            uint64_t from_version = 0) const override;

    EventStream read_all(uint64_t from_position = 0,
                         uint64_t to_position = kEndOfLog,
                         const EventTypeFilter& filter = {}) const override;

    uint64_t stream_version(const std::string& stream_id) const override;

    uint64_t head_position() const override;

    void add_publisher(std::shared_ptr<EventPublisher> publisher) override;

    uint64_t add_commit_listener(CommitListener listener) override;

    void remove_commit_listener(uint64_t handle) override;

    /**
     * Number of distinct streams.
     */
    std::size_t stream_count() const;

    /**
     * Global position up to which every publisher acknowledged delivery.
     */
    uint64_t published_position() const;

private:
    struct StreamSlot {
        std::mutex append_mutex;
        std::vector<EventPtr> events;  // guarded by log_mutex_
    };

    std::shared_ptr<StreamSlot> find_slot(const std::string& stream_id) const;
    std::shared_ptr<StreamSlot> get_or_create_slot(const std::string& stream_id);
    AppendResult validate(const std::string& stream_id, const std::vector<NewEvent>& events) const;
    void notify_listeners(uint64_t head);
    void publish_pending();
    uint64_t deliver(const std::vector<std::shared_ptr<EventPublisher>>& publishers,
                     uint64_t from, bool& failed);

    std::size_t page_size_;

    mutable std::mutex slots_mutex_;
    std::unordered_map<std::string, std::shared_ptr<StreamSlot>> slots_;

    mutable std::shared_mutex log_mutex_;
    std::vector<EventPtr> log_;
    std::unordered_set<std::string> event_ids_;

    // publish_mutex_ is never held while a publisher runs. At most one
    // appending thread delivers at a time (dispatching_), and it keeps going
    // until no further range was requested.
    mutable std::mutex publish_mutex_;
    std::vector<std::shared_ptr<EventPublisher>> publishers_;
    uint64_t published_through_ = 0;
    bool dispatching_ = false;
    bool dispatch_requested_ = false;

    std::mutex listeners_mutex_;
    std::map<uint64_t, CommitListener> listeners_;
    uint64_t next_listener_ = 1;
};

} // namespace chronicle
