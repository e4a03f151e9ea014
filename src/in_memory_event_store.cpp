#include "chronicle/in_memory_event_store.hpp"

#include <algorithm>
#include <new>
#include "chronicle/logging.hpp"

namespace chronicle {

namespace {

constexpr const char* COMPONENT = "event-store";

} // anonymous namespace

InMemoryEventStore::InMemoryEventStore(std::size_t page_size)
    : page_size_(page_size == 0 ? 256 : page_size) {}

std::shared_ptr<InMemoryEventStore::StreamSlot>
InMemoryEventStore::find_slot(const std::string& stream_id) const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto it = slots_.find(stream_id);
    return it != slots_.end() ? it->second : nullptr;
}

std::shared_ptr<InMemoryEventStore::StreamSlot>
InMemoryEventStore::get_or_create_slot(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    auto& slot = slots_[stream_id];
    if (!slot) {
        slot = std::make_shared<StreamSlot>();
    }
    return slot;
}

AppendResult InMemoryEventStore::validate(const std::string& stream_id,
                                          const std::vector<NewEvent>& events) const {
    if (stream_id.empty()) {
        return AppendResult::failure(stream_id, ErrorKind::ValidationError,
                                     "stream_id must not be empty");
    }
    if (events.empty()) {
        return AppendResult::failure(stream_id, ErrorKind::ValidationError,
                                     "append requires at least one event");
    }

    std::unordered_set<std::string> batch_ids;
    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto& event = events[i];
        auto where = "event " + std::to_string(i) + " of stream " + stream_id;
        if (event.event_type.empty()) {
            return AppendResult::failure(stream_id, ErrorKind::ValidationError,
                                         where + " has no event_type");
        }
        if (event.payload.type_url().empty()) {
            return AppendResult::failure(stream_id, ErrorKind::ValidationError,
                                         where + " has no payload type");
        }
        if (!event.event_id.empty() && !batch_ids.insert(event.event_id).second) {
            return AppendResult::failure(stream_id, ErrorKind::ValidationError,
                                         "duplicate event_id in batch: " + event.event_id);
        }
    }
    return AppendResult::success(stream_id, 0, 0, 0);
}

AppendResult InMemoryEventStore::append(const std::string& stream_id,
                                        uint64_t expected_version,
                                        const std::vector<NewEvent>& events) {
    auto invalid = validate(stream_id, events);
    if (!invalid.ok()) {
        return invalid;
    }

    auto slot = get_or_create_slot(stream_id);
    std::unique_lock<std::mutex> append_lock(slot->append_mutex);

    // Only appenders holding append_mutex modify slot->events.
    const uint64_t current = slot->events.size();
    if (expected_version != kAnyVersion && expected_version != current) {
        return AppendResult::version_conflict(stream_id, expected_version, current);
    }

    std::vector<std::shared_ptr<EventRecord>> records;
    records.reserve(events.size());
    auto timestamp = helpers::now();
    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto& pending = events[i];
        auto record = std::make_shared<EventRecord>();
        record->set_event_id(pending.event_id.empty() ? helpers::generate_uuid()
                                                      : pending.event_id);
        record->set_stream_id(stream_id);
        record->set_event_type(pending.event_type);
        record->set_stream_version(current + i + 1);
        *record->mutable_timestamp() = timestamp;
        record->set_causation_id(pending.causation_id);
        record->set_correlation_id(pending.correlation_id);
        for (const auto& [key, value] : pending.metadata) {
            (*record->mutable_metadata())[key] = value;
        }
        *record->mutable_payload() = pending.payload;
        records.push_back(std::move(record));
    }

    uint64_t first_position = 0;
    uint64_t last_position = 0;
    {
        std::unique_lock<std::shared_mutex> log_lock(log_mutex_);
        for (const auto& record : records) {
            if (event_ids_.count(record->event_id()) > 0) {
                return AppendResult::failure(stream_id, ErrorKind::ValidationError,
                                             "event_id already committed: " + record->event_id());
            }
        }

        try {
            log_.reserve(log_.size() + records.size());
            slot->events.reserve(slot->events.size() + records.size());
            event_ids_.reserve(event_ids_.size() + records.size());
        } catch (const std::bad_alloc&) {
            return AppendResult::failure(stream_id, ErrorKind::StorageFailure,
                                         "out of memory while appending to " + stream_id);
        }

        first_position = log_.size() + 1;
        for (auto& record : records) {
            record->set_global_position(log_.size() + 1);
            EventPtr committed = record;
            log_.push_back(committed);
            slot->events.push_back(committed);
            event_ids_.insert(committed->event_id());
        }
        last_position = log_.size();
    }
    append_lock.unlock();

    const uint64_t new_version = current + records.size();
    log_debug(COMPONENT, "events_appended", {
        {"stream_id", stream_id},
        {"version", new_version},
        {"first_position", first_position},
        {"last_position", last_position}
    });

    notify_listeners(last_position);
    publish_pending();

    return AppendResult::success(stream_id, new_version, first_position, last_position);
}

EventStream InMemoryEventStore::read_stream(const std::string& stream_id,
                                            uint64_t from_version) const {
    auto slot = find_slot(stream_id);
    uint64_t bound = 0;
    if (slot) {
        std::shared_lock<std::shared_mutex> lock(log_mutex_);
        bound = slot->events.size();
    }

    auto fetch = [this, slot, bound](uint64_t after, std::size_t limit) {
        EventPage page;
        page.cursor = after;
        if (!slot || after >= bound) {
            page.exhausted = true;
            return page;
        }
        uint64_t last = std::min<uint64_t>(bound, after + limit);
        std::shared_lock<std::shared_mutex> lock(log_mutex_);
        page.events.assign(slot->events.begin() + after, slot->events.begin() + last);
        page.cursor = last;
        page.exhausted = last >= bound;
        return page;
    };
    return EventStream(std::move(fetch), from_version, page_size_);
}

EventStream InMemoryEventStore::read_all(uint64_t from_position,
                                         uint64_t to_position,
                                         const EventTypeFilter& filter) const {
    uint64_t bound = std::min(to_position, head_position());

    auto fetch = [this, bound, filter](uint64_t after, std::size_t limit) {
        EventPage page;
        page.cursor = after;
        if (after >= bound) {
            page.exhausted = true;
            return page;
        }
        uint64_t last = std::min<uint64_t>(bound, after + limit);
        std::shared_lock<std::shared_mutex> lock(log_mutex_);
        for (uint64_t position = after + 1; position <= last; ++position) {
            const auto& event = log_[position - 1];
            if (filter.empty() || filter.count(event->event_type()) > 0) {
                page.events.push_back(event);
            }
        }
        page.cursor = last;
        page.exhausted = last >= bound;
        return page;
    };
    return EventStream(std::move(fetch), from_position, page_size_);
}

uint64_t InMemoryEventStore::stream_version(const std::string& stream_id) const {
    auto slot = find_slot(stream_id);
    if (!slot) return 0;
    std::shared_lock<std::shared_mutex> lock(log_mutex_);
    return slot->events.size();
}

uint64_t InMemoryEventStore::head_position() const {
    std::shared_lock<std::shared_mutex> lock(log_mutex_);
    return log_.size();
}

std::size_t InMemoryEventStore::stream_count() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    std::size_t count = 0;
    for (const auto& [id, slot] : slots_) {
        std::shared_lock<std::shared_mutex> log_lock(log_mutex_);
        if (!slot->events.empty()) ++count;
    }
    return count;
}

void InMemoryEventStore::add_publisher(std::shared_ptr<EventPublisher> publisher) {
    {
        std::lock_guard<std::mutex> lock(publish_mutex_);
        publishers_.push_back(std::move(publisher));
    }
    publish_pending();
}

uint64_t InMemoryEventStore::add_commit_listener(CommitListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto handle = next_listener_++;
    listeners_[handle] = std::move(listener);
    return handle;
}

void InMemoryEventStore::remove_commit_listener(uint64_t handle) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(handle);
}

uint64_t InMemoryEventStore::published_position() const {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    return published_through_;
}

void InMemoryEventStore::notify_listeners(uint64_t head) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    for (const auto& [handle, listener] : listeners_) {
        listener(head);
    }
}

void InMemoryEventStore::publish_pending() {
    std::unique_lock<std::mutex> lock(publish_mutex_);
    dispatch_requested_ = true;
    if (dispatching_) return;  // the dispatching thread picks up the new range

    dispatching_ = true;
    while (dispatch_requested_) {
        dispatch_requested_ = false;
        if (publishers_.empty()) break;
        auto publishers = publishers_;
        const uint64_t from = published_through_;

        lock.unlock();
        bool failed = false;
        const uint64_t reached = deliver(publishers, from, failed);
        lock.lock();

        published_through_ = reached;
        if (failed) break;
    }
    dispatch_requested_ = false;
    dispatching_ = false;
}

uint64_t InMemoryEventStore::deliver(const std::vector<std::shared_ptr<EventPublisher>>& publishers,
                                     uint64_t from, bool& failed) {
    const uint64_t head = head_position();
    uint64_t delivered = from;
    while (delivered < head) {
        const uint64_t last = std::min<uint64_t>(head, delivered + page_size_);
        std::vector<EventPtr> batch;
        {
            std::shared_lock<std::shared_mutex> log_lock(log_mutex_);
            batch.assign(log_.begin() + delivered, log_.begin() + last);
        }

        for (const auto& publisher : publishers) {
            try {
                publisher->publish(batch);
            } catch (const std::exception& e) {
                log_warn(COMPONENT, "publish_failed", {
                    {"publisher", publisher->name()},
                    {"from_position", delivered + 1},
                    {"to_position", last},
                    {"error", e.what()}
                });
                failed = true;
                return delivered;
            }
        }
        delivered = last;
    }
    return delivered;
}

} // namespace chronicle
