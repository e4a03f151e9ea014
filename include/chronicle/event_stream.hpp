#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <vector>
#include "chronicle/event.hpp"

namespace chronicle {

/**
 * One page of events returned by a store scan.
 *
 * `cursor` is the key (stream version or global position) of the last record
 * the scan looked at, filtered out or not; the next page starts after it.
 */
struct EventPage {
    std::vector<EventPtr> events;
    uint64_t cursor = 0;
    bool exhausted = false;
};

/**
 * Lazy, finite, restartable sequence of committed events.
 *
 * Events are pulled page by page from the store as the iterator advances.
 * Calling begin() again restarts from the original starting point. The upper
 * bound is fixed by the store when the stream is created, so iteration always
 * terminates even while writers keep appending.
 *
 * Example:
 *   for (const auto& event : store.read_stream("acc-1")) {
 *       apply(state, event);
 *   }
 */
class EventStream {
public:
    using PageFetcher = std::function<EventPage(uint64_t after, std::size_t limit)>;

    EventStream(PageFetcher fetch, uint64_t start, std::size_t page_size)
        : fetch_(std::make_shared<PageFetcher>(std::move(fetch))),
          start_(start),
          page_size_(page_size == 0 ? 1 : page_size) {}

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = EventRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = const EventRecord*;
        using reference = const EventRecord&;

        iterator() = default;

        reference operator*() const { return *page_.events[index_]; }
        pointer operator->() const { return page_.events[index_].get(); }

        /**
         * Shared handle to the current record.
         */
        const EventPtr& ptr() const { return page_.events[index_]; }

        iterator& operator++() {
            ++index_;
            if (index_ >= page_.events.size()) {
                load_next();
            }
            return *this;
        }

        bool operator==(const iterator& other) const {
            return at_end() && other.at_end();
        }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class EventStream;

        iterator(std::shared_ptr<PageFetcher> fetch, uint64_t start, std::size_t page_size)
            : fetch_(std::move(fetch)), page_size_(page_size) {
            page_.cursor = start;
            load_next();
        }

        bool at_end() const { return !fetch_ || index_ >= page_.events.size(); }

        void load_next() {
            index_ = 0;
            while (true) {
                if (page_.exhausted) {
                    page_.events.clear();
                    fetch_.reset();
                    return;
                }
                page_ = (*fetch_)(page_.cursor, page_size_);
                if (!page_.events.empty()) return;
            }
        }

        std::shared_ptr<PageFetcher> fetch_;
        std::size_t page_size_ = 1;
        EventPage page_;
        std::size_t index_ = 0;
    };

    iterator begin() const { return iterator(fetch_, start_, page_size_); }
    iterator end() const { return iterator(); }

    /**
     * Materialize the remaining sequence. Intended for tests and small streams.
     */
    std::vector<EventRecord> to_vector() const {
        std::vector<EventRecord> result;
        for (const auto& event : *this) {
            result.push_back(event);
        }
        return result;
    }

private:
    std::shared_ptr<PageFetcher> fetch_;
    uint64_t start_;
    std::size_t page_size_;
};

} // namespace chronicle
