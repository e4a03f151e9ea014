#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>
#include <google/protobuf/message.h>
#include "chronicle/types.pb.h"
#include "chronicle/errors.hpp"
#include "chronicle/event.hpp"

namespace chronicle {

/**
 * Base class for event-sourced aggregates.
 *
 * StateT is the protobuf message holding the aggregate state (it doubles as
 * the snapshot payload). EventT is a protobuf message with a single oneof
 * listing every event the aggregate emits; apply() switches on its case enum,
 * so an unhandled event type is a compile-time error under -Werror=switch.
 *
 * Usage:
 *   class Account : public Aggregate<AccountState, AccountEvent> {
 *   public:
 *       void withdraw(int64_t amount) {
 *           if (amount > state().balance()) throw ValidationError("Insufficient funds");
 *           AccountEvent event;
 *           event.mutable_withdrawn()->set_amount(amount);
 *           raise(event);
 *       }
 *
 *   protected:
 *       AccountState create_empty_state() const override { return AccountState{}; }
 *       void apply(AccountState& state, const AccountEvent& event) const override {
 *           switch (event.event_case()) { ... }
 *       }
 *   };
 */
template<typename StateT, typename EventT>
class Aggregate {
    static_assert(std::is_base_of<google::protobuf::Message, StateT>::value,
                  "aggregate state must be a protobuf message");
    static_assert(std::is_base_of<google::protobuf::Message, EventT>::value,
                  "aggregate events must be a protobuf message");

public:
    using State = StateT;
    using Event = EventT;

    virtual ~Aggregate() = default;

    const std::string& id() const { return id_; }

    /**
     * Committed version this instance was loaded at (or last saved at).
     */
    uint64_t version() const { return version_; }

    /**
     * Version the state was restored from a snapshot at; 0 for full replay.
     */
    uint64_t snapshot_version() const { return snapshot_version_; }

    /**
     * Number of events folded in by the last load.
     */
    uint64_t replayed_events() const { return replayed_; }

    /**
     * Check if the aggregate exists (has committed or pending events).
     */
    bool exists() const { return version_ > 0 || !pending_.empty(); }

    const StateT& state() const { return state_; }

    const std::vector<NewEvent>& pending_events() const { return pending_; }
    bool has_pending_events() const { return !pending_.empty(); }

    /**
     * Correlation and causation ids stamped onto subsequently raised events.
     */
    void set_trace(const std::string& correlation_id, const std::string& causation_id = "") {
        correlation_id_ = correlation_id;
        causation_id_ = causation_id;
    }

    // Runtime-facing hooks used by AggregateRepository.

    void initialize(const std::string& id) {
        id_ = id;
        state_ = create_empty_state();
        version_ = 0;
        snapshot_version_ = 0;
        replayed_ = 0;
        pending_.clear();
    }

    void restore(const StateT& snapshot_state, uint64_t version) {
        state_ = snapshot_state;
        version_ = version;
        snapshot_version_ = version;
    }

    /**
     * Fold one committed event into the state.
     * @throws StorageError on a version gap or an undecodable payload
     */
    void replay(const EventRecord& record) {
        if (record.stream_version() != version_ + 1) {
            throw StorageError("stream " + id_ + " expected version " +
                               std::to_string(version_ + 1) + " but read " +
                               std::to_string(record.stream_version()));
        }
        EventT event;
        if (!record.payload().UnpackTo(&event)) {
            throw StorageError("cannot decode " + record.event_type() + " at version " +
                               std::to_string(record.stream_version()) + " of " + id_);
        }
        apply(state_, event);
        version_ = record.stream_version();
        ++replayed_;
    }

    void mark_committed(uint64_t new_version) {
        version_ = new_version;
        pending_.clear();
    }

protected:
    virtual StateT create_empty_state() const = 0;

    /**
     * Pure, deterministic state transition.
     */
    virtual void apply(StateT& state, const EventT& event) const = 0;

    /**
     * Apply an event to the in-memory state and queue it for the next save.
     */
    void raise(const EventT& event) {
        auto pending = NewEvent::of(event);
        if (pending.event_type.empty()) {
            throw ValidationError("event has no member set");
        }
        pending.correlation_id = correlation_id_;
        pending.causation_id = causation_id_;
        apply(state_, event);
        pending_.push_back(std::move(pending));
    }

private:
    std::string id_;
    StateT state_;
    uint64_t version_ = 0;
    uint64_t snapshot_version_ = 0;
    uint64_t replayed_ = 0;
    std::vector<NewEvent> pending_;
    std::string correlation_id_;
    std::string causation_id_;
};

} // namespace chronicle
