#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "chronicle/types.pb.h"
#include "chronicle/event_store.hpp"

namespace chronicle {

constexpr uint64_t kLatestVersion = std::numeric_limits<uint64_t>::max();

/**
 * Periodic aggregate state checkpoints keyed by (stream_id, version).
 */
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    /**
     * Persist a snapshot.
     * @throws ValidationError if the version exceeds the committed stream version
     * @throws StorageError on backend faults
     */
    virtual void save(const SnapshotRecord& snapshot) = 0;

    /**
     * Latest snapshot of a stream with version <= max_version.
     */
    virtual std::optional<SnapshotRecord> latest(const std::string& stream_id,
                                                 uint64_t max_version = kLatestVersion) const = 0;

    /**
     * Drop all but the newest `keep` snapshots of a stream.
     * @return Number of snapshots removed
     */
    virtual std::size_t prune(const std::string& stream_id, std::size_t keep) = 0;
};

class InMemorySnapshotStore : public SnapshotStore {
public:
    explicit InMemorySnapshotStore(const EventStore& events) : events_(events) {}

    void save(const SnapshotRecord& snapshot) override;

    std::optional<SnapshotRecord> latest(const std::string& stream_id,
                                         uint64_t max_version = kLatestVersion) const override;

    std::size_t prune(const std::string& stream_id, std::size_t keep) override;

    std::size_t count(const std::string& stream_id) const;

private:
    const EventStore& events_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::map<uint64_t, SnapshotRecord>> snapshots_;
};

} // namespace chronicle
