#include "chronicle/snapshot_store.hpp"

#include <iterator>

#include "chronicle/errors.hpp"
#include "chronicle/helpers.hpp"

namespace chronicle {

void InMemorySnapshotStore::save(const SnapshotRecord& snapshot) {
    if (snapshot.stream_id().empty()) {
        throw ValidationError("snapshot stream_id must not be empty");
    }
    if (snapshot.version() == 0) {
        throw ValidationError("snapshot version must be at least 1");
    }
    uint64_t committed = events_.stream_version(snapshot.stream_id());
    if (snapshot.version() > committed) {
        throw ValidationError("snapshot version " + std::to_string(snapshot.version()) +
                              " exceeds committed version " + std::to_string(committed) +
                              " of stream " + snapshot.stream_id());
    }

    SnapshotRecord stored = snapshot;
    if (!stored.has_timestamp()) {
        *stored.mutable_timestamp() = helpers::now();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_[stored.stream_id()][stored.version()] = std::move(stored);
}

std::optional<SnapshotRecord> InMemorySnapshotStore::latest(const std::string& stream_id,
                                                            uint64_t max_version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find(stream_id);
    if (it == snapshots_.end() || it->second.empty()) {
        return std::nullopt;
    }
    const auto& versions = it->second;
    auto upper = versions.upper_bound(max_version);
    if (upper == versions.begin()) {
        return std::nullopt;
    }
    return std::prev(upper)->second;
}

std::size_t InMemorySnapshotStore::prune(const std::string& stream_id, std::size_t keep) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find(stream_id);
    if (it == snapshots_.end()) return 0;

    auto& versions = it->second;
    std::size_t removed = 0;
    while (versions.size() > keep) {
        versions.erase(versions.begin());
        ++removed;
    }
    return removed;
}

std::size_t InMemorySnapshotStore::count(const std::string& stream_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find(stream_id);
    return it == snapshots_.end() ? 0 : it->second.size();
}

} // namespace chronicle
