#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace chronicle {

/**
 * Derived, rebuildable table owned by one projection.
 *
 * Rows are JSON documents keyed by string. Handlers mutate the table through
 * upsert/remove/update; queries read it through get/rows. All operations are
 * thread-safe, so partitioned handlers may write concurrently and readers may
 * query while the projection is tailing.
 */
class ReadModel {
public:
    std::optional<nlohmann::json> get(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rows_.find(key);
        if (it == rows_.end()) return std::nullopt;
        return it->second;
    }

    void upsert(const std::string& key, nlohmann::json value) {
        std::lock_guard<std::mutex> lock(mutex_);
        rows_[key] = std::move(value);
    }

    bool remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_.erase(key) > 0;
    }

    /**
     * Read-modify-write one row atomically. A missing row starts as null.
     */
    void update(const std::string& key, const std::function<void(nlohmann::json&)>& mutate) {
        std::lock_guard<std::mutex> lock(mutex_);
        mutate(rows_[key]);
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_.size();
    }

    /**
     * Copy of every row, ordered by key.
     */
    std::map<std::string, nlohmann::json> rows() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rows_;
    }

    /**
     * Highest global position whose batch has been fully applied. Events at or
     * below it are skipped when redelivered.
     */
    uint64_t applied_position() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return applied_position_;
    }

    void set_applied_position(uint64_t position) {
        std::lock_guard<std::mutex> lock(mutex_);
        applied_position_ = position;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, nlohmann::json> rows_;
    uint64_t applied_position_ = 0;
};

} // namespace chronicle
