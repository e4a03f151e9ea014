#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "chronicle/types.pb.h"

namespace chronicle {

/**
 * Durable record of how far each projection has processed the global order.
 * One record per projection name; each record is written by its own worker.
 */
class CheckpointStore {
public:
    virtual ~CheckpointStore() = default;

    virtual std::optional<Checkpoint> load(const std::string& projection_name) const = 0;

    /**
     * @throws StorageError on backend faults
     */
    virtual void save(const Checkpoint& checkpoint) = 0;
};

class InMemoryCheckpointStore : public CheckpointStore {
public:
    std::optional<Checkpoint> load(const std::string& projection_name) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = checkpoints_.find(projection_name);
        if (it == checkpoints_.end()) return std::nullopt;
        return it->second;
    }

    void save(const Checkpoint& checkpoint) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkpoints_[checkpoint.projection_name()] = checkpoint;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Checkpoint> checkpoints_;
};

/**
 * Events a projection handler failed on, kept for operators.
 */
class DeadLetterStore {
public:
    virtual ~DeadLetterStore() = default;

    virtual void record(const DeadLetter& letter) = 0;

    virtual std::vector<DeadLetter> list(const std::string& projection_name) const = 0;

    /**
     * @return Number of records removed
     */
    virtual std::size_t clear(const std::string& projection_name) = 0;
};

class InMemoryDeadLetterStore : public DeadLetterStore {
public:
    void record(const DeadLetter& letter) override {
        std::lock_guard<std::mutex> lock(mutex_);
        letters_[letter.projection_name()].push_back(letter);
    }

    std::vector<DeadLetter> list(const std::string& projection_name) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = letters_.find(projection_name);
        if (it == letters_.end()) return {};
        return it->second;
    }

    std::size_t clear(const std::string& projection_name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = letters_.find(projection_name);
        if (it == letters_.end()) return 0;
        auto removed = it->second.size();
        letters_.erase(it);
        return removed;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<DeadLetter>> letters_;
};

} // namespace chronicle
