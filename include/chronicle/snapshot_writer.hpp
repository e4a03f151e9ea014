#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include "chronicle/blocking_queue.hpp"
#include "chronicle/snapshot_store.hpp"

namespace chronicle {

/**
 * Background worker that persists snapshots off the write path.
 *
 * submit() never blocks: when the queue is full the snapshot is dropped, the
 * next interval produces a fresh one. Write failures are logged and counted,
 * never propagated.
 */
class SnapshotWriter {
public:
    SnapshotWriter(SnapshotStore& store, std::size_t capacity);
    ~SnapshotWriter();

    SnapshotWriter(const SnapshotWriter&) = delete;
    SnapshotWriter& operator=(const SnapshotWriter&) = delete;

    void start();

    /**
     * Drain queued snapshots and join the worker.
     */
    void stop();

    bool running() const { return running_.load(); }

    /**
     * Queue a snapshot for writing.
     * @return false if it was dropped
     */
    bool submit(SnapshotRecord snapshot);

    /**
     * Wait until every snapshot submitted so far has been written or failed.
     * Returns immediately when the worker is not running.
     */
    void flush();

    uint64_t written() const { return written_.load(); }
    uint64_t failed() const { return failed_.load(); }
    uint64_t dropped() const { return dropped_.load(); }

private:
    void run(std::shared_ptr<BlockingQueue<SnapshotRecord>> queue);
    void finish_one();

    SnapshotStore& store_;
    std::size_t capacity_;
    std::mutex lifecycle_mutex_;  // guards queue_ and worker_
    std::shared_ptr<BlockingQueue<SnapshotRecord>> queue_;
    std::thread worker_;
    std::atomic<bool> running_{false};

    std::mutex progress_mutex_;
    std::condition_variable progress_cv_;
    uint64_t submitted_ = 0;
    uint64_t finished_ = 0;

    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace chronicle
