#include "chronicle/snapshot_writer.hpp"

#include "chronicle/errors.hpp"
#include "chronicle/logging.hpp"

namespace chronicle {

namespace {

constexpr const char* COMPONENT = "snapshot-writer";

} // anonymous namespace

SnapshotWriter::SnapshotWriter(SnapshotStore& store, std::size_t capacity)
    : store_(store), capacity_(capacity) {}

SnapshotWriter::~SnapshotWriter() {
    stop();
}

void SnapshotWriter::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load()) return;
    queue_ = std::make_shared<BlockingQueue<SnapshotRecord>>(capacity_);
    worker_ = std::thread(&SnapshotWriter::run, this, queue_);
    running_.store(true);
}

void SnapshotWriter::stop() {
    std::shared_ptr<BlockingQueue<SnapshotRecord>> queue;
    std::thread worker;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        if (!running_.exchange(false)) return;
        queue = std::move(queue_);
        worker = std::move(worker_);
    }
    queue->close();
    if (worker.joinable()) {
        worker.join();
    }
    progress_cv_.notify_all();
}

bool SnapshotWriter::submit(SnapshotRecord snapshot) {
    std::shared_ptr<BlockingQueue<SnapshotRecord>> queue;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
        if (running_.load()) queue = queue_;
    }
    if (!queue) {
        dropped_.fetch_add(1);
        log_warn(COMPONENT, "snapshot_dropped",
                 {{"stream_id", snapshot.stream_id()}, {"reason", "writer not running"}});
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        ++submitted_;
    }
    auto stream_id = snapshot.stream_id();
    if (!queue->try_push(std::move(snapshot))) {
        dropped_.fetch_add(1);
        log_warn(COMPONENT, "snapshot_dropped",
                 {{"stream_id", stream_id}, {"reason", "queue full"}});
        finish_one();
        return false;
    }
    return true;
}

void SnapshotWriter::flush() {
    std::unique_lock<std::mutex> lock(progress_mutex_);
    progress_cv_.wait(lock, [this]() { return !running_.load() || finished_ >= submitted_; });
}

void SnapshotWriter::finish_one() {
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        ++finished_;
    }
    progress_cv_.notify_all();
}

void SnapshotWriter::run(std::shared_ptr<BlockingQueue<SnapshotRecord>> queue) {
    SnapshotRecord snapshot;
    while (queue->pop(snapshot)) {
        try {
            store_.save(snapshot);
            written_.fetch_add(1);
            log_debug(COMPONENT, "snapshot_written",
                      {{"stream_id", snapshot.stream_id()}, {"version", snapshot.version()}});
        } catch (const std::exception& e) {
            failed_.fetch_add(1);
            log_warn(COMPONENT, "snapshot_write_failed", {
                {"stream_id", snapshot.stream_id()},
                {"version", snapshot.version()},
                {"error", e.what()}
            });
        }
        finish_one();
    }
}

} // namespace chronicle
