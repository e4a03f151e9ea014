#include "chronicle/projection_engine.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <thread>
#include "chronicle/errors.hpp"
#include "chronicle/helpers.hpp"
#include "chronicle/logging.hpp"

namespace chronicle {

namespace {
constexpr const char* COMPONENT = "projection";
} // namespace

const char* rebuild_result_name(RebuildResult result) {
    switch (result) {
        case RebuildResult::Completed: return "completed";
        case RebuildResult::Cancelled: return "cancelled";
        case RebuildResult::Failed: return "failed";
    }
    return "unknown";
}

/**
 * Tailing state of one projection.
 *
 * process_mutex_ serializes polling, rebuilding and resuming, so a rebuild
 * pauses live tailing and new events simply wait in the log. state_mutex_
 * guards what readers see: checkpoint, status and the current model.
 */
class ProjectionEngine::Worker {
public:
    Worker(RuntimeContext& runtime, std::string name, EventTypeFilter filter,
           ProjectionHandler handler, ProjectionOptions options)
        : runtime_(runtime),
          name_(std::move(name)),
          filter_(std::move(filter)),
          handler_(std::move(handler)),
          options_(options),
          model_(std::make_shared<ReadModel>()) {
        checkpoint_.set_projection_name(name_);
        checkpoint_.set_status(PROJECTION_IDLE);

        auto stored = runtime_.checkpoints().load(name_);
        if (stored) {
            checkpoint_ = *stored;
            if (checkpoint_.status() == PROJECTION_REBUILDING) {
                checkpoint_.set_status(PROJECTION_RUNNING);
            }
            log_info(COMPONENT, "checkpoint_restored", {
                {"projection", name_},
                {"position", checkpoint_.position()},
                {"status", ProjectionStatus_Name(checkpoint_.status())}
            });
        }
    }

    ~Worker() { stop(); }

    uint64_t poll() {
        std::lock_guard<std::mutex> process(process_mutex_);

        uint64_t from = 0;
        std::shared_ptr<ReadModel> model;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (checkpoint_.status() == PROJECTION_FAILED) return 0;
            from = checkpoint_.position();
            model = model_;
        }

        const uint64_t head = runtime_.events().head_position();
        if (from >= head) return 0;
        const uint64_t to = std::min<uint64_t>(head, from + options_.batch_size);

        uint64_t halted_at = apply_batch(*model, collect(from, to), nullptr);
        if (halted_at != 0) {
            halt(halted_at);
            return halted_at - 1 - from;
        }

        model->set_applied_position(to);
        advance(to);
        return to - from;
    }

    uint64_t catch_up() {
        uint64_t total = 0;
        while (true) {
            uint64_t advanced = poll();
            if (advanced == 0) break;
            total += advanced;
        }
        return total;
    }

    RebuildResult rebuild() {
        std::lock_guard<std::mutex> process(process_mutex_);
        cancel_.store(false);

        ProjectionStatus previous;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            previous = checkpoint_.status();
            checkpoint_.set_status(PROJECTION_REBUILDING);
        }

        const uint64_t head = runtime_.events().head_position();
        log_info(COMPONENT, "rebuild_started", {{"projection", name_}, {"head", head}});

        auto shadow = std::make_shared<ReadModel>();
        RebuildResult result = RebuildResult::Completed;
        uint64_t position = 0;
        try {
            while (position < head) {
                if (cancel_.load()) {
                    result = RebuildResult::Cancelled;
                    break;
                }
                const uint64_t to = std::min<uint64_t>(head, position + options_.batch_size);
                uint64_t halted_at = apply_batch(*shadow, collect(position, to), &cancel_);
                if (cancel_.load()) {
                    result = RebuildResult::Cancelled;
                    break;
                }
                if (halted_at != 0) {
                    result = RebuildResult::Failed;
                    break;
                }
                shadow->set_applied_position(to);
                position = to;
            }
        } catch (const ChronicleError& e) {
            log_error(COMPONENT, "rebuild_read_failed", {{"projection", name_}, {"error", e.what()}});
            result = RebuildResult::Failed;
        }

        if (result != RebuildResult::Completed) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                checkpoint_.set_status(previous);
            }
            progress_cv_.notify_all();
            log_warn(COMPONENT, "rebuild_abandoned", {
                {"projection", name_},
                {"result", rebuild_result_name(result)},
                {"reached", position}
            });
            return result;
        }

        Checkpoint committed;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            model_ = shadow;
            checkpoint_.set_position(head);
            checkpoint_.set_status(PROJECTION_RUNNING);
            committed = checkpoint_;
        }
        persist(committed);
        progress_cv_.notify_all();
        wake();

        log_info(COMPONENT, "rebuild_completed", {
            {"projection", name_},
            {"position", head},
            {"rows", shadow->size()}
        });
        return RebuildResult::Completed;
    }

    bool cancel_rebuild() {
        if (status() != PROJECTION_REBUILDING) return false;
        cancel_.store(true);
        return true;
    }

    void resume(bool skip_failed_event) {
        std::lock_guard<std::mutex> process(process_mutex_);
        Checkpoint committed;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (checkpoint_.status() != PROJECTION_FAILED) return;
            // A halted checkpoint sits just before the failing event.
            if (skip_failed_event) {
                checkpoint_.set_position(checkpoint_.position() + 1);
            }
            checkpoint_.set_status(PROJECTION_RUNNING);
            committed = checkpoint_;
        }
        persist(committed);
        log_info(COMPONENT, "projection_resumed", {
            {"projection", name_},
            {"position", committed.position()},
            {"skipped", skip_failed_event}
        });
        wake();
    }

    void start() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (checkpoint_.status() == PROJECTION_IDLE) {
                checkpoint_.set_status(PROJECTION_RUNNING);
            }
        }
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            stopping_ = false;
            wake_pending_ = true;
        }
        thread_ = std::thread(&Worker::run, this);
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            stopping_ = true;
        }
        wake_cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void wake() {
        {
            std::lock_guard<std::mutex> lock(wake_mutex_);
            wake_pending_ = true;
        }
        wake_cv_.notify_one();
    }

    ProjectionStatus status() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return checkpoint_.status();
    }

    Checkpoint checkpoint() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return checkpoint_;
    }

    std::shared_ptr<const ReadModel> model() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return model_;
    }

    bool wait_for(uint64_t position, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(state_mutex_);
        progress_cv_.wait_for(lock, timeout, [&] {
            return checkpoint_.position() >= position ||
                   checkpoint_.status() == PROJECTION_FAILED;
        });
        return checkpoint_.position() >= position;
    }

private:
    std::vector<EventPtr> collect(uint64_t from, uint64_t to) const {
        std::vector<EventPtr> batch;
        auto stream = runtime_.events().read_all(from, to, filter_);
        for (auto it = stream.begin(); it != stream.end(); ++it) {
            batch.push_back(it.ptr());
        }
        return batch;
    }

    /**
     * Deliver a batch, split across partitions by stream when configured.
     * @return Position of the event that halted the projection, or 0
     */
    uint64_t apply_batch(ReadModel& model, const std::vector<EventPtr>& batch,
                         const std::atomic<bool>* cancel) {
        if (options_.partitions <= 1 || batch.size() < 2) {
            return apply_partition(model, batch, cancel);
        }

        std::vector<std::vector<EventPtr>> partitions(options_.partitions);
        for (const auto& event : batch) {
            auto index = helpers::stream_hash(event->stream_id()) % options_.partitions;
            partitions[index].push_back(event);
        }

        std::vector<std::future<uint64_t>> running;
        for (const auto& partition : partitions) {
            if (partition.empty()) continue;
            running.push_back(std::async(std::launch::async, [this, &model, &partition, cancel] {
                return apply_partition(model, partition, cancel);
            }));
        }

        uint64_t halted_at = 0;
        for (auto& result : running) {
            uint64_t halted = result.get();
            if (halted != 0 && (halted_at == 0 || halted < halted_at)) {
                halted_at = halted;
            }
        }
        return halted_at;
    }

    uint64_t apply_partition(ReadModel& model, const std::vector<EventPtr>& events,
                             const std::atomic<bool>* cancel) {
        const uint64_t applied = model.applied_position();
        for (const auto& event : events) {
            if (cancel && cancel->load()) return 0;
            if (event->global_position() <= applied) continue;
            try {
                handler_(*event, model);
            } catch (const std::exception& e) {
                dead_letter(*event, e.what());
                if (options_.dead_letter_policy == DeadLetterPolicy::Halt) {
                    return event->global_position();
                }
            } catch (...) {
                dead_letter(*event, "unknown error");
                if (options_.dead_letter_policy == DeadLetterPolicy::Halt) {
                    return event->global_position();
                }
            }
        }
        return 0;
    }

    void dead_letter(const EventRecord& event, const std::string& error) {
        DeadLetter letter;
        letter.set_projection_name(name_);
        *letter.mutable_event() = event;
        letter.set_error(error);
        *letter.mutable_failed_at() = helpers::now();
        runtime_.dead_letters().record(letter);

        log_error(COMPONENT, "handler_failed", {
            {"projection", name_},
            {"event_id", event.event_id()},
            {"event_type", event.event_type()},
            {"stream_id", event.stream_id()},
            {"position", event.global_position()},
            {"error", error},
            {"policy", dead_letter_policy_name(options_.dead_letter_policy)}
        });
    }

    void advance(uint64_t position) {
        Checkpoint committed;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            checkpoint_.set_position(position);
            if (checkpoint_.status() == PROJECTION_IDLE) {
                checkpoint_.set_status(PROJECTION_RUNNING);
            }
            committed = checkpoint_;
        }
        persist(committed);
        progress_cv_.notify_all();
    }

    void halt(uint64_t failed_position) {
        Checkpoint committed;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            checkpoint_.set_position(failed_position - 1);
            checkpoint_.set_status(PROJECTION_FAILED);
            committed = checkpoint_;
        }
        persist(committed);
        progress_cv_.notify_all();
        log_error(COMPONENT, "projection_halted", {
            {"projection", name_},
            {"failed_position", failed_position}
        });
    }

    // A lost checkpoint write only means redelivery after restart.
    void persist(const Checkpoint& checkpoint) {
        try {
            runtime_.checkpoints().save(checkpoint);
        } catch (const StorageError& e) {
            log_warn(COMPONENT, "checkpoint_save_failed", {
                {"projection", name_},
                {"position", checkpoint.position()},
                {"error", e.what()}
            });
        }
    }

    void run() {
        const auto interval = runtime_.config().projection_poll_interval;
        log_debug(COMPONENT, "worker_started", {{"projection", name_}});
        while (true) {
            {
                std::unique_lock<std::mutex> lock(wake_mutex_);
                wake_cv_.wait_for(lock, interval, [this] { return wake_pending_ || stopping_; });
                if (stopping_) break;
                wake_pending_ = false;
            }
            try {
                while (!stop_requested() && poll() > 0) {
                }
            } catch (const ChronicleError& e) {
                log_error(COMPONENT, "poll_failed", {{"projection", name_}, {"error", e.what()}});
            } catch (const std::exception& e) {
                log_error(COMPONENT, "poll_failed", {
                    {"projection", name_},
                    {"error", e.what()},
                    {"error_type", "unexpected"}
                });
            }
        }
        log_debug(COMPONENT, "worker_stopped", {{"projection", name_}});
    }

    bool stop_requested() {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        return stopping_;
    }

    RuntimeContext& runtime_;
    const std::string name_;
    const EventTypeFilter filter_;
    const ProjectionHandler handler_;
    const ProjectionOptions options_;

    std::mutex process_mutex_;
    std::atomic<bool> cancel_{false};

    mutable std::mutex state_mutex_;
    mutable std::condition_variable progress_cv_;
    Checkpoint checkpoint_;
    std::shared_ptr<ReadModel> model_;

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool wake_pending_ = false;
    bool stopping_ = false;
    std::thread thread_;
};

ProjectionEngine::ProjectionEngine(RuntimeContext& runtime)
    : runtime_(runtime) {
    listener_handle_ = runtime_.events().add_commit_listener([this](uint64_t) {
        wake_all();
    });
}

ProjectionEngine::~ProjectionEngine() {
    runtime_.events().remove_commit_listener(listener_handle_);
    stop();
}

void ProjectionEngine::subscribe(const std::string& name, EventTypeFilter filter,
                                 ProjectionHandler handler) {
    subscribe(name, std::move(filter), std::move(handler),
              ProjectionOptions::from_config(runtime_.config()));
}

void ProjectionEngine::subscribe(const std::string& name, EventTypeFilter filter,
                                 ProjectionHandler handler, ProjectionOptions options) {
    if (name.empty()) {
        throw ValidationError("projection name must not be empty");
    }
    if (!handler) {
        throw ValidationError("projection " + name + " has no handler");
    }
    if (options.batch_size == 0) {
        throw ValidationError("projection " + name + " batch size must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (workers_.count(name) > 0) {
        throw ValidationError("projection " + name + " is already registered");
    }
    auto worker = std::make_unique<Worker>(runtime_, name, std::move(filter),
                                           std::move(handler), options);
    if (running_) {
        worker->start();
    }
    workers_.emplace(name, std::move(worker));
    log_info(COMPONENT, "projection_registered", {
        {"projection", name},
        {"partitions", options.partitions},
        {"policy", dead_letter_policy_name(options.dead_letter_policy)}
    });
}

void ProjectionEngine::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    for (auto& [name, worker] : workers_) {
        worker->start();
    }
    log_info(COMPONENT, "engine_started", {{"projections", workers_.size()}});
}

void ProjectionEngine::stop() {
    std::vector<Worker*> stopping;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
        for (auto& [name, worker] : workers_) {
            stopping.push_back(worker.get());
        }
    }
    // Joined outside the lock: a worker may be mid-poll waking others.
    for (auto* worker : stopping) {
        worker->stop();
    }
    log_info(COMPONENT, "engine_stopped");
}

bool ProjectionEngine::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void ProjectionEngine::catch_up() {
    std::vector<Worker*> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, worker] : workers_) {
            all.push_back(worker.get());
        }
    }
    for (auto* worker : all) {
        worker->catch_up();
    }
}

uint64_t ProjectionEngine::catch_up(const std::string& name) {
    return worker(name).catch_up();
}

RebuildResult ProjectionEngine::rebuild(const std::string& name) {
    return worker(name).rebuild();
}

std::future<RebuildResult> ProjectionEngine::rebuild_async(const std::string& name) {
    Worker& target = worker(name);
    return std::async(std::launch::async, [&target] { return target.rebuild(); });
}

bool ProjectionEngine::cancel_rebuild(const std::string& name) {
    return worker(name).cancel_rebuild();
}

void ProjectionEngine::resume(const std::string& name, bool skip_failed_event) {
    worker(name).resume(skip_failed_event);
}

ProjectionStatus ProjectionEngine::status(const std::string& name) const {
    return worker(name).status();
}

Checkpoint ProjectionEngine::checkpoint(const std::string& name) const {
    return worker(name).checkpoint();
}

std::shared_ptr<const ReadModel> ProjectionEngine::read_model(const std::string& name) const {
    return worker(name).model();
}

std::vector<DeadLetter> ProjectionEngine::dead_letters(const std::string& name) const {
    worker(name);
    return runtime_.dead_letters().list(name);
}

std::vector<std::string> ProjectionEngine::projections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, worker] : workers_) {
        names.push_back(name);
    }
    return names;
}

bool ProjectionEngine::wait_for(const std::string& name, uint64_t position,
                                std::chrono::milliseconds timeout) const {
    return worker(name).wait_for(position, timeout);
}

ProjectionEngine::Worker& ProjectionEngine::worker(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workers_.find(name);
    if (it == workers_.end()) {
        throw ValidationError("unknown projection " + name);
    }
    return *it->second;
}

void ProjectionEngine::wake_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, worker] : workers_) {
        worker->wake();
    }
}

} // namespace chronicle
