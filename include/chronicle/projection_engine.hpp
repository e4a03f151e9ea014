#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "chronicle/types.pb.h"
#include "chronicle/config.hpp"
#include "chronicle/event.hpp"
#include "chronicle/read_model.hpp"
#include "chronicle/runtime_context.hpp"

namespace chronicle {

/**
 * Folds one committed event into a projection's read model. Must be
 * idempotent: delivery is at-least-once. Throwing dead-letters the event.
 */
using ProjectionHandler = std::function<void(const EventRecord&, ReadModel&)>;

struct ProjectionOptions {
    DeadLetterPolicy dead_letter_policy = DeadLetterPolicy::Skip;
    std::size_t batch_size = 500;
    std::size_t partitions = 1;

    static ProjectionOptions from_config(const RuntimeConfig& config) {
        return {config.dead_letter_policy, config.projection_batch_size,
                config.projection_partitions};
    }
};

enum class RebuildResult { Completed, Cancelled, Failed };

const char* rebuild_result_name(RebuildResult result);

/**
 * Maintains named read models by tailing the event store.
 *
 * Each projection has its own checkpoint, read model and worker; a failure in
 * one never stalls another or the write path. Within a projection, events of
 * the same stream are always handled in stream order.
 *
 * Example:
 *   ProjectionEngine engine(runtime);
 *   engine.subscribe("order-summary", {"OrderPlaced", "OrderShipped"}, summarize);
 *   engine.start();
 *   ...
 *   auto rows = engine.read_model("order-summary")->rows();
 */
class ProjectionEngine {
public:
    explicit ProjectionEngine(RuntimeContext& runtime);
    ~ProjectionEngine();

    ProjectionEngine(const ProjectionEngine&) = delete;
    ProjectionEngine& operator=(const ProjectionEngine&) = delete;

    /**
     * Register a projection. A stored checkpoint for `name` is resumed.
     * @throws ValidationError if the name is empty or already registered
     */
    void subscribe(const std::string& name, EventTypeFilter filter, ProjectionHandler handler);
    void subscribe(const std::string& name, EventTypeFilter filter, ProjectionHandler handler,
                   ProjectionOptions options);

    /**
     * Launch one worker thread per projection.
     */
    void start();

    /**
     * Signal workers and join them. Checkpoints stay where they are.
     */
    void stop();

    bool running() const;

    /**
     * Drive every projection synchronously to the current head.
     */
    void catch_up();

    /**
     * Drive one projection to the current head.
     * @return Number of log positions advanced
     */
    uint64_t catch_up(const std::string& name);

    /**
     * Rebuild a projection from position 0 up to the current head and swap
     * the result in atomically. The old model stays visible until the swap.
     */
    RebuildResult rebuild(const std::string& name);

    std::future<RebuildResult> rebuild_async(const std::string& name);

    /**
     * Abort an in-flight rebuild, keeping the previous model and checkpoint.
     * @return true if a rebuild was running
     */
    bool cancel_rebuild(const std::string& name);

    /**
     * Restart tailing of a Failed projection. With skip_failed_event the
     * event that halted it is passed over (it stays dead-lettered).
     */
    void resume(const std::string& name, bool skip_failed_event = false);

    ProjectionStatus status(const std::string& name) const;
    Checkpoint checkpoint(const std::string& name) const;
    std::shared_ptr<const ReadModel> read_model(const std::string& name) const;
    std::vector<DeadLetter> dead_letters(const std::string& name) const;
    std::vector<std::string> projections() const;

    /**
     * Wait until the projection's checkpoint reaches `position`.
     * @return false on timeout or if the projection failed
     */
    bool wait_for(const std::string& name, uint64_t position,
                  std::chrono::milliseconds timeout) const;

private:
    class Worker;

    Worker& worker(const std::string& name) const;
    void wake_all();

    RuntimeContext& runtime_;
    uint64_t listener_handle_ = 0;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Worker>> workers_;
    bool running_ = false;
};

} // namespace chronicle
