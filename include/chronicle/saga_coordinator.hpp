#pragma once

#include <chrono>
#include <future>
#include <map>
#include <optional>
#include <string>
#include "chronicle/repository.hpp"
#include "chronicle/runtime_context.hpp"
#include "chronicle/saga.hpp"

namespace chronicle {

/**
 * Runs sagas step by step and unwinds them with compensations on failure.
 *
 * Every transition is appended to the saga's own stream before the next
 * action runs, so a crashed coordinator can resume() where it stopped. An
 * interrupted step is executed again on resume, hence actions must tolerate
 * at-least-once execution.
 *
 * Example:
 *   SagaCoordinator sagas(runtime);
 *   auto state = sagas.execute(transfer, "tx-42", {{"amount", "250"}});
 *   throw_if_failed(state);
 */
class SagaCoordinator {
public:
    explicit SagaCoordinator(RuntimeContext& runtime);
    SagaCoordinator(RuntimeContext& runtime, std::chrono::milliseconds step_timeout);

    /**
     * Start a new saga and drive it to a terminal status.
     * @return Final persisted state; check status() or use throw_if_failed()
     * @throws ValidationError if the definition is empty or the saga id is taken
     * @throws VersionConflictError if another coordinator advanced the saga
     * @throws StorageError if progress cannot be recorded
     */
    SagaState execute(const SagaDefinition& definition, const std::string& saga_id,
                      const std::map<std::string, std::string>& data = {});

    /**
     * Continue a saga from its persisted progress. Terminal sagas are returned
     * unchanged.
     * @throws ValidationError if the saga does not exist or belongs to another definition
     */
    SagaState resume(const SagaDefinition& definition, const std::string& saga_id);

    /**
     * execute() on a dedicated thread. The definition is copied.
     */
    std::future<SagaState> execute_async(SagaDefinition definition, std::string saga_id,
                                         std::map<std::string, std::string> data = {});

    std::optional<SagaState> load(const std::string& saga_id) const;

    std::chrono::milliseconds step_timeout() const { return step_timeout_; }

private:
    struct ActionOutcome {
        bool ok = false;
        std::string error;
        std::map<std::string, std::string> outputs;
    };

    SagaState drive(const SagaDefinition& definition, SagaInstance& saga);
    void run_next_step(const SagaDefinition& definition, SagaInstance& saga);
    void compensate_next_step(const SagaDefinition& definition, SagaInstance& saga);

    ActionOutcome run_action(const SagaAction& action, const SagaInstance& saga,
                             const std::string& step_name);

    template<typename Record>
    void record(SagaInstance& saga, Record&& transition);

    AggregateRepository<SagaInstance> repository_;
    std::chrono::milliseconds step_timeout_;
};

} // namespace chronicle
