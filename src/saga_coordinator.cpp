#include "chronicle/saga_coordinator.hpp"

#include <exception>
#include <memory>
#include <thread>
#include "chronicle/logging.hpp"

namespace chronicle {

namespace {
constexpr const char* COMPONENT = "saga";
} // namespace

template<typename Record>
void SagaCoordinator::record(SagaInstance& saga, Record&& transition) {
    transition(saga);
    repository_.save(saga).throw_if_error();
}

SagaCoordinator::SagaCoordinator(RuntimeContext& runtime)
    : SagaCoordinator(runtime, runtime.config().step_timeout) {}

SagaCoordinator::SagaCoordinator(RuntimeContext& runtime, std::chrono::milliseconds step_timeout)
    : repository_(runtime), step_timeout_(step_timeout) {}

SagaState SagaCoordinator::execute(const SagaDefinition& definition, const std::string& saga_id,
                                   const std::map<std::string, std::string>& data) {
    if (saga_id.empty()) {
        throw ValidationError("saga id must not be empty");
    }
    if (definition.size() == 0) {
        throw ValidationError("saga " + definition.name() + " has no steps");
    }

    auto saga = repository_.load(saga_stream_id(saga_id));
    if (saga.exists()) {
        throw ValidationError("saga " + saga_id + " already exists");
    }
    saga.set_trace(saga_id);

    record(saga, [&](SagaInstance& instance) {
        instance.start(saga_id, definition.name(),
                       static_cast<uint32_t>(definition.size()), data);
    });
    log_info(COMPONENT, "saga_started", {
        {"saga_id", saga_id},
        {"saga_type", definition.name()},
        {"steps", definition.size()}
    });
    return drive(definition, saga);
}

SagaState SagaCoordinator::resume(const SagaDefinition& definition, const std::string& saga_id) {
    auto saga = repository_.load(saga_stream_id(saga_id));
    if (!saga.exists()) {
        throw ValidationError("saga " + saga_id + " does not exist");
    }
    if (saga.state().saga_type() != definition.name() ||
        saga.state().step_count() != definition.size()) {
        throw ValidationError("saga " + saga_id + " of type " + saga.state().saga_type() +
                              " does not match definition " + definition.name());
    }
    saga.set_trace(saga_id);

    if (!saga.is_terminal()) {
        log_info(COMPONENT, "saga_resumed", {
            {"saga_id", saga_id},
            {"status", SagaStatus_Name(saga.status())},
            {"step_index", saga.state().step_index()}
        });
    }
    return drive(definition, saga);
}

std::future<SagaState> SagaCoordinator::execute_async(SagaDefinition definition,
                                                      std::string saga_id,
                                                      std::map<std::string, std::string> data) {
    return std::async(std::launch::async,
        [this, definition = std::move(definition), saga_id = std::move(saga_id),
         data = std::move(data)] {
            return execute(definition, saga_id, data);
        });
}

std::optional<SagaState> SagaCoordinator::load(const std::string& saga_id) const {
    auto saga = repository_.load(saga_stream_id(saga_id));
    if (!saga.exists()) return std::nullopt;
    return saga.state();
}

SagaState SagaCoordinator::drive(const SagaDefinition& definition, SagaInstance& saga) {
    while (!saga.is_terminal()) {
        switch (saga.status()) {
            case SAGA_RUNNING:
                run_next_step(definition, saga);
                break;
            case SAGA_COMPENSATING:
                compensate_next_step(definition, saga);
                break;
            default:
                throw StorageError("saga " + saga.state().saga_id() + " is in unexpected status " +
                                   SagaStatus_Name(saga.status()));
        }
    }

    const auto& state = saga.state();
    switch (state.status()) {
        case SAGA_COMPLETED:
            log_info(COMPONENT, "saga_completed", {{"saga_id", state.saga_id()}});
            break;
        case SAGA_COMPENSATED:
            log_warn(COMPONENT, "saga_compensated", {
                {"saga_id", state.saga_id()},
                {"reason", state.failure_reason()}
            });
            break;
        default:
            break;
    }
    return state;
}

void SagaCoordinator::run_next_step(const SagaDefinition& definition, SagaInstance& saga) {
    const uint32_t index = saga.state().step_index();
    if (index >= saga.state().step_count()) {
        record(saga, [](SagaInstance& instance) { instance.complete(); });
        return;
    }

    const auto& step = definition.steps()[index];
    if (saga.step_outcome(index) == STEP_STARTED) {
        log_warn(COMPONENT, "step_reexecuted", {
            {"saga_id", saga.state().saga_id()},
            {"step", step.name}
        });
    } else {
        record(saga, [&](SagaInstance& instance) { instance.start_step(index, step.name); });
    }

    auto outcome = run_action(step.execute, saga, step.name);
    if (outcome.ok) {
        record(saga, [&](SagaInstance& instance) { instance.complete_step(index, outcome.outputs); });
        log_debug(COMPONENT, "step_completed", {
            {"saga_id", saga.state().saga_id()},
            {"step", step.name}
        });
        return;
    }

    record(saga, [&](SagaInstance& instance) { instance.fail_step(index, outcome.error); });
    log_warn(COMPONENT, "step_failed", {
        {"saga_id", saga.state().saga_id()},
        {"step", step.name},
        {"error", outcome.error}
    });
}

void SagaCoordinator::compensate_next_step(const SagaDefinition& definition, SagaInstance& saga) {
    // Succeeded steps form a prefix, so the highest one left unwinds first.
    std::optional<uint32_t> next;
    for (uint32_t i = saga.state().step_count(); i > 0; --i) {
        auto outcome = saga.step_outcome(i - 1);
        if (outcome == STEP_SUCCEEDED || outcome == STEP_COMPENSATING) {
            next = i - 1;
            break;
        }
    }
    if (!next) {
        record(saga, [](SagaInstance& instance) { instance.mark_compensated(); });
        return;
    }

    const uint32_t index = *next;
    const auto& step = definition.steps()[index];
    if (saga.step_outcome(index) == STEP_SUCCEEDED) {
        record(saga, [&](SagaInstance& instance) { instance.start_compensation(index); });
    }

    if (!step.has_compensation()) {
        record(saga, [&](SagaInstance& instance) { instance.complete_compensation(index); });
        return;
    }

    auto outcome = run_action(step.compensate, saga, step.name);
    if (outcome.ok) {
        record(saga, [&](SagaInstance& instance) { instance.complete_compensation(index); });
        log_info(COMPONENT, "step_compensated", {
            {"saga_id", saga.state().saga_id()},
            {"step", step.name}
        });
        return;
    }

    record(saga, [&](SagaInstance& instance) { instance.fail_compensation(index, outcome.error); });
    log_error(COMPONENT, "compensation_failed", {
        {"saga_id", saga.state().saga_id()},
        {"step", step.name},
        {"error", outcome.error},
        {"action", "operator intervention required"}
    });
}

SagaCoordinator::ActionOutcome SagaCoordinator::run_action(const SagaAction& action,
                                                           const SagaInstance& saga,
                                                           const std::string& step_name) {
    auto context = std::make_shared<SagaContext>();
    context->saga_id = saga.state().saga_id();
    context->correlation_id = saga.state().saga_id();
    context->step_name = step_name;
    context->data.insert(saga.state().data().begin(), saga.state().data().end());

    // The action owns copies of everything it touches, so a timed-out
    // action can keep running after the coordinator has moved on.
    auto promise = std::make_shared<std::promise<ActionOutcome>>();
    auto future = promise->get_future();
    std::thread([action, context, promise] {
        try {
            action(*context);
            promise->set_value({true, "", context->outputs});
        } catch (const std::exception& e) {
            promise->set_value({false, e.what(), {}});
        } catch (...) {
            promise->set_value({false, "unknown exception", {}});
        }
    }).detach();

    if (future.wait_for(step_timeout_) == std::future_status::timeout) {
        context->cancel();
        return {false, "step " + step_name + " timed out after " +
                       std::to_string(step_timeout_.count()) + "ms", {}};
    }
    return future.get();
}

} // namespace chronicle
