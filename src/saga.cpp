#include "chronicle/saga.hpp"

namespace chronicle {

namespace {

StepLogEntry& entry_for(SagaState& state, uint32_t index) {
    for (auto& entry : *state.mutable_step_log()) {
        if (entry.step_index() == index) return entry;
    }
    auto* entry = state.add_step_log();
    entry->set_step_index(index);
    return *entry;
}

} // namespace

void SagaInstance::start(const std::string& saga_id, const std::string& saga_type,
                         uint32_t step_count, const std::map<std::string, std::string>& data) {
    require_status(SAGA_NOT_STARTED, "start");
    if (step_count == 0) {
        throw ValidationError("saga " + saga_type + " has no steps");
    }

    SagaEvent event;
    auto* started = event.mutable_saga_started();
    started->set_saga_id(saga_id);
    started->set_saga_type(saga_type);
    started->set_step_count(step_count);
    started->mutable_data()->insert(data.begin(), data.end());
    raise(event);
}

void SagaInstance::start_step(uint32_t index, const std::string& name) {
    require_status(SAGA_RUNNING, "start a step");
    if (index != state().step_index() || index >= state().step_count()) {
        throw ValidationError("saga " + state().saga_id() + " cannot start step " +
                              std::to_string(index) + " at step " +
                              std::to_string(state().step_index()));
    }
    require_step(index, STEP_PENDING, "start");

    SagaEvent event;
    event.mutable_step_started()->set_step_index(index);
    event.mutable_step_started()->set_step_name(name);
    raise(event);
}

void SagaInstance::complete_step(uint32_t index, const std::map<std::string, std::string>& outputs) {
    require_status(SAGA_RUNNING, "complete a step");
    require_step(index, STEP_STARTED, "complete");

    SagaEvent event;
    event.mutable_step_completed()->set_step_index(index);
    event.mutable_step_completed()->mutable_outputs()->insert(outputs.begin(), outputs.end());
    raise(event);
}

void SagaInstance::fail_step(uint32_t index, const std::string& reason) {
    require_status(SAGA_RUNNING, "fail a step");
    require_step(index, STEP_STARTED, "fail");

    SagaEvent event;
    event.mutable_step_failed()->set_step_index(index);
    event.mutable_step_failed()->set_reason(reason);
    raise(event);
}

void SagaInstance::start_compensation(uint32_t index) {
    require_status(SAGA_COMPENSATING, "start compensation");
    require_step(index, STEP_SUCCEEDED, "compensate");

    SagaEvent event;
    event.mutable_compensation_started()->set_step_index(index);
    raise(event);
}

void SagaInstance::complete_compensation(uint32_t index) {
    require_status(SAGA_COMPENSATING, "complete compensation");
    require_step(index, STEP_COMPENSATING, "finish compensating");

    SagaEvent event;
    event.mutable_compensation_completed()->set_step_index(index);
    raise(event);
}

void SagaInstance::fail_compensation(uint32_t index, const std::string& reason) {
    require_status(SAGA_COMPENSATING, "fail compensation");
    require_step(index, STEP_COMPENSATING, "fail compensating");

    SagaEvent event;
    event.mutable_compensation_failed()->set_step_index(index);
    event.mutable_compensation_failed()->set_reason(reason);
    raise(event);
}

void SagaInstance::complete() {
    require_status(SAGA_RUNNING, "complete");
    if (state().step_index() != state().step_count()) {
        throw ValidationError("saga " + state().saga_id() + " has unfinished steps");
    }

    SagaEvent event;
    event.mutable_saga_completed();
    raise(event);
}

void SagaInstance::mark_compensated() {
    require_status(SAGA_COMPENSATING, "finish compensating");
    for (const auto& entry : state().step_log()) {
        if (entry.outcome() == STEP_SUCCEEDED || entry.outcome() == STEP_COMPENSATING) {
            throw ValidationError("saga " + state().saga_id() + " step " + entry.step_name() +
                                  " is not compensated yet");
        }
    }

    SagaEvent event;
    event.mutable_saga_compensated();
    raise(event);
}

StepOutcome SagaInstance::step_outcome(uint32_t index) const {
    for (const auto& entry : state().step_log()) {
        if (entry.step_index() == index) return entry.outcome();
    }
    return STEP_PENDING;
}

bool SagaInstance::is_terminal() const {
    auto current = status();
    return current == SAGA_COMPLETED || current == SAGA_COMPENSATED ||
           current == SAGA_COMPENSATION_FAILED;
}

void SagaInstance::apply(SagaState& state, const SagaEvent& event) const {
    switch (event.event_case()) {
        case SagaEvent::kSagaStarted: {
            const auto& started = event.saga_started();
            state.set_saga_id(started.saga_id());
            state.set_saga_type(started.saga_type());
            state.set_step_count(started.step_count());
            state.set_step_index(0);
            state.mutable_data()->insert(started.data().begin(), started.data().end());
            state.set_status(SAGA_RUNNING);
            break;
        }
        case SagaEvent::kStepStarted: {
            const auto& started = event.step_started();
            auto& entry = entry_for(state, started.step_index());
            entry.set_step_name(started.step_name());
            entry.set_outcome(STEP_STARTED);
            state.set_step_index(started.step_index());
            break;
        }
        case SagaEvent::kStepCompleted: {
            const auto& completed = event.step_completed();
            entry_for(state, completed.step_index()).set_outcome(STEP_SUCCEEDED);
            for (const auto& [key, value] : completed.outputs()) {
                (*state.mutable_data())[key] = value;
            }
            state.set_step_index(completed.step_index() + 1);
            break;
        }
        case SagaEvent::kStepFailed: {
            const auto& failed = event.step_failed();
            auto& entry = entry_for(state, failed.step_index());
            entry.set_outcome(STEP_FAILED);
            entry.set_detail(failed.reason());
            state.set_failure_reason(failed.reason());
            state.set_status(SAGA_COMPENSATING);
            break;
        }
        case SagaEvent::kCompensationStarted:
            entry_for(state, event.compensation_started().step_index()).set_outcome(STEP_COMPENSATING);
            break;
        case SagaEvent::kCompensationCompleted:
            entry_for(state, event.compensation_completed().step_index()).set_outcome(STEP_COMPENSATED);
            break;
        case SagaEvent::kCompensationFailed: {
            const auto& failed = event.compensation_failed();
            auto& entry = entry_for(state, failed.step_index());
            entry.set_outcome(STEP_COMPENSATION_FAILED);
            entry.set_detail(failed.reason());
            state.set_status(SAGA_COMPENSATION_FAILED);
            break;
        }
        case SagaEvent::kSagaCompleted:
            state.set_status(SAGA_COMPLETED);
            break;
        case SagaEvent::kSagaCompensated:
            state.set_status(SAGA_COMPENSATED);
            break;
        case SagaEvent::EVENT_NOT_SET:
            break;
    }
}

void SagaInstance::require_status(SagaStatus expected, const char* action) const {
    if (status() != expected) {
        throw ValidationError("saga " + state().saga_id() + " cannot " + action + " while " +
                              SagaStatus_Name(status()));
    }
}

void SagaInstance::require_step(uint32_t index, StepOutcome expected, const char* action) const {
    auto outcome = step_outcome(index);
    if (outcome != expected) {
        throw ValidationError("saga " + state().saga_id() + " cannot " + action + " step " +
                              std::to_string(index) + " in state " + StepOutcome_Name(outcome));
    }
}

void throw_if_failed(const SagaState& state) {
    switch (state.status()) {
        case SAGA_COMPENSATED:
            throw SagaStepError("saga " + state.saga_id() + " was compensated: " +
                                state.failure_reason());
        case SAGA_COMPENSATION_FAILED:
            throw SagaCompensationError("saga " + state.saga_id() +
                                        " failed to compensate and needs an operator: " +
                                        state.failure_reason());
        default:
            return;
    }
}

} // namespace chronicle
