#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "chronicle/saga.pb.h"
#include "chronicle/aggregate.hpp"
#include "chronicle/errors.hpp"

namespace chronicle {

constexpr const char* kSagaStreamPrefix = "saga-";

inline std::string saga_stream_id(const std::string& saga_id) {
    return kSagaStreamPrefix + saga_id;
}

/**
 * What a step or compensation action sees while it runs.
 *
 * `data` holds the saga's accumulated data bag; anything the action writes to
 * `outputs` is persisted with the step completion and merged into the bag
 * for later steps.
 */
struct SagaContext {
    std::string saga_id;
    std::string correlation_id;
    std::string step_name;
    std::map<std::string, std::string> data;
    std::map<std::string, std::string> outputs;

    /**
     * Set when the coordinator gave up waiting for the action. Long-running
     * actions should poll it and return early.
     */
    bool cancelled() const { return cancelled_ && cancelled_->load(); }

    void cancel() {
        if (cancelled_) cancelled_->store(true);
    }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_ = std::make_shared<std::atomic<bool>>(false);
};

/**
 * A step or compensation. Fails by throwing.
 *
 * Each call runs on its own thread. When it exceeds the step timeout the
 * coordinator marks it cancelled and moves on, but the thread is detached and
 * keeps running until the action returns. Actions should poll
 * SagaContext::cancelled(), and anything they capture by reference must
 * outlive the RuntimeContext the coordinator was built on.
 */
using SagaAction = std::function<void(SagaContext&)>;

struct SagaStep {
    std::string name;
    SagaAction execute;
    SagaAction compensate;

    bool has_compensation() const { return static_cast<bool>(compensate); }
};

/**
 * Ordered list of steps making up one saga type.
 *
 * Example:
 *   SagaDefinition transfer("transfer");
 *   transfer.step("debit", debit_source, refund_source)
 *           .step("credit", credit_target, reverse_credit)
 *           .step("notify", send_receipt);
 */
class SagaDefinition {
public:
    explicit SagaDefinition(std::string name) : name_(std::move(name)) {
        if (name_.empty()) {
            throw ValidationError("saga definition needs a name");
        }
    }

    /**
     * Append a step. Steps without a compensation are skipped when unwinding.
     * @throws ValidationError if the step has no name or no action
     */
    SagaDefinition& step(std::string name, SagaAction execute, SagaAction compensate = nullptr) {
        if (name.empty()) {
            throw ValidationError("saga " + name_ + " step " + std::to_string(steps_.size()) +
                                  " needs a name");
        }
        if (!execute) {
            throw ValidationError("saga " + name_ + " step " + name + " needs an action");
        }
        steps_.push_back({std::move(name), std::move(execute), std::move(compensate)});
        return *this;
    }

    const std::string& name() const { return name_; }
    const std::vector<SagaStep>& steps() const { return steps_; }
    std::size_t size() const { return steps_.size(); }

private:
    std::string name_;
    std::vector<SagaStep> steps_;
};

/**
 * Persisted progress of one saga, stored on stream "saga-<saga_id>".
 *
 * Every method records one progress event and rejects transitions that do
 * not follow the saga state machine with ValidationError.
 */
class SagaInstance : public Aggregate<SagaState, SagaEvent> {
public:
    void start(const std::string& saga_id, const std::string& saga_type, uint32_t step_count,
               const std::map<std::string, std::string>& data);
    void start_step(uint32_t index, const std::string& name);
    void complete_step(uint32_t index, const std::map<std::string, std::string>& outputs);
    void fail_step(uint32_t index, const std::string& reason);
    void start_compensation(uint32_t index);
    void complete_compensation(uint32_t index);
    void fail_compensation(uint32_t index, const std::string& reason);
    void complete();
    void mark_compensated();

    SagaStatus status() const { return state().status(); }

    /**
     * Latest outcome recorded for a step; STEP_PENDING if it never started.
     */
    StepOutcome step_outcome(uint32_t index) const;

    bool is_terminal() const;

protected:
    SagaState create_empty_state() const override { return SagaState{}; }
    void apply(SagaState& state, const SagaEvent& event) const override;

private:
    void require_status(SagaStatus expected, const char* action) const;
    void require_step(uint32_t index, StepOutcome expected, const char* action) const;
};

/**
 * Throw the error matching a saga that did not complete.
 * @throws SagaStepError if the saga was compensated
 * @throws SagaCompensationError if compensation failed
 */
void throw_if_failed(const SagaState& state);

} // namespace chronicle
