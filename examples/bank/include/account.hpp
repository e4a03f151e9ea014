#pragma once

#include <cstdint>
#include <string>
#include "chronicle/aggregate.hpp"
#include "examples/bank.pb.h"

namespace bank {

/**
 * A bank account: opened once, then deposits and withdrawals until closed.
 */
class Account : public chronicle::Aggregate<examples::AccountState, examples::AccountEvent> {
public:
    void open(const std::string& owner, int64_t initial_balance);
    void deposit(int64_t amount);
    void withdraw(int64_t amount);
    void close(const std::string& reason);

    int64_t balance() const { return state().balance(); }
    bool is_open() const { return state().open(); }

protected:
    examples::AccountState create_empty_state() const override { return examples::AccountState{}; }
    void apply(examples::AccountState& state, const examples::AccountEvent& event) const override;

private:
    void require_open() const;
};

} // namespace bank
