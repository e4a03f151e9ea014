#include "account.hpp"

#include "chronicle/errors.hpp"

namespace bank {

using chronicle::ValidationError;

void Account::open(const std::string& owner, int64_t initial_balance) {
    if (exists()) throw ValidationError("Account already exists");
    if (owner.empty()) throw ValidationError("Owner is required");
    if (initial_balance < 0) throw ValidationError("Initial balance cannot be negative");

    examples::AccountEvent event;
    event.mutable_opened()->set_owner(owner);
    event.mutable_opened()->set_balance(initial_balance);
    raise(event);
}

void Account::deposit(int64_t amount) {
    require_open();
    if (amount <= 0) throw ValidationError("Deposit amount must be positive");

    examples::AccountEvent event;
    event.mutable_deposited()->set_amount(amount);
    raise(event);
}

void Account::withdraw(int64_t amount) {
    require_open();
    if (amount <= 0) throw ValidationError("Withdrawal amount must be positive");
    if (amount > state().balance()) throw ValidationError("Insufficient funds");

    examples::AccountEvent event;
    event.mutable_withdrawn()->set_amount(amount);
    raise(event);
}

void Account::close(const std::string& reason) {
    require_open();
    if (state().balance() != 0) throw ValidationError("Account balance must be zero to close");

    examples::AccountEvent event;
    event.mutable_closed()->set_reason(reason);
    raise(event);
}

void Account::apply(examples::AccountState& state, const examples::AccountEvent& event) const {
    switch (event.event_case()) {
        case examples::AccountEvent::kOpened:
            state.set_owner(event.opened().owner());
            state.set_balance(event.opened().balance());
            state.set_open(true);
            break;
        case examples::AccountEvent::kDeposited:
            state.set_balance(state.balance() + event.deposited().amount());
            state.set_transaction_count(state.transaction_count() + 1);
            break;
        case examples::AccountEvent::kWithdrawn:
            state.set_balance(state.balance() - event.withdrawn().amount());
            state.set_transaction_count(state.transaction_count() + 1);
            break;
        case examples::AccountEvent::kClosed:
            state.set_open(false);
            break;
        case examples::AccountEvent::EVENT_NOT_SET:
            break;
    }
}

void Account::require_open() const {
    if (!exists()) throw ValidationError("Account does not exist");
    if (!state().open()) throw ValidationError("Account is closed");
}

} // namespace bank
