#include "transfer_saga.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include "chronicle/command.hpp"
#include "chronicle/helpers.hpp"

namespace transfer {

namespace {

const std::string& require(const chronicle::SagaContext& context, const std::string& key) {
    auto it = context.data.find(key);
    if (it == context.data.end() || it->second.empty()) {
        throw chronicle::SagaStepError("transfer " + context.saga_id + " is missing " + key);
    }
    return it->second;
}

int64_t amount_of(const chronicle::SagaContext& context) {
    try {
        return std::stoll(require(context, "amount"));
    } catch (const std::logic_error&) {
        throw chronicle::SagaStepError("transfer " + context.saga_id + " has an invalid amount");
    }
}

template<typename Decide>
void run(chronicle::AggregateRepository<bank::Account>& accounts, const std::string& account_id,
         const chronicle::SagaContext& context, Decide&& decide) {
    auto result = chronicle::execute_command(accounts, account_id,
        [&](bank::Account& account) {
            account.set_trace(context.correlation_id, context.saga_id);
            decide(account);
        });
    if (!result.ok()) {
        throw chronicle::SagaStepError(context.step_name + " on " + account_id + ": " + result.message);
    }
}

} // namespace

chronicle::SagaDefinition make_transfer_saga(chronicle::AggregateRepository<bank::Account>& accounts) {
    chronicle::SagaDefinition saga(kTransferSaga);
    saga.step("debit",
            [&accounts](chronicle::SagaContext& context) {
                auto amount = amount_of(context);
                run(accounts, require(context, "source"), context,
                    [amount](bank::Account& account) { account.withdraw(amount); });
            },
            [&accounts](chronicle::SagaContext& context) {
                auto amount = amount_of(context);
                run(accounts, require(context, "source"), context,
                    [amount](bank::Account& account) { account.deposit(amount); });
            })
        .step("credit",
            [&accounts](chronicle::SagaContext& context) {
                auto amount = amount_of(context);
                run(accounts, require(context, "target"), context,
                    [amount](bank::Account& account) { account.deposit(amount); });
            },
            [&accounts](chronicle::SagaContext& context) {
                auto amount = amount_of(context);
                run(accounts, require(context, "target"), context,
                    [amount](bank::Account& account) { account.withdraw(amount); });
            })
        .step("receipt",
            [](chronicle::SagaContext& context) {
                context.outputs["receipt"] = chronicle::helpers::generate_uuid();
            });
    return saga;
}

} // namespace transfer
