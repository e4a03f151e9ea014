#pragma once

#include "chronicle/repository.hpp"
#include "chronicle/saga.hpp"
#include "account.hpp"

namespace transfer {

constexpr const char* kTransferSaga = "transfer";

/**
 * Moves money between two accounts: debit the source, credit the target and
 * issue a receipt. A failed credit refunds the source.
 *
 * Expects "source", "target" and "amount" in the saga data.
 */
chronicle::SagaDefinition make_transfer_saga(chronicle::AggregateRepository<bank::Account>& accounts);

} // namespace transfer
