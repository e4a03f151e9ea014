#include <chrono>
#include <exception>
#include <string>
#include "chronicle/command.hpp"
#include "chronicle/logging.hpp"
#include "chronicle/projection_engine.hpp"
#include "chronicle/repository.hpp"
#include "chronicle/runtime_context.hpp"
#include "chronicle/saga_coordinator.hpp"
#include "account.hpp"
#include "order.hpp"
#include "order_summary.hpp"
#include "transfer_saga.hpp"

namespace {

constexpr const char* COMPONENT = "demo";

examples::LineItem item(const std::string& sku, int32_t quantity, int64_t price_cents) {
    examples::LineItem line;
    line.set_sku(sku);
    line.set_quantity(quantity);
    line.set_price_cents(price_cents);
    return line;
}

void report(const std::string& command, const chronicle::CommandResult& result) {
    if (result.ok()) {
        chronicle::log_info(COMPONENT, "command_accepted", {
            {"command", command},
            {"version", result.new_version}
        });
        return;
    }
    chronicle::log_warn(COMPONENT, "command_rejected", {
        {"command", command},
        {"grpc_code", static_cast<int>(result.to_grpc_status().error_code())},
        {"reason", result.message}
    });
}

void run(chronicle::RuntimeContext& runtime) {
    chronicle::ProjectionEngine projections(runtime);
    projections.subscribe(orders::kOrderSummaryProjection, orders::order_summary_events(),
                          orders::summarize_order);
    projections.start();

    chronicle::AggregateRepository<orders::Order> order_repository(runtime);
    report("place order-1", chronicle::execute_command(order_repository, "order-1",
        [](orders::Order& order) {
            order.place("alice", {item("book", 2, 1500), item("pen", 5, 200)});
        }));
    report("ship order-1", chronicle::execute_command(order_repository, "order-1",
        [](orders::Order& order) { order.ship("parcel-co"); }));
    report("cancel order-1", chronicle::execute_command(order_repository, "order-1",
        [](orders::Order& order) { order.cancel("changed mind"); }));

    chronicle::AggregateRepository<bank::Account> accounts(runtime);
    report("open acc-alice", chronicle::execute_command(accounts, "acc-alice",
        [](bank::Account& account) { account.open("alice", 1000); }));
    report("open acc-bob", chronicle::execute_command(accounts, "acc-bob",
        [](bank::Account& account) { account.open("bob", 0); }));

    chronicle::SagaCoordinator sagas(runtime);
    auto transfer = transfer::make_transfer_saga(accounts);
    auto completed = sagas.execute(transfer, "tx-1",
        {{"source", "acc-alice"}, {"target", "acc-bob"}, {"amount", "400"}});
    auto compensated = sagas.execute(transfer, "tx-2",
        {{"source", "acc-alice"}, {"target", "acc-missing"}, {"amount", "100"}});
    chronicle::log_info(COMPONENT, "transfers_finished", {
        {"tx-1", chronicle::SagaStatus_Name(completed.status())},
        {"tx-2", chronicle::SagaStatus_Name(compensated.status())},
        {"alice_balance", accounts.load("acc-alice").balance()},
        {"bob_balance", accounts.load("acc-bob").balance()}
    });

    const auto head = runtime.events().head_position();
    if (!projections.wait_for(orders::kOrderSummaryProjection, head, std::chrono::seconds(5))) {
        chronicle::log_warn(COMPONENT, "projection_lagging", {{"head", head}});
    }
    for (const auto& [key, row] : projections.read_model(orders::kOrderSummaryProjection)->rows()) {
        chronicle::log_info(COMPONENT, "order_summary", {{"order", key}, {"row", row}});
    }
    projections.stop();
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto config = chronicle::RuntimeConfig::load(argc > 1 ? argv[1] : "");
        chronicle::RuntimeContext runtime(config);
        runtime.start();
        run(runtime);
        runtime.stop();
    } catch (const chronicle::ChronicleError& e) {
        chronicle::log_error(COMPONENT, "demo_failed", {
            {"error", e.what()},
            {"kind", chronicle::error_kind_name(e.kind())}
        });
        return 1;
    }
    return 0;
}
