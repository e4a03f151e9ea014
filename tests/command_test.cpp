#include <gtest/gtest.h>
#include <memory>
#include "chronicle/command.hpp"
#include "chronicle/in_memory_event_store.hpp"
#include "account.hpp"

using namespace chronicle;

namespace {

/**
 * Event store whose appends fail as if the backend were unreachable.
 */
class UnavailableEventStore : public InMemoryEventStore {
public:
    AppendResult append(const std::string&, uint64_t, const std::vector<NewEvent>&) override {
        throw StorageError("event store unreachable");
    }
};

RuntimeConfig quiet_config() {
    RuntimeConfig config;
    config.log_level = LogLevel::Error;
    return config;
}

} // namespace

class CommandTest : public ::testing::Test {
protected:
    CommandTest() : runtime(quiet_config()), accounts(runtime) {}

    void SetUp() override {
        runtime.start();
        auto opened = execute_command(accounts, "acc-1", [](bank::Account& account) {
            account.open("alice", 1000);
        });
        ASSERT_TRUE(opened.ok());
    }

    RuntimeContext runtime;
    AggregateRepository<bank::Account> accounts;
};

TEST_F(CommandTest, Execute_Accepted_ShouldReturnNewVersion) {
    auto result = execute_command(accounts, "acc-1", [](bank::Account& account) {
        account.withdraw(250);
    });

    EXPECT_EQ(result.outcome, CommandOutcome::Success);
    EXPECT_EQ(result.new_version, 2u);
    EXPECT_TRUE(result.to_grpc_status().ok());
    EXPECT_EQ(accounts.load("acc-1").balance(), 750);
}

TEST_F(CommandTest, Execute_BusinessRuleViolation_ShouldReturnValidationError) {
    auto result = execute_command(accounts, "acc-1", [](bank::Account& account) {
        account.withdraw(5000);
    });

    EXPECT_EQ(result.outcome, CommandOutcome::ValidationError);
    EXPECT_EQ(result.message, "Insufficient funds");
    EXPECT_EQ(result.to_grpc_status().error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(runtime.events().stream_version("acc-1"), 1u);
}

TEST_F(CommandTest, Execute_StaleExpectedVersion_ShouldReturnConflict) {
    ASSERT_TRUE(execute_command(accounts, "acc-1", [](bank::Account& account) {
        account.deposit(1);
    }).ok());

    auto result = execute_command(accounts, "acc-1", 1, [](bank::Account& account) {
        account.withdraw(10);
    });

    EXPECT_EQ(result.outcome, CommandOutcome::VersionConflict);
    EXPECT_EQ(result.new_version, 2u);
    EXPECT_EQ(result.to_grpc_status().error_code(), grpc::StatusCode::ABORTED);
    EXPECT_EQ(accounts.load("acc-1").balance(), 1001);
}

TEST_F(CommandTest, Execute_MatchingExpectedVersion_ShouldSucceed) {
    auto result = execute_command(accounts, "acc-1", 1, [](bank::Account& account) {
        account.deposit(10);
    });
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.new_version, 2u);
}

TEST(CommandFailureTest, Execute_StorageFault_ShouldReturnStorageFailure) {
    auto events = std::make_shared<UnavailableEventStore>();
    RuntimeContext runtime(quiet_config(), events,
                           std::make_shared<InMemorySnapshotStore>(*events),
                           std::make_shared<InMemoryCheckpointStore>(),
                           std::make_shared<InMemoryDeadLetterStore>());
    AggregateRepository<bank::Account> accounts(runtime);

    auto result = execute_command(accounts, "acc-1", [](bank::Account& account) {
        account.open("alice", 10);
    });

    EXPECT_EQ(result.outcome, CommandOutcome::StorageFailure);
    EXPECT_EQ(result.to_grpc_status().error_code(), grpc::StatusCode::UNAVAILABLE);
}

TEST(CommandResultTest, FromAppend_ShouldMapEveryOutcome) {
    EXPECT_EQ(CommandResult::from_append(AppendResult::success("s", 4, 1, 4)).new_version, 4u);
    EXPECT_EQ(CommandResult::from_append(AppendResult::version_conflict("s", 1, 2)).outcome,
              CommandOutcome::VersionConflict);
    EXPECT_EQ(CommandResult::from_append(
                  AppendResult::failure("s", ErrorKind::ValidationError, "bad")).outcome,
              CommandOutcome::ValidationError);
    EXPECT_EQ(CommandResult::from_append(
                  AppendResult::failure("s", ErrorKind::StorageFailure, "down")).outcome,
              CommandOutcome::StorageFailure);
}
