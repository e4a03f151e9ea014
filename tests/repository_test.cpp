#include <gtest/gtest.h>
#include <memory>
#include "chronicle/errors.hpp"
#include "chronicle/helpers.hpp"
#include "chronicle/in_memory_event_store.hpp"
#include "chronicle/repository.hpp"
#include "chronicle/runtime_context.hpp"
#include "account.hpp"
#include "examples/order.pb.h"
#include "test_support.hpp"

using namespace chronicle;
using chronicle::testing_support::LogCapture;

namespace {

RuntimeConfig config_with_interval(uint64_t interval) {
    RuntimeConfig config;
    config.snapshot_interval = interval;
    config.log_level = LogLevel::Warn;
    return config;
}

/**
 * Snapshot store whose writes always fail.
 */
class FailingSnapshotStore : public SnapshotStore {
public:
    void save(const SnapshotRecord&) override { throw StorageError("snapshot disk full"); }
    std::optional<SnapshotRecord> latest(const std::string&, uint64_t) const override {
        return std::nullopt;
    }
    std::size_t prune(const std::string&, std::size_t) override { return 0; }
};

} // namespace

class RepositoryTest : public ::testing::Test {
protected:
    RepositoryTest() : runtime(config_with_interval(5)), accounts(runtime) {}

    void SetUp() override { runtime.start(); }
    void TearDown() override { runtime.stop(); }

    RuntimeContext runtime;
    AggregateRepository<bank::Account> accounts;
};

// =============================================================================
// Load and Save
// =============================================================================

TEST_F(RepositoryTest, OpenThenWithdraw_ShouldProduceVersionsAndBalance) {
    // Given a new account opened with 1000
    auto account = accounts.load("acc-1");
    EXPECT_EQ(account.version(), 0u);
    account.open("alice", 1000);
    auto opened = accounts.save(account);
    ASSERT_TRUE(opened.ok()) << opened.message();
    EXPECT_EQ(opened.version(), 1u);

    // When 250 is withdrawn
    auto reloaded = accounts.load("acc-1");
    reloaded.withdraw(250);
    auto withdrawn = accounts.save(reloaded);

    // Then the stream is at version 2 with balance 750
    ASSERT_TRUE(withdrawn.ok());
    EXPECT_EQ(withdrawn.version(), 2u);
    auto current = accounts.load("acc-1");
    EXPECT_EQ(current.version(), 2u);
    EXPECT_EQ(current.balance(), 750);
}

TEST_F(RepositoryTest, Save_WithoutPendingEvents_ShouldBeNoOp) {
    auto account = accounts.load("acc-1");
    auto result = accounts.save(account);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(runtime.events().head_position(), 0u);
}

TEST_F(RepositoryTest, Save_StaleAggregate_ShouldReturnConflict) {
    auto first = accounts.load("acc-1");
    first.open("alice", 100);
    ASSERT_TRUE(accounts.save(first).ok());

    auto a = accounts.load("acc-1");
    auto b = accounts.load("acc-1");
    a.deposit(10);
    b.withdraw(10);
    ASSERT_TRUE(accounts.save(a).ok());

    auto conflict = accounts.save(b);
    EXPECT_TRUE(conflict.is_version_conflict());
    EXPECT_EQ(conflict.version(), 2u);
    EXPECT_EQ(accounts.load("acc-1").balance(), 110);
    EXPECT_TRUE(b.has_pending_events());
}

TEST_F(RepositoryTest, Save_ShouldStampTraceIds) {
    auto account = accounts.load("acc-1");
    account.set_trace("corr-9", "cmd-3");
    account.open("alice", 10);
    ASSERT_TRUE(accounts.save(account).ok());

    auto event = runtime.events().read_stream("acc-1").to_vector().at(0);
    EXPECT_EQ(event.correlation_id(), "corr-9");
    EXPECT_EQ(event.causation_id(), "cmd-3");
    EXPECT_EQ(event.event_type(), "Opened");
}

// =============================================================================
// Snapshots
// =============================================================================

TEST_F(RepositoryTest, Snapshot_ShouldBeTakenWhenIntervalCrossed) {
    auto account = accounts.load("acc-1");
    account.open("alice", 0);
    for (int i = 0; i < 6; ++i) account.deposit(10);
    ASSERT_TRUE(accounts.save(account).ok());
    runtime.snapshot_writer().flush();

    auto snapshot = runtime.snapshots().latest("acc-1");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->version(), 7u);
}

TEST_F(RepositoryTest, LoadFromSnapshot_ShouldEqualFullReplay) {
    for (int i = 0; i < 23; ++i) {
        auto account = accounts.load("acc-1");
        if (i == 0) {
            account.open("alice", 100);
        } else if (i % 3 == 0) {
            account.withdraw(7);
        } else {
            account.deposit(11);
        }
        ASSERT_TRUE(accounts.save(account).ok());
    }
    runtime.snapshot_writer().flush();

    auto with_snapshot = accounts.load("acc-1");
    EXPECT_EQ(with_snapshot.snapshot_version(), 20u);
    EXPECT_EQ(with_snapshot.replayed_events(), 3u);

    RuntimeContext fresh(config_with_interval(0));
    for (const auto& event : runtime.events().read_stream("acc-1")) {
        NewEvent copy;
        copy.event_type = event.event_type();
        copy.payload = event.payload();
        ASSERT_TRUE(fresh.events().append("acc-1", kAnyVersion, {copy}).ok());
    }
    AggregateRepository<bank::Account> replay_only(fresh);
    auto full = replay_only.load("acc-1");

    EXPECT_EQ(full.snapshot_version(), 0u);
    EXPECT_EQ(full.replayed_events(), 23u);
    EXPECT_EQ(full.version(), with_snapshot.version());
    EXPECT_EQ(full.state().SerializeAsString(), with_snapshot.state().SerializeAsString());
}

TEST_F(RepositoryTest, LoadAt_ShouldReturnHistoricalState) {
    auto account = accounts.load("acc-1");
    account.open("alice", 0);
    for (int i = 1; i <= 12; ++i) account.deposit(i);
    ASSERT_TRUE(accounts.save(account).ok());
    runtime.snapshot_writer().flush();

    auto at_four = accounts.load_at("acc-1", 4);
    EXPECT_EQ(at_four.version(), 4u);
    EXPECT_EQ(at_four.balance(), 1 + 2 + 3);
}

TEST_F(RepositoryTest, UnreadableSnapshot_ShouldFallBackToReplay) {
    auto account = accounts.load("acc-1");
    account.open("alice", 5);
    account.deposit(5);
    ASSERT_TRUE(accounts.save(account).ok());

    SnapshotRecord bogus;
    bogus.set_stream_id("acc-1");
    bogus.set_version(2);
    examples::OrderEvent wrong_type;
    *bogus.mutable_state() = helpers::pack_any(wrong_type);
    runtime.snapshots().save(bogus);

    LogCapture capture;
    auto reloaded = accounts.load("acc-1");
    EXPECT_EQ(reloaded.balance(), 10);
    EXPECT_EQ(reloaded.snapshot_version(), 0u);
    EXPECT_TRUE(capture.contains("snapshot_unreadable"));
}

TEST(RepositoryFailureTest, SnapshotWriteFailure_ShouldNotAffectSave) {
    auto events = std::make_shared<InMemoryEventStore>();
    RuntimeContext runtime(config_with_interval(1), events,
                           std::make_shared<FailingSnapshotStore>(),
                           std::make_shared<InMemoryCheckpointStore>(),
                           std::make_shared<InMemoryDeadLetterStore>());
    runtime.start();
    AggregateRepository<bank::Account> accounts(runtime);
    LogCapture capture(LogLevel::Warn);

    auto account = accounts.load("acc-1");
    account.open("alice", 10);
    auto result = accounts.save(account);
    runtime.snapshot_writer().flush();

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(runtime.snapshot_writer().failed(), 1u);
    EXPECT_TRUE(capture.contains("snapshot_write_failed"));
    EXPECT_EQ(accounts.load("acc-1").balance(), 10);
    runtime.stop();
}

TEST(RepositoryFailureTest, RuntimeContext_MissingStore_ShouldThrow) {
    EXPECT_THROW(RuntimeContext(RuntimeConfig{}, nullptr,
                                nullptr,
                                std::make_shared<InMemoryCheckpointStore>(),
                                std::make_shared<InMemoryDeadLetterStore>()),
                 ValidationError);
}
