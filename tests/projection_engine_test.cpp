#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include "chronicle/errors.hpp"
#include "chronicle/projection_engine.hpp"
#include "chronicle/runtime_context.hpp"
#include "examples/bank.pb.h"
#include "test_support.hpp"

using namespace chronicle;
using chronicle::testing_support::LogCapture;
using chronicle::testing_support::deposited;
using chronicle::testing_support::eventually;
using chronicle::testing_support::withdrawn;

namespace {

const std::string kBalances = "balances";

RuntimeConfig quiet_config() {
    RuntimeConfig config;
    config.log_level = LogLevel::Error;
    config.projection_poll_interval = std::chrono::milliseconds(20);
    return config;
}

int64_t signed_amount(const EventRecord& event) {
    examples::AccountEvent decoded;
    if (!event.payload().UnpackTo(&decoded)) {
        throw ProjectionHandlerError(kBalances, "undecodable account event " + event.event_id());
    }
    switch (decoded.event_case()) {
        case examples::AccountEvent::kOpened: return decoded.opened().balance();
        case examples::AccountEvent::kDeposited: return decoded.deposited().amount();
        case examples::AccountEvent::kWithdrawn: return -decoded.withdrawn().amount();
        case examples::AccountEvent::kClosed:
        case examples::AccountEvent::EVENT_NOT_SET:
            return 0;
    }
    return 0;
}

/**
 * Running balance per stream. Poisoned amounts (13) throw.
 */
void balance_handler(const EventRecord& event, ReadModel& model) {
    int64_t amount = signed_amount(event);
    if (amount == 13) {
        throw ProjectionHandlerError(kBalances, "unlucky amount");
    }
    model.update(event.stream_id(), [amount](nlohmann::json& row) {
        row = row.is_null() ? amount : row.get<int64_t>() + amount;
    });
}

int64_t balance_of(const ProjectionEngine& engine, const std::string& stream_id) {
    auto row = engine.read_model(kBalances)->get(stream_id);
    return row ? row->get<int64_t>() : 0;
}

} // namespace

class ProjectionEngineTest : public ::testing::Test {
protected:
    ProjectionEngineTest() : runtime(quiet_config()), engine(runtime) {}

    void append(const std::string& stream_id, std::vector<NewEvent> events) {
        ASSERT_TRUE(runtime.events().append(stream_id, kAnyVersion, events).ok());
    }

    ProjectionOptions options(DeadLetterPolicy policy = DeadLetterPolicy::Skip,
                              std::size_t partitions = 1) {
        ProjectionOptions result;
        result.dead_letter_policy = policy;
        result.partitions = partitions;
        result.batch_size = 4;
        return result;
    }

    RuntimeContext runtime;
    ProjectionEngine engine;
};

// =============================================================================
// Catch-up
// =============================================================================

TEST_F(ProjectionEngineTest, CatchUp_ShouldApplyOnlySubscribedTypes) {
    engine.subscribe(kBalances, {"Deposited"}, balance_handler, options());
    append("acc-1", {deposited(10), withdrawn(5), deposited(3)});
    append("acc-2", {deposited(7)});

    EXPECT_EQ(engine.catch_up(kBalances), 4u);

    EXPECT_EQ(balance_of(engine, "acc-1"), 13);
    EXPECT_EQ(balance_of(engine, "acc-2"), 7);
    EXPECT_EQ(engine.checkpoint(kBalances).position(), 4u);
    EXPECT_EQ(engine.status(kBalances), PROJECTION_RUNNING);
}

TEST_F(ProjectionEngineTest, CatchUp_AtHead_ShouldAdvanceNothing) {
    engine.subscribe(kBalances, {}, balance_handler, options());
    append("acc-1", {deposited(10)});
    engine.catch_up();

    EXPECT_EQ(engine.catch_up(kBalances), 0u);
    EXPECT_EQ(balance_of(engine, "acc-1"), 10);
}

TEST_F(ProjectionEngineTest, Subscribe_Invalid_ShouldThrow) {
    engine.subscribe(kBalances, {}, balance_handler, options());

    EXPECT_THROW(engine.subscribe(kBalances, {}, balance_handler, options()), ValidationError);
    EXPECT_THROW(engine.subscribe("", {}, balance_handler, options()), ValidationError);
    EXPECT_THROW(engine.subscribe("other", {}, nullptr, options()), ValidationError);
    auto zero_batch = options();
    zero_batch.batch_size = 0;
    EXPECT_THROW(engine.subscribe("other", {}, balance_handler, zero_batch), ValidationError);
    EXPECT_THROW(engine.status("missing"), ValidationError);
    EXPECT_EQ(engine.projections(), std::vector<std::string>{kBalances});
}

// =============================================================================
// Dead letters
// =============================================================================

TEST_F(ProjectionEngineTest, HandlerFailure_SkipPolicy_ShouldDeadLetterAndContinue) {
    engine.subscribe(kBalances, {}, balance_handler, options(DeadLetterPolicy::Skip));
    append("acc-1", {deposited(10), deposited(13), deposited(5)});
    LogCapture capture(LogLevel::Error);

    engine.catch_up(kBalances);

    EXPECT_EQ(balance_of(engine, "acc-1"), 15);
    EXPECT_EQ(engine.checkpoint(kBalances).position(), 3u);
    EXPECT_EQ(engine.status(kBalances), PROJECTION_RUNNING);

    auto letters = engine.dead_letters(kBalances);
    ASSERT_EQ(letters.size(), 1u);
    EXPECT_EQ(letters[0].event().global_position(), 2u);
    EXPECT_EQ(letters[0].error(), "Projection balances: unlucky amount");
    EXPECT_TRUE(letters[0].has_failed_at());

    auto logged = capture.with_message("handler_failed");
    ASSERT_EQ(logged.size(), 1u);
    EXPECT_EQ(logged[0]["projection"], kBalances);
    EXPECT_EQ(logged[0]["position"], 2);
}

TEST_F(ProjectionEngineTest, HandlerFailure_HaltPolicy_ShouldStopUntilResumed) {
    engine.subscribe(kBalances, {}, balance_handler, options(DeadLetterPolicy::Halt));
    append("acc-1", {deposited(10), deposited(13), deposited(5)});

    // Given the projection halted on the poisoned event
    engine.catch_up(kBalances);
    EXPECT_EQ(engine.status(kBalances), PROJECTION_FAILED);
    EXPECT_EQ(engine.checkpoint(kBalances).position(), 1u);
    EXPECT_EQ(balance_of(engine, "acc-1"), 10);

    // When more events arrive they are not applied
    append("acc-1", {deposited(1)});
    EXPECT_EQ(engine.catch_up(kBalances), 0u);
    EXPECT_FALSE(engine.wait_for(kBalances, 4, std::chrono::milliseconds(10)));

    // And resuming without skipping hits the same event again
    engine.resume(kBalances);
    engine.catch_up(kBalances);
    EXPECT_EQ(engine.status(kBalances), PROJECTION_FAILED);
    EXPECT_EQ(engine.dead_letters(kBalances).size(), 2u);

    // Then skipping it lets the projection reach the head
    engine.resume(kBalances, true);
    EXPECT_EQ(engine.status(kBalances), PROJECTION_RUNNING);
    engine.catch_up(kBalances);
    EXPECT_EQ(balance_of(engine, "acc-1"), 16);
    EXPECT_EQ(engine.checkpoint(kBalances).position(), 4u);
}

TEST_F(ProjectionEngineTest, HandlerThrowsNonStandardType_ShouldDeadLetter) {
    engine.subscribe(kBalances, {}, [](const EventRecord& event, ReadModel& model) {
        if (signed_amount(event) == 13) throw 42;
        balance_handler(event, model);
    }, options(DeadLetterPolicy::Skip));
    append("acc-1", {deposited(10), deposited(13), deposited(5)});

    engine.catch_up(kBalances);

    EXPECT_EQ(balance_of(engine, "acc-1"), 15);
    EXPECT_EQ(engine.checkpoint(kBalances).position(), 3u);
    auto letters = engine.dead_letters(kBalances);
    ASSERT_EQ(letters.size(), 1u);
    EXPECT_EQ(letters[0].event().global_position(), 2u);
    EXPECT_EQ(letters[0].error(), "unknown error");
}

TEST_F(ProjectionEngineTest, BackgroundWorker_NonStandardThrow_ShouldHaltOnlyThatProjection) {
    // Given a halting projection whose handler throws an int, beside a healthy one
    engine.subscribe(kBalances, {}, [](const EventRecord& event, ReadModel& model) {
        if (signed_amount(event) == 13) throw 42;
        balance_handler(event, model);
    }, options(DeadLetterPolicy::Halt));
    std::atomic<int> seen{0};
    engine.subscribe("counter", {}, [&seen](const EventRecord&, ReadModel&) { ++seen; },
                     options());
    engine.start();

    // When the poisoned event is tailed by the worker threads
    append("acc-1", {deposited(4), deposited(13), deposited(1)});

    // Then the process survives, the projection halts and the other keeps up
    EXPECT_TRUE(engine.wait_for("counter", 3, std::chrono::seconds(5)));
    EXPECT_TRUE(eventually([&] { return engine.status(kBalances) == PROJECTION_FAILED; }));
    EXPECT_EQ(engine.checkpoint(kBalances).position(), 1u);
    EXPECT_EQ(balance_of(engine, "acc-1"), 4);
    EXPECT_TRUE(runtime.events().append("acc-1", kAnyVersion, {deposited(2)}).ok());
    engine.stop();
}

TEST_F(ProjectionEngineTest, HaltedProjection_ShouldNotStallOthers) {
    engine.subscribe(kBalances, {}, balance_handler, options(DeadLetterPolicy::Halt));
    std::atomic<int> seen{0};
    engine.subscribe("counter", {}, [&seen](const EventRecord&, ReadModel&) { ++seen; },
                     options());
    append("acc-1", {deposited(13), deposited(1), deposited(2)});

    engine.catch_up();

    EXPECT_EQ(engine.status(kBalances), PROJECTION_FAILED);
    EXPECT_EQ(engine.checkpoint("counter").position(), 3u);
    EXPECT_EQ(seen.load(), 3);
}

// =============================================================================
// Rebuild
// =============================================================================

TEST_F(ProjectionEngineTest, Rebuild_ShouldEqualLiveModel) {
    engine.subscribe(kBalances, {}, balance_handler);

    // Interleave appends with live catch-up across 10,000 events.
    for (int batch = 0; batch < 100; ++batch) {
        for (int s = 0; s < 10; ++s) {
            std::vector<NewEvent> events;
            for (int i = 0; i < 10; ++i) {
                events.push_back((i % 4 == 3) ? withdrawn(2) : deposited(3));
            }
            append("acc-" + std::to_string(s), events);
        }
        if (batch % 7 == 0) engine.catch_up(kBalances);
    }
    engine.catch_up(kBalances);
    ASSERT_EQ(engine.checkpoint(kBalances).position(), 10000u);
    auto live = engine.read_model(kBalances)->rows();

    EXPECT_EQ(engine.rebuild(kBalances), RebuildResult::Completed);

    auto rebuilt = engine.read_model(kBalances);
    EXPECT_EQ(rebuilt->rows(), live);
    EXPECT_EQ(engine.checkpoint(kBalances).position(), 10000u);
    EXPECT_EQ(engine.status(kBalances), PROJECTION_RUNNING);
    EXPECT_EQ(live.at("acc-0"), 100 * (3 * 8 - 2 * 2));
}

TEST_F(ProjectionEngineTest, CancelRebuild_ShouldKeepPreviousModel) {
    std::atomic<bool> hold{false};
    std::atomic<bool> entered{false};
    engine.subscribe(kBalances, {}, [&](const EventRecord& event, ReadModel& model) {
        if (hold.load()) {
            entered = true;
            while (hold.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        balance_handler(event, model);
    }, options());
    append("acc-1", {deposited(10), deposited(20)});
    engine.catch_up(kBalances);
    auto before = engine.read_model(kBalances);

    hold = true;
    auto rebuilding = engine.rebuild_async(kBalances);
    ASSERT_TRUE(eventually([&] { return entered.load(); }));
    EXPECT_EQ(engine.status(kBalances), PROJECTION_REBUILDING);
    // The old model stays queryable while the rebuild runs.
    EXPECT_EQ(balance_of(engine, "acc-1"), 30);

    EXPECT_TRUE(engine.cancel_rebuild(kBalances));
    hold = false;

    EXPECT_EQ(rebuilding.get(), RebuildResult::Cancelled);
    EXPECT_EQ(engine.read_model(kBalances), before);
    EXPECT_EQ(engine.status(kBalances), PROJECTION_RUNNING);
    EXPECT_EQ(engine.checkpoint(kBalances).position(), 2u);
    EXPECT_FALSE(engine.cancel_rebuild(kBalances));
}

TEST_F(ProjectionEngineTest, Rebuild_WithConcurrentAppends_ShouldApplyThemAfterHead) {
    std::atomic<bool> hold{false};
    std::atomic<bool> entered{false};
    engine.subscribe(kBalances, {}, [&](const EventRecord& event, ReadModel& model) {
        if (hold.load()) {
            entered = true;
            while (hold.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        balance_handler(event, model);
    }, options());
    append("acc-1", {deposited(10)});
    append("acc-2", {deposited(20)});
    engine.catch_up(kBalances);

    // Given a rebuild paused part way to the head it recorded (position 2)
    hold = true;
    auto rebuilding = engine.rebuild_async(kBalances);
    ASSERT_TRUE(eventually([&] { return entered.load(); }));

    // When new events commit while it is in flight
    append("acc-1", {deposited(5)});
    append("acc-2", {withdrawn(7)});
    hold = false;

    // Then the rebuild stops at its recorded head
    EXPECT_EQ(rebuilding.get(), RebuildResult::Completed);
    EXPECT_EQ(engine.checkpoint(kBalances).position(), 2u);
    EXPECT_EQ(balance_of(engine, "acc-1"), 10);
    EXPECT_EQ(balance_of(engine, "acc-2"), 20);

    // And catch-up applies the later events to the swapped model exactly once
    EXPECT_EQ(engine.catch_up(kBalances), 2u);
    EXPECT_EQ(engine.checkpoint(kBalances).position(), 4u);
    EXPECT_EQ(balance_of(engine, "acc-1"), 15);
    EXPECT_EQ(balance_of(engine, "acc-2"), 13);
    EXPECT_EQ(engine.read_model(kBalances)->applied_position(), 4u);
}

TEST_F(ProjectionEngineTest, Rebuild_WithHaltingHandler_ShouldReportFailed) {
    engine.subscribe(kBalances, {}, balance_handler, options(DeadLetterPolicy::Halt));
    append("acc-1", {deposited(10)});
    engine.catch_up(kBalances);
    append("acc-1", {deposited(13)});

    EXPECT_EQ(engine.rebuild(kBalances), RebuildResult::Failed);
    EXPECT_EQ(balance_of(engine, "acc-1"), 10);
    EXPECT_EQ(engine.status(kBalances), PROJECTION_RUNNING);
}

// =============================================================================
// Partitions and ordering
// =============================================================================

TEST_F(ProjectionEngineTest, Partitions_ShouldPreserveOrderWithinStream) {
    engine.subscribe("versions", {}, [](const EventRecord& event, ReadModel& model) {
        model.update(event.stream_id(), [&event](nlohmann::json& row) {
            if (row.is_null()) row = nlohmann::json::array();
            row.push_back(event.stream_version());
        });
    }, options(DeadLetterPolicy::Skip, 4));

    for (int round = 0; round < 5; ++round) {
        for (int s = 0; s < 8; ++s) {
            append("acc-" + std::to_string(s), {deposited(1), deposited(1)});
        }
    }
    engine.catch_up("versions");

    auto rows = engine.read_model("versions")->rows();
    ASSERT_EQ(rows.size(), 8u);
    for (const auto& [stream, versions] : rows) {
        ASSERT_EQ(versions.size(), 10u) << stream;
        for (std::size_t i = 0; i < versions.size(); ++i) {
            EXPECT_EQ(versions[i].get<uint64_t>(), i + 1) << stream;
        }
    }
}

// =============================================================================
// Checkpoints and background tailing
// =============================================================================

TEST_F(ProjectionEngineTest, StoredCheckpoint_ShouldResumeWithoutRedelivery) {
    append("acc-1", {deposited(1), deposited(2), deposited(3)});
    {
        ProjectionEngine first(runtime);
        first.subscribe(kBalances, {}, balance_handler, options());
        first.catch_up();
        ASSERT_EQ(first.checkpoint(kBalances).position(), 3u);
    }

    LogCapture capture(LogLevel::Info);
    ProjectionEngine second(runtime);
    std::atomic<int> delivered{0};
    second.subscribe(kBalances, {}, [&delivered](const EventRecord&, ReadModel&) {
        ++delivered;
    }, options());
    append("acc-1", {deposited(4), deposited(5)});
    second.catch_up();

    EXPECT_EQ(delivered.load(), 2);
    EXPECT_EQ(second.checkpoint(kBalances).position(), 5u);
    auto restored = capture.with_message("checkpoint_restored");
    ASSERT_EQ(restored.size(), 1u);
    EXPECT_EQ(restored[0]["position"], 3);
}

TEST_F(ProjectionEngineTest, Start_ShouldTailNewCommits) {
    engine.subscribe(kBalances, {}, balance_handler, options());
    engine.start();
    EXPECT_TRUE(engine.running());

    append("acc-1", {deposited(40)});
    append("acc-2", {deposited(2), withdrawn(1)});

    EXPECT_TRUE(engine.wait_for(kBalances, runtime.events().head_position(),
                                std::chrono::seconds(5)));
    EXPECT_EQ(balance_of(engine, "acc-1"), 40);
    EXPECT_EQ(balance_of(engine, "acc-2"), 1);

    engine.stop();
    EXPECT_FALSE(engine.running());
}

TEST_F(ProjectionEngineTest, SubscribeWhileRunning_ShouldCatchUpFromStart) {
    append("acc-1", {deposited(5), deposited(6)});
    engine.start();

    engine.subscribe(kBalances, {}, balance_handler, options());

    EXPECT_TRUE(engine.wait_for(kBalances, 2, std::chrono::seconds(5)));
    EXPECT_EQ(balance_of(engine, "acc-1"), 11);
    engine.stop();
}
