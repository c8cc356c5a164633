#include <gtest/gtest.h>

#include "hybridrag/deadline_guard.hpp"
#include "hybridrag/error.hpp"
#include "test_fakes.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace hybridrag;
using namespace std::chrono_literals;
using hybridrag::test::sleep_or_cancel;

namespace {

BoundedOperation<int> after(std::string name, std::chrono::milliseconds delay, int value,
                            std::optional<std::chrono::milliseconds> sub_budget = std::nullopt) {
    BoundedOperation<int> op;
    op.name = std::move(name);
    op.sub_budget = sub_budget;
    op.call = [delay, value](const CancellationToken& token) {
        sleep_or_cancel(delay, token);
        return value;
    };
    return op;
}

class DeadlineGuardTest : public ::testing::Test {
protected:
    TaskPool pool_{4};
};

} // namespace

TEST_F(DeadlineGuardTest, AllCompleteReturnsEveryValueInOrder) {
    DeadlineGuard guard(pool_, 1000ms);
    std::vector<BoundedOperation<int>> ops;
    ops.push_back(after("slowish", 20ms, 1));
    ops.push_back(after("fast", 0ms, 2));
    auto results = guard.run_bounded(std::move(ops));

    ASSERT_EQ(results.outcomes.size(), 2u);
    EXPECT_EQ(results.outcomes[0].name, "slowish");
    EXPECT_EQ(*results.outcomes[0].value, 1);
    EXPECT_EQ(*results.outcomes[1].value, 2);
    EXPECT_TRUE(results.outcomes[0].started);
    EXPECT_TRUE(results.outcomes[1].started);
    EXPECT_FALSE(results.no_usable_result());
    EXPECT_LT(results.elapsed_ms, 900.0);
}

TEST_F(DeadlineGuardTest, SlowOperationTimesOutWithoutBlockingCaller) {
    DeadlineGuard guard(pool_, 60ms);
    auto straggler_done = std::make_shared<std::atomic<bool>>(false);

    std::vector<BoundedOperation<int>> ops;
    ops.push_back(after("fast", 0ms, 1));
    BoundedOperation<int> slow;
    slow.name = "slow";
    slow.call = [straggler_done](const CancellationToken& token) {
        try {
            sleep_or_cancel(5000ms, token);
        } catch (const CancelledError&) {
            *straggler_done = true;
            throw;
        }
        return 2;
    };
    ops.push_back(std::move(slow));

    const auto start = std::chrono::steady_clock::now();
    auto results = guard.run_bounded(std::move(ops));
    const auto took = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(results.outcomes[0].completed());
    EXPECT_EQ(results.outcomes[1].status, OutcomeStatus::kTimedOut);
    EXPECT_FALSE(results.outcomes[1].value.has_value());
    EXPECT_TRUE(results.outcomes[1].started);
    EXPECT_FALSE(results.no_usable_result());
    EXPECT_LT(took, 1000ms);

    // Expiry cancels the straggler's token; it unwinds soon after.
    for (int i = 0; i < 200 && !*straggler_done; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(straggler_done->load());
}

TEST_F(DeadlineGuardTest, SubBudgetTightensOneOperation) {
    DeadlineGuard guard(pool_, 1000ms);
    std::vector<BoundedOperation<int>> ops;
    ops.push_back(after("bounded", 500ms, 1, 30ms));
    ops.push_back(after("free", 50ms, 2));

    auto results = guard.run_bounded(std::move(ops));
    EXPECT_EQ(results.outcomes[0].status, OutcomeStatus::kTimedOut);
    EXPECT_TRUE(results.outcomes[1].completed());
    EXPECT_LT(results.elapsed_ms, 900.0);
}

TEST_F(DeadlineGuardTest, FailuresAreCapturedNotThrown) {
    DeadlineGuard guard(pool_, 500ms);
    std::vector<BoundedOperation<int>> ops;
    BoundedOperation<int> failing;
    failing.name = "failing";
    failing.call = [](const CancellationToken&) -> int { throw std::runtime_error("store down"); };
    ops.push_back(std::move(failing));

    auto results = guard.run_bounded(std::move(ops));
    ASSERT_EQ(results.outcomes[0].status, OutcomeStatus::kFailed);
    EXPECT_TRUE(results.no_usable_result());
    EXPECT_THROW(std::rethrow_exception(results.outcomes[0].error), std::runtime_error);
}

TEST_F(DeadlineGuardTest, AllTimedOutIsNoUsableResult) {
    DeadlineGuard guard(pool_, 20ms);
    std::vector<BoundedOperation<int>> ops;
    ops.push_back(after("a", 2000ms, 1));
    ops.push_back(after("b", 2000ms, 2));

    auto results = guard.run_bounded(std::move(ops));
    EXPECT_TRUE(results.no_usable_result());
    EXPECT_EQ(results.outcomes[0].status, OutcomeStatus::kTimedOut);
    EXPECT_EQ(results.outcomes[1].status, OutcomeStatus::kTimedOut);
}

TEST_F(DeadlineGuardTest, ParentCancellationCancelsPendingOperations) {
    DeadlineGuard guard(pool_, 5000ms);
    CancellationSource caller;

    std::vector<BoundedOperation<int>> ops;
    ops.push_back(after("fast", 0ms, 1));
    ops.push_back(after("slow", 5000ms, 2));

    std::thread canceller([&] {
        std::this_thread::sleep_for(40ms);
        caller.cancel();
    });
    auto results = guard.run_bounded(std::move(ops), caller.token());
    canceller.join();

    EXPECT_TRUE(results.outcomes[0].completed());
    EXPECT_EQ(results.outcomes[1].status, OutcomeStatus::kCancelled);
    EXPECT_LT(results.elapsed_ms, 2000.0);
}

TEST_F(DeadlineGuardTest, AlreadyCancelledParentSettlesImmediately) {
    DeadlineGuard guard(pool_, 5000ms);
    CancellationSource caller;
    caller.cancel();

    std::vector<BoundedOperation<int>> ops;
    ops.push_back(after("slow", 5000ms, 1));
    auto results = guard.run_bounded(std::move(ops), caller.token());
    EXPECT_EQ(results.outcomes[0].status, OutcomeStatus::kCancelled);
    EXPECT_LT(results.elapsed_ms, 2000.0);
}

TEST_F(DeadlineGuardTest, EmptyOperationSetReturnsImmediately) {
    DeadlineGuard guard(pool_, 100ms);
    auto results = guard.run_bounded(std::vector<BoundedOperation<int>>{});
    EXPECT_TRUE(results.outcomes.empty());
    EXPECT_TRUE(results.no_usable_result());
}

TEST(DeadlineTest, RemainingNeverNegative) {
    auto past = Deadline(Clock::now() - 10ms);
    EXPECT_TRUE(past.expired());
    EXPECT_EQ(past.remaining(), 0ms);

    auto future = Deadline::after(1000ms);
    EXPECT_FALSE(future.expired());
    EXPECT_GT(future.remaining(), 500ms);
}
