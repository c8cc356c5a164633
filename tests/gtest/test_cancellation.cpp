#include <gtest/gtest.h>

#include "hybridrag/cancellation.hpp"
#include "hybridrag/error.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace hybridrag;
using namespace std::chrono_literals;

TEST(CancellationTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.can_be_cancelled());
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_NO_THROW(token.throw_if_cancelled());

    bool ran = false;
    auto registration = token.register_callback([&] { ran = true; });
    EXPECT_FALSE(ran);
}

TEST(CancellationTest, CancelRunsCallbacksOnce) {
    CancellationSource source;
    auto token = source.token();
    int runs = 0;
    auto registration = token.register_callback([&] { ++runs; });

    source.cancel();
    source.cancel();

    EXPECT_TRUE(token.is_cancelled());
    EXPECT_EQ(runs, 1);
    EXPECT_THROW(token.throw_if_cancelled(), CancelledError);
}

TEST(CancellationTest, RegisteringOnCancelledTokenRunsImmediately) {
    CancellationSource source;
    source.cancel();

    bool ran = false;
    auto registration = source.token().register_callback([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(CancellationTest, DestroyedRegistrationDoesNotRun) {
    CancellationSource source;
    bool ran = false;
    {
        auto registration = source.token().register_callback([&] { ran = true; });
    }
    source.cancel();
    EXPECT_FALSE(ran);
}

TEST(CancellationTest, ResetRemovesCallback) {
    CancellationSource source;
    bool ran = false;
    auto registration = source.token().register_callback([&] { ran = true; });
    registration.reset();
    source.cancel();
    EXPECT_FALSE(ran);
}

TEST(CancellationTest, LinkedSourceFollowsParent) {
    CancellationSource parent;
    CancellationSource child(parent.token());
    CancellationSource sibling(parent.token());

    child.cancel();
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_FALSE(parent.is_cancelled());
    EXPECT_FALSE(sibling.is_cancelled());

    parent.cancel();
    EXPECT_TRUE(sibling.is_cancelled());
}

TEST(CancellationTest, LinkedToCancelledParentStartsCancelled) {
    CancellationSource parent;
    parent.cancel();
    CancellationSource child(parent.token());
    EXPECT_TRUE(child.token().is_cancelled());
}

TEST(CancellationTest, ChildOutlivedByParentIsSafe) {
    CancellationSource parent;
    {
        CancellationSource child(parent.token());
    }
    EXPECT_NO_THROW(parent.cancel());
}

TEST(CancellationTest, DeregistrationWaitsForRunningCallback) {
    CancellationSource source;
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};

    auto registration = source.token().register_callback([&] {
        started = true;
        std::this_thread::sleep_for(50ms);
        finished = true;
    });

    std::thread canceller([&] { source.cancel(); });
    while (!started) {
        std::this_thread::yield();
    }
    registration.reset();
    EXPECT_TRUE(finished.load());
    canceller.join();
}
