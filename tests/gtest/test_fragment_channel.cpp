#include <gtest/gtest.h>

#include "hybridrag/fragment_channel.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace hybridrag;
using namespace std::chrono_literals;

namespace {

std::chrono::steady_clock::time_point in(std::chrono::milliseconds d) {
    return std::chrono::steady_clock::now() + d;
}

} // namespace

TEST(FragmentChannelTest, DeliversFragmentsBeforeClose) {
    FragmentChannel channel;
    EXPECT_TRUE(channel.push("a"));
    EXPECT_TRUE(channel.push("b"));
    channel.close();
    EXPECT_FALSE(channel.push("late"));

    auto first = channel.pop_until(in(10ms));
    ASSERT_EQ(first.kind, FragmentChannel::EventKind::kFragment);
    EXPECT_EQ(first.fragment, "a");
    EXPECT_EQ(channel.pop_until(in(10ms)).fragment, "b");
    EXPECT_EQ(channel.pop_until(in(10ms)).kind, FragmentChannel::EventKind::kClosed);
    // Finished channels stay finished.
    EXPECT_EQ(channel.pop_until(in(10ms)).kind, FragmentChannel::EventKind::kClosed);
}

TEST(FragmentChannelTest, TimesOutWhenNothingArrives) {
    FragmentChannel channel;
    const auto start = std::chrono::steady_clock::now();
    auto event = channel.pop_until(in(30ms));
    EXPECT_EQ(event.kind, FragmentChannel::EventKind::kTimedOut);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(FragmentChannelTest, FailureCarriesError) {
    FragmentChannel channel;
    channel.push("partial");
    channel.fail(std::make_exception_ptr(std::runtime_error("provider down")));

    EXPECT_EQ(channel.pop_until(in(10ms)).kind, FragmentChannel::EventKind::kFragment);
    auto event = channel.pop_until(in(10ms));
    ASSERT_EQ(event.kind, FragmentChannel::EventKind::kFailed);
    EXPECT_THROW(std::rethrow_exception(event.error), std::runtime_error);
}

TEST(FragmentChannelTest, CancelStopsProducerAndDropsQueue) {
    FragmentChannel channel;
    channel.push("queued");
    channel.cancel();

    EXPECT_TRUE(channel.cancelled());
    EXPECT_FALSE(channel.push("more"));
    EXPECT_EQ(channel.pop_until(in(10ms)).kind, FragmentChannel::EventKind::kCancelled);
}

TEST(FragmentChannelTest, WakesConsumerAcrossThreads) {
    FragmentChannel channel;
    std::thread producer([&] {
        std::this_thread::sleep_for(10ms);
        channel.push("hello");
        channel.close();
    });

    auto event = channel.pop_until(in(2000ms));
    EXPECT_EQ(event.kind, FragmentChannel::EventKind::kFragment);
    EXPECT_EQ(event.fragment, "hello");
    EXPECT_EQ(channel.pop_until(in(2000ms)).kind, FragmentChannel::EventKind::kClosed);
    producer.join();
}

TEST(FragmentChannelTest, EventKindNames) {
    EXPECT_STREQ(to_string(FragmentChannel::EventKind::kTimedOut), "timed_out");
    EXPECT_STREQ(to_string(FragmentChannel::EventKind::kCancelled), "cancelled");
}
