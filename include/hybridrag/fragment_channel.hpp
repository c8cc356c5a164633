#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <string>

namespace hybridrag {

/**
 * Single-producer, single-consumer channel of streamed text fragments.
 *
 * The producer push()es fragments and finishes with close() or fail(). The
 * consumer drains with pop_until() and may cancel(), after which push()
 * returns false so the producer stops. Finite and non-restartable: once
 * closed, failed or cancelled the channel stays that way.
 */
class FragmentChannel {
public:
    enum class EventKind {
        kFragment,
        kClosed,
        kFailed,
        kTimedOut,
        kCancelled,
    };

    struct Event {
        EventKind kind = EventKind::kTimedOut;
        std::string fragment;       // kFragment
        std::exception_ptr error;   // kFailed
    };

    FragmentChannel() = default;
    FragmentChannel(const FragmentChannel&) = delete;
    FragmentChannel& operator=(const FragmentChannel&) = delete;

    // Producer side. push() returns false once the consumer has cancelled or
    // the channel is already finished.
    bool push(std::string fragment);
    void close();
    void fail(std::exception_ptr error);

    // Consumer side.
    void cancel();
    bool cancelled() const;

    // Blocks until a fragment is queued, the channel finishes or the deadline
    // passes. Queued fragments are delivered before kClosed / kFailed.
    Event pop_until(std::chrono::steady_clock::time_point deadline);

private:
    enum class Phase { kOpen, kClosed, kFailed, kCancelled };

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<std::string> fragments_;
    Phase phase_ = Phase::kOpen;
    std::exception_ptr error_;
};

const char* to_string(FragmentChannel::EventKind kind) noexcept;

} // namespace hybridrag
