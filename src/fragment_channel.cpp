#include "hybridrag/fragment_channel.hpp"

#include <utility>

namespace hybridrag {

const char* to_string(FragmentChannel::EventKind kind) noexcept {
    switch (kind) {
        case FragmentChannel::EventKind::kFragment: return "fragment";
        case FragmentChannel::EventKind::kClosed: return "closed";
        case FragmentChannel::EventKind::kFailed: return "failed";
        case FragmentChannel::EventKind::kTimedOut: return "timed_out";
        case FragmentChannel::EventKind::kCancelled: return "cancelled";
    }
    return "unknown";
}

bool FragmentChannel::push(std::string fragment) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != Phase::kOpen) {
            return false;
        }
        fragments_.push_back(std::move(fragment));
    }
    ready_.notify_one();
    return true;
}

void FragmentChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != Phase::kOpen) {
            return;
        }
        phase_ = Phase::kClosed;
    }
    ready_.notify_all();
}

void FragmentChannel::fail(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ != Phase::kOpen) {
            return;
        }
        phase_ = Phase::kFailed;
        error_ = std::move(error);
    }
    ready_.notify_all();
}

void FragmentChannel::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (phase_ == Phase::kCancelled) {
            return;
        }
        phase_ = Phase::kCancelled;
        fragments_.clear();
    }
    ready_.notify_all();
}

bool FragmentChannel::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_ == Phase::kCancelled;
}

FragmentChannel::Event FragmentChannel::pop_until(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait_until(lock, deadline, [this] {
        return !fragments_.empty() || phase_ != Phase::kOpen;
    });

    Event event;
    if (phase_ == Phase::kCancelled) {
        event.kind = EventKind::kCancelled;
    } else if (!fragments_.empty()) {
        event.kind = EventKind::kFragment;
        event.fragment = std::move(fragments_.front());
        fragments_.pop_front();
    } else if (phase_ == Phase::kClosed) {
        event.kind = EventKind::kClosed;
    } else if (phase_ == Phase::kFailed) {
        event.kind = EventKind::kFailed;
        event.error = error_;
    } else {
        event.kind = EventKind::kTimedOut;
    }
    return event;
}

} // namespace hybridrag
