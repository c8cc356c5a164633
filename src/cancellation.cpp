#include "hybridrag/cancellation.hpp"
#include "hybridrag/error.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>

namespace hybridrag {
namespace detail {

class CancellationState {
public:
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Returns 0 when already cancelled; the caller then runs the callback itself.
    std::uint64_t add(std::function<void()> callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load(std::memory_order_relaxed)) {
            return 0;
        }
        const std::uint64_t id = ++next_id_;
        callbacks_.emplace_back(id, std::move(callback));
        return id;
    }

    void remove(std::uint64_t id) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                               [id](const auto& entry) { return entry.first == id; });
        if (it != callbacks_.end()) {
            callbacks_.erase(it);
            return;
        }
        // Deregistering from inside the callback itself must not wait on itself.
        if (running_id_ == id && runner_ != std::this_thread::get_id()) {
            idle_.wait(lock, [this, id] { return running_id_ != id; });
        }
    }

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_.load(std::memory_order_relaxed)) {
                return;
            }
            cancelled_.store(true, std::memory_order_release);
            runner_ = std::this_thread::get_id();
        }

        for (;;) {
            std::function<void()> callback;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (callbacks_.empty()) {
                    break;
                }
                running_id_ = callbacks_.front().first;
                callback = std::move(callbacks_.front().second);
                callbacks_.pop_front();
            }

            struct RunningReset {
                CancellationState* self;
                ~RunningReset() {
                    std::lock_guard<std::mutex> lock(self->mutex_);
                    self->running_id_ = 0;
                    self->idle_.notify_all();
                }
            } reset{this};

            callback();
        }
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable idle_;
    std::deque<std::pair<std::uint64_t, std::function<void()>>> callbacks_;
    std::uint64_t next_id_ = 0;
    std::uint64_t running_id_ = 0;
    std::thread::id runner_;
};

} // namespace detail

CallbackRegistration::~CallbackRegistration() {
    reset();
}

CallbackRegistration::CallbackRegistration(CallbackRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

CallbackRegistration& CallbackRegistration::operator=(CallbackRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void CallbackRegistration::reset() {
    if (state_ && id_ != 0) {
        state_->remove(id_);
    }
    state_.reset();
    id_ = 0;
}

bool CancellationToken::is_cancelled() const {
    return state_ && state_->cancelled();
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw CancelledError();
    }
}

CallbackRegistration CancellationToken::register_callback(std::function<void()> callback) const {
    if (!state_) {
        return {};
    }
    const std::uint64_t id = state_->add(callback);
    if (id == 0) {
        callback();
        return {};
    }
    return CallbackRegistration(state_, id);
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : state_(std::make_shared<detail::CancellationState>()) {
    std::weak_ptr<detail::CancellationState> weak = state_;
    parent_link_ = parent.register_callback([weak] {
        if (auto child = weak.lock()) {
            child->cancel();
        }
    });
}

void CancellationSource::cancel() {
    if (state_) {
        state_->cancel();
    }
}

bool CancellationSource::is_cancelled() const {
    return state_ && state_->cancelled();
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

} // namespace hybridrag
