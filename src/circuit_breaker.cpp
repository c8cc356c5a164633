#include "hybridrag/circuit_breaker.hpp"
#include "hybridrag/logging.hpp"
#include "hybridrag/metrics.hpp"

#include <exception>
#include <utility>

namespace hybridrag {

const char* to_string(BreakerState state) noexcept {
    switch (state) {
        case BreakerState::kClosed: return "closed";
        case BreakerState::kOpen: return "open";
        case BreakerState::kHalfOpen: return "half_open";
    }
    return "unknown";
}

// Permit

CircuitBreaker::Permit::~Permit() {
    if (breaker_) {
        fail_quietly();
    }
}

CircuitBreaker::Permit::Permit(Permit&& other) noexcept
    : breaker_(std::exchange(other.breaker_, nullptr))
    , generation_(other.generation_)
    , trial_(other.trial_) {}

CircuitBreaker::Permit& CircuitBreaker::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        if (breaker_) {
            fail_quietly();
        }
        breaker_ = std::exchange(other.breaker_, nullptr);
        generation_ = other.generation_;
        trial_ = other.trial_;
    }
    return *this;
}

void CircuitBreaker::Permit::succeed() {
    if (auto* breaker = std::exchange(breaker_, nullptr)) {
        breaker->resolve(generation_, trial_, Resolution::kSuccess);
    }
}

void CircuitBreaker::Permit::fail() {
    if (auto* breaker = std::exchange(breaker_, nullptr)) {
        breaker->resolve(generation_, trial_, Resolution::kFailure);
    }
}

void CircuitBreaker::Permit::fail_quietly() noexcept {
    try {
        fail();
    } catch (const std::exception& e) {
        HYBRIDRAG_LOG_ERROR("circuit breaker: could not record failure of an abandoned call: {}", e.what());
    } catch (...) {
        HYBRIDRAG_LOG_ERROR("circuit breaker: could not record failure of an abandoned call");
    }
}

void CircuitBreaker::Permit::release() {
    if (auto* breaker = std::exchange(breaker_, nullptr)) {
        breaker->resolve(generation_, trial_, Resolution::kRelease);
    }
}

// CircuitBreaker

CircuitBreaker::CircuitBreaker(std::string name, BreakerConfig config, ClockFn clock)
    : name_(std::move(name))
    , config_(config)
    , clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })) {
    HYBRIDRAG_CHECK_ARGUMENT(config_.failure_threshold > 0, "failure_threshold must be positive");
    HYBRIDRAG_CHECK_ARGUMENT(config_.cooldown.count() >= 0, "cooldown must not be negative");
    last_transition_ = clock_();
}

CircuitBreaker::Permit CircuitBreaker::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    promote_if_cooled_locked(clock_());

    switch (state_) {
        case BreakerState::kClosed:
            return Permit(this, generation_, false);
        case BreakerState::kHalfOpen:
            if (!trial_in_flight_) {
                trial_in_flight_ = true;
                HYBRIDRAG_LOG_INFO("circuit breaker '{}': admitting half-open trial call", name_);
                return Permit(this, generation_, true);
            }
            break;
        case BreakerState::kOpen:
            break;
    }

    Metrics::getInstance().increment_counter("breaker_rejections", {{"breaker", name_}});
    throw CircuitOpenError(name_);
}

void CircuitBreaker::resolve(std::uint64_t generation, bool trial, Resolution resolution) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_) {
        // Admitted before the last transition; says nothing about the current state.
        return;
    }
    const auto now = clock_();

    switch (state_) {
        case BreakerState::kClosed:
            if (resolution == Resolution::kSuccess) {
                consecutive_failures_ = 0;
            } else if (resolution == Resolution::kFailure) {
                ++consecutive_failures_;
                if (consecutive_failures_ >= config_.failure_threshold) {
                    transition_locked(BreakerState::kOpen, now);
                }
            }
            break;
        case BreakerState::kHalfOpen:
            if (!trial) {
                break;
            }
            trial_in_flight_ = false;
            if (resolution == Resolution::kSuccess) {
                transition_locked(BreakerState::kClosed, now);
            } else if (resolution == Resolution::kFailure) {
                transition_locked(BreakerState::kOpen, now);
            }
            break;
        case BreakerState::kOpen:
            break;
    }
}

BreakerState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    // Reported lazily: Open reads as HalfOpen once the cooldown has elapsed.
    if (state_ == BreakerState::kOpen && clock_() - last_transition_ >= config_.cooldown) {
        return BreakerState::kHalfOpen;
    }
    return state_;
}

BreakerSnapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BreakerSnapshot snap;
    snap.name = name_;
    snap.state = state_;
    if (state_ == BreakerState::kOpen && clock_() - last_transition_ >= config_.cooldown) {
        snap.state = BreakerState::kHalfOpen;
    }
    snap.consecutive_failures = consecutive_failures_;
    snap.last_transition = last_transition_;
    snap.failure_threshold = config_.failure_threshold;
    snap.cooldown = config_.cooldown;
    snap.trial_in_flight = trial_in_flight_;
    return snap;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    transition_locked(BreakerState::kClosed, clock_());
}

void CircuitBreaker::promote_if_cooled_locked(Clock::time_point now) {
    if (state_ == BreakerState::kOpen && now - last_transition_ >= config_.cooldown) {
        transition_locked(BreakerState::kHalfOpen, now);
    }
}

void CircuitBreaker::transition_locked(BreakerState to, Clock::time_point now) {
    const BreakerState from = state_;
    state_ = to;
    last_transition_ = now;
    ++generation_;
    trial_in_flight_ = false;
    if (to == BreakerState::kClosed) {
        consecutive_failures_ = 0;
    }

    Metrics::getInstance().increment_counter("breaker_transitions",
                                             {{"breaker", name_}, {"to", to_string(to)}});
    Metrics::getInstance().set_gauge("breaker_state", static_cast<double>(to), {{"breaker", name_}});

    if (to == BreakerState::kOpen) {
        HYBRIDRAG_LOG_WARN("circuit breaker '{}': {} -> open, failing fast for {} ms",
                           name_, to_string(from), config_.cooldown.count());
    } else if (to == BreakerState::kClosed && from != BreakerState::kClosed) {
        HYBRIDRAG_LOG_INFO("circuit breaker '{}': {} -> closed", name_, to_string(from));
    } else {
        HYBRIDRAG_LOG_DEBUG("circuit breaker '{}': {} -> {}", name_, to_string(from), to_string(to));
    }
}

} // namespace hybridrag
