#pragma once

#include "hybridrag/error.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

namespace hybridrag {

enum class BreakerState {
    kClosed,
    kOpen,
    kHalfOpen,
};

const char* to_string(BreakerState state) noexcept;

struct BreakerConfig {
    std::uint32_t failure_threshold = 5;
    std::chrono::milliseconds cooldown{30000};
};

struct BreakerSnapshot {
    std::string name;
    BreakerState state = BreakerState::kClosed;
    std::uint32_t consecutive_failures = 0;
    std::chrono::steady_clock::time_point last_transition;
    std::uint32_t failure_threshold = 0;
    std::chrono::milliseconds cooldown{0};
    bool trial_in_flight = false;
};

/**
 * Failure-tracking state machine guarding one downstream dependency.
 *
 *   Closed   --threshold consecutive failures-->  Open
 *   Open     --cooldown elapsed, next caller-->   HalfOpen (that caller is the trial)
 *   HalfOpen --trial succeeds-->                  Closed
 *   HalfOpen --trial fails-->                     Open (cooldown restarts)
 *
 * While HalfOpen exactly one trial is admitted; every other call fails fast
 * with CircuitOpenError until the trial resolves. All transitions happen
 * under one mutex. One instance per dependency, shared by every request.
 */
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    /**
     * Admission ticket for one call. Resolve it exactly once with succeed(),
     * fail() or release(); an unresolved permit counts as a failure when
     * destroyed. release() records nothing (the outcome said nothing about
     * the dependency's health) but frees the HalfOpen trial slot.
     */
    class Permit {
    public:
        Permit() = default;
        ~Permit();

        Permit(Permit&& other) noexcept;
        Permit& operator=(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        void succeed();
        void fail();
        void release();

        bool active() const { return breaker_ != nullptr; }
        bool is_trial() const { return trial_; }

    private:
        friend class CircuitBreaker;
        Permit(CircuitBreaker* breaker, std::uint64_t generation, bool trial)
            : breaker_(breaker), generation_(generation), trial_(trial) {}

        // fail() for destruction and reassignment, which must not throw.
        void fail_quietly() noexcept;

        CircuitBreaker* breaker_ = nullptr;
        std::uint64_t generation_ = 0;
        bool trial_ = false;
    };

    CircuitBreaker(std::string name, BreakerConfig config, ClockFn clock = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // Throws CircuitOpenError without side effects when the call is rejected.
    Permit acquire();

    // Runs op under a permit; op's exception is recorded as a failure and rethrown.
    template<typename F>
    auto execute(F&& op) -> std::invoke_result_t<F> {
        Permit permit = acquire();
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<F>>) {
                std::forward<F>(op)();
                permit.succeed();
            } else {
                auto result = std::forward<F>(op)();
                permit.succeed();
                return result;
            }
        } catch (const CancelledError&) {
            permit.release();
            throw;
        } catch (...) {
            permit.fail();
            throw;
        }
    }

    BreakerState state() const;
    BreakerSnapshot snapshot() const;
    const std::string& name() const { return name_; }

    // Forces Closed and clears counters.
    void reset();

private:
    enum class Resolution { kSuccess, kFailure, kRelease };

    void resolve(std::uint64_t generation, bool trial, Resolution resolution);

    // Caller holds mutex_.
    void transition_locked(BreakerState to, Clock::time_point now);
    void promote_if_cooled_locked(Clock::time_point now);

    const std::string name_;
    const BreakerConfig config_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    BreakerState state_ = BreakerState::kClosed;
    std::uint32_t consecutive_failures_ = 0;
    Clock::time_point last_transition_;
    bool trial_in_flight_ = false;
    // Bumped on every transition; results from older generations are ignored.
    std::uint64_t generation_ = 0;
};

} // namespace hybridrag
