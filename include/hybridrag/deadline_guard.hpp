#pragma once

#include "hybridrag/cancellation.hpp"
#include "hybridrag/logging.hpp"
#include "hybridrag/task_pool.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hybridrag {

using Clock = std::chrono::steady_clock;

// Absolute point in time a piece of work must finish by.
class Deadline {
public:
    explicit Deadline(Clock::time_point at) : at_(at) {}

    static Deadline after(std::chrono::milliseconds budget) {
        return Deadline(Clock::now() + budget);
    }

    Clock::time_point at() const { return at_; }
    bool expired() const { return Clock::now() >= at_; }

    std::chrono::milliseconds remaining() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at_ - Clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

private:
    Clock::time_point at_;
};

inline double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

enum class OutcomeStatus {
    kCompleted,
    kFailed,
    kTimedOut,
    kCancelled,
};

inline const char* to_string(OutcomeStatus status) noexcept {
    switch (status) {
        case OutcomeStatus::kCompleted: return "completed";
        case OutcomeStatus::kFailed: return "failed";
        case OutcomeStatus::kTimedOut: return "timed_out";
        case OutcomeStatus::kCancelled: return "cancelled";
    }
    return "unknown";
}

/**
 * One independent call issued under a DeadlineGuard. The callable receives a
 * token that is cancelled when its deadline passes or the caller gives up.
 * It must own everything it captures: after a timeout it may still be
 * unwinding on a pool thread when run_bounded() has already returned.
 */
template<typename T>
struct BoundedOperation {
    std::string name;
    std::function<T(const CancellationToken&)> call;
    std::optional<std::chrono::milliseconds> sub_budget;
};

template<typename T>
struct Outcome {
    std::string name;
    OutcomeStatus status = OutcomeStatus::kTimedOut;
    std::optional<T> value;
    std::exception_ptr error;  // set when the call threw
    double elapsed_ms = 0.0;
    bool started = false;      // the call was entered before it settled

    bool completed() const { return status == OutcomeStatus::kCompleted; }
};

template<typename T>
struct BoundedResults {
    std::vector<Outcome<T>> outcomes;  // same order as the operations
    double elapsed_ms = 0.0;

    // Every operation timed out, failed or was cancelled.
    bool no_usable_result() const {
        return std::none_of(outcomes.begin(), outcomes.end(),
                            [](const Outcome<T>& o) { return o.completed(); });
    }
};

/**
 * Runs a set of operations concurrently on a TaskPool and returns once all of
 * them settled or the budget expired, whichever comes first. Operations still
 * running at expiry are cancelled through their token and reported as
 * kTimedOut; their late results are discarded. A single timeout is never an
 * error; callers inspect no_usable_result() to decide whether total failure
 * is fatal.
 */
class DeadlineGuard {
public:
    DeadlineGuard(TaskPool& pool, std::chrono::milliseconds budget)
        : pool_(pool), budget_(budget) {}

    std::chrono::milliseconds budget() const { return budget_; }

    template<typename T>
    BoundedResults<T> run_bounded(std::vector<BoundedOperation<T>> operations,
                                  const CancellationToken& parent = {}) const;

private:
    template<typename T>
    struct State {
        std::mutex mutex;
        std::condition_variable settled_cv;
        std::vector<Outcome<T>> outcomes;
        std::vector<bool> settled;
        std::size_t remaining = 0;
        bool parent_cancelled = false;
        Clock::time_point start;

        // Caller holds the lock.
        bool settle(std::size_t index, OutcomeStatus status) {
            if (settled[index]) {
                return false;
            }
            settled[index] = true;
            outcomes[index].status = status;
            outcomes[index].elapsed_ms = elapsed_ms(start);
            --remaining;
            return true;
        }
    };

    TaskPool& pool_;
    std::chrono::milliseconds budget_;
};

template<typename T>
BoundedResults<T> DeadlineGuard::run_bounded(std::vector<BoundedOperation<T>> operations,
                                             const CancellationToken& parent) const {
    auto state = std::make_shared<State<T>>();
    state->start = Clock::now();
    state->outcomes.resize(operations.size());
    state->settled.assign(operations.size(), false);
    state->remaining = operations.size();

    std::vector<Clock::time_point> deadlines;
    std::vector<CancellationSource> sources;
    deadlines.reserve(operations.size());
    sources.reserve(operations.size());

    for (std::size_t i = 0; i < operations.size(); ++i) {
        auto& op = operations[i];
        state->outcomes[i].name = op.name;
        auto budget = op.sub_budget ? std::min(*op.sub_budget, budget_) : budget_;
        deadlines.push_back(state->start + budget);
        sources.emplace_back(parent);
    }

    for (std::size_t i = 0; i < operations.size(); ++i) {
        CancellationToken token = sources[i].token();
        auto call = std::move(operations[i].call);
        try {
            pool_.post([state, i, name = operations[i].name, call = std::move(call), token]() {
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (state->settled[i]) {
                        HYBRIDRAG_LOG_DEBUG("deadline guard: '{}' settled before it started, skipping", name);
                        return;
                    }
                    state->outcomes[i].started = true;
                }

                std::optional<T> value;
                std::exception_ptr error;
                try {
                    value.emplace(call(token));
                } catch (...) {
                    error = std::current_exception();
                }

                std::lock_guard<std::mutex> lock(state->mutex);
                if (state->settled[i]) {
                    HYBRIDRAG_LOG_DEBUG("deadline guard: discarding late result of '{}'", name);
                    return;
                }
                if (error) {
                    state->outcomes[i].error = error;
                    state->settle(i, token.is_cancelled() ? OutcomeStatus::kCancelled
                                                          : OutcomeStatus::kFailed);
                } else {
                    state->outcomes[i].value = std::move(value);
                    state->settle(i, OutcomeStatus::kCompleted);
                }
                state->settled_cv.notify_all();
            });
        } catch (const std::exception& e) {
            HYBRIDRAG_LOG_ERROR("deadline guard: could not schedule '{}': {}",
                                operations[i].name, e.what());
            std::lock_guard<std::mutex> lock(state->mutex);
            state->outcomes[i].error = std::current_exception();
            state->settle(i, OutcomeStatus::kFailed);
        }
    }

    // Declared before the wait lock so it is released after it: deregistration
    // may wait for the callback, which needs the state mutex.
    CallbackRegistration on_parent = parent.register_callback([state]() {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->parent_cancelled = true;
        state->settled_cv.notify_all();
    });

    for (;;) {
        std::vector<std::size_t> expired;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            if (state->remaining == 0) {
                break;
            }
            if (state->parent_cancelled) {
                for (std::size_t i = 0; i < state->settled.size(); ++i) {
                    state->settle(i, OutcomeStatus::kCancelled);
                }
                break;
            }

            std::optional<Clock::time_point> earliest;
            for (std::size_t i = 0; i < deadlines.size(); ++i) {
                if (!state->settled[i] && (!earliest || deadlines[i] < *earliest)) {
                    earliest = deadlines[i];
                }
            }

            if (Clock::now() < *earliest) {
                state->settled_cv.wait_until(lock, *earliest);
                continue;
            }

            const auto now = Clock::now();
            for (std::size_t i = 0; i < deadlines.size(); ++i) {
                if (!state->settled[i] && deadlines[i] <= now) {
                    state->settle(i, OutcomeStatus::kTimedOut);
                    expired.push_back(i);
                }
            }
        }

        // Outside the lock: cancel callbacks may reach back into the operation.
        for (std::size_t i : expired) {
            HYBRIDRAG_LOG_DEBUG("deadline guard: '{}' exceeded its deadline, cancelling",
                                operations[i].name);
            sources[i].cancel();
        }
    }

    BoundedResults<T> results;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        // Every slot is settled, so stragglers no longer touch outcomes.
        results.outcomes = std::move(state->outcomes);
    }
    results.elapsed_ms = elapsed_ms(state->start);
    return results;
}

} // namespace hybridrag
