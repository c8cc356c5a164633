/**
 * Elastic worker pool for dependency calls.
 *
 * Keeps a fixed core of workers and starts an overflow worker whenever a task
 * arrives with no idle worker to take it, so a posted task never waits behind
 * slow work from unrelated requests. Overflow workers retire after sitting
 * idle for a while.
 *
 * Owned by the composition root and handed to the components that fan out
 * work. Destruction drains the queue and joins every worker, so a component
 * that posts work must not outlive its pool.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace hybridrag {

class TaskPool {
public:
    using Task = std::function<void()>;

    explicit TaskPool(std::size_t core_threads = std::thread::hardware_concurrency(),
                      std::chrono::milliseconds overflow_idle = std::chrono::seconds(10));
    ~TaskPool();

    // Non-copyable, non-movable
    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;
    TaskPool(TaskPool&&) = delete;
    TaskPool& operator=(TaskPool&&) = delete;

    // Fire and forget. Throws std::runtime_error once the pool is stopping,
    // std::system_error when no worker can be started.
    void post(Task task);

    std::size_t core_threads() const { return core_; }

    // Live workers, core plus overflow.
    std::size_t num_threads() const;

private:
    void spawn_locked(bool overflow);
    void reap_locked();
    void worker_loop(std::size_t id, bool overflow);

    const std::size_t core_;
    const std::chrono::milliseconds overflow_idle_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<Task> queue_;
    bool stopping_ = false;
    std::size_t idle_ = 0;
    std::size_t next_id_ = 0;
    std::unordered_map<std::size_t, std::thread> workers_;
    std::vector<std::size_t> retired_;  // exited overflow workers not yet joined
};

} // namespace hybridrag
