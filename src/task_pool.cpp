#include "hybridrag/task_pool.hpp"
#include "hybridrag/logging.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace hybridrag {

TaskPool::TaskPool(std::size_t core_threads, std::chrono::milliseconds overflow_idle)
    : core_(std::max<std::size_t>(1, core_threads))
    , overflow_idle_(overflow_idle) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < core_; ++i) {
        spawn_locked(false);
    }
    HYBRIDRAG_LOG_DEBUG("task pool started with {} core workers", core_);
}

TaskPool::~TaskPool() {
    std::unordered_map<std::size_t, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        workers.swap(workers_);
        retired_.clear();
    }
    available_.notify_all();
    for (auto& entry : workers) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }
}

void TaskPool::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("task pool is shutting down");
        }
        reap_locked();
        // Every idle worker already has a queued task waiting for it.
        if (queue_.size() >= idle_) {
            spawn_locked(true);
        }
        queue_.push_back(std::move(task));
    }
    available_.notify_one();
}

std::size_t TaskPool::num_threads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size() - retired_.size();
}

void TaskPool::spawn_locked(bool overflow) {
    const std::size_t id = next_id_++;
    workers_.emplace(id, std::thread(&TaskPool::worker_loop, this, id, overflow));
    if (overflow) {
        HYBRIDRAG_LOG_DEBUG("task pool: no idle worker, started overflow worker ({} live)",
                            workers_.size() - retired_.size());
    }
}

void TaskPool::reap_locked() {
    for (std::size_t id : retired_) {
        auto it = workers_.find(id);
        if (it != workers_.end()) {
            // Already past its last use of the mutex.
            it->second.join();
            workers_.erase(it);
        }
    }
    retired_.clear();
}

void TaskPool::worker_loop(std::size_t id, bool overflow) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        ++idle_;
        const auto ready = [this] { return stopping_ || !queue_.empty(); };
        bool woken = true;
        if (overflow) {
            woken = available_.wait_for(lock, overflow_idle_, ready);
        } else {
            available_.wait(lock, ready);
        }
        --idle_;

        if (!woken) {
            if (!stopping_) {
                retired_.push_back(id);
            }
            return;
        }
        // Drain what is queued before honoring stop.
        if (queue_.empty()) {
            return;
        }
        Task task = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            HYBRIDRAG_LOG_ERROR("task pool: task escaped with exception: {}", e.what());
        } catch (...) {
            HYBRIDRAG_LOG_ERROR("task pool: task escaped with a non-standard exception");
        }

        task = nullptr;
        lock.lock();
    }
}

} // namespace hybridrag
