/*
 * Encoder Worker Pool Implementation
 */

#include "worker_pool.h"
#include <cstdio>
#include <exception>

WorkerPool::WorkerPool(size_t num_threads) {
    for (size_t i = 0; i < num_threads; i++) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t WorkerPool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::run_task(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        fprintf(stderr, "[WorkerPool] task failed: %s\n", e.what());
    }
}

void WorkerPool::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        // Run outside the lock
        run_task(task);
    }
}

bool Strand::post(WorkerPool::Task task) {
    bool schedule = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
        if (!scheduled_) {
            scheduled_ = true;
            schedule = true;
        }
    }
    if (!schedule) {
        return true;
    }

    std::shared_ptr<Strand> self = shared_from_this();
    if (!pool_.submit([self]() { self->drain(); })) {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.clear();
        scheduled_ = false;
        return false;
    }
    return true;
}

size_t Strand::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void Strand::drain() {
    // One thread at a time runs this strand's tasks, in post order
    while (true) {
        WorkerPool::Task task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tasks_.empty()) {
                scheduled_ = false;
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        WorkerPool::run_task(task);
    }
}
