/*
 * Encoder Worker Pool
 *
 * Fixed set of threads pulling tasks from one queue. Tasks that must run in
 * order (all frames of one media chain) go through a Strand, which keeps at
 * most one of its tasks queued in the pool at a time.
 */

#ifndef WORKER_POOL_H
#define WORKER_POOL_H

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t num_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * Queue a task
     * @return false if the pool is shutting down (task not queued)
     */
    bool submit(Task task);

    // Run queued tasks to completion, then join the workers
    void shutdown();

    size_t num_workers() const { return workers_.size(); }
    size_t pending_tasks() const;

    // Run one task; an exception it throws is logged and stops there
    static void run_task(const Task& task);

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

class Strand : public std::enable_shared_from_this<Strand> {
public:
    explicit Strand(WorkerPool& pool) : pool_(pool) {}

    // Queue a task behind earlier tasks of this strand
    bool post(WorkerPool::Task task);

    size_t pending() const;

private:
    void drain();

    WorkerPool& pool_;
    mutable std::mutex mutex_;
    std::deque<WorkerPool::Task> tasks_;
    bool scheduled_ = false;
};

#endif // WORKER_POOL_H
