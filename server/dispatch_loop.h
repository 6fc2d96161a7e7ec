/*
 * Dispatch Loop
 *
 * The single coordinating thread. Multiplexes:
 * - timers (frame ticks, teardown timeouts), fired in deadline order
 * - fd readiness via epoll (sockets, signalfd)
 * - tasks posted from other threads (transport callbacks, encoder
 *   completions), woken through an eventfd and run in post order
 *
 * Everything except post() and stop() must be called on the loop thread.
 *
 * Time comes from a Clock. With a ManualClock, tests drive the loop with
 * run_until(), which jumps simulated time from timer to timer.
 */

#ifndef DISPATCH_LOOP_H
#define DISPATCH_LOOP_H

#include "cancellation.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <vector>

// Microsecond time source
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t now_us() const = 0;
};

class SteadyClock : public Clock {
public:
    int64_t now_us() const override;
};

class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start_us = 0) : now_(start_us) {}

    int64_t now_us() const override { return now_.load(); }
    void set(int64_t us) { now_.store(us); }
    void advance(int64_t us) { now_ += us; }

private:
    std::atomic<int64_t> now_;
};

class DispatchLoop {
public:
    using Task = std::function<void()>;
    using FdHandler = std::function<void(uint32_t events)>;
    using TimerId = uint64_t;

    // With no clock, the loop uses its own SteadyClock
    explicit DispatchLoop(Clock* clock = nullptr);
    ~DispatchLoop();

    DispatchLoop(const DispatchLoop&) = delete;
    DispatchLoop& operator=(const DispatchLoop&) = delete;

    // Create the epoll instance and wake eventfd
    bool init();

    int64_t now_us() const { return clock_->now_us(); }
    bool manual_clock() const { return manual_; }

    // Timers. Equal deadlines fire in scheduling order.
    TimerId schedule_at(int64_t when_us, Task task);
    TimerId schedule_after(int64_t delay_us, Task task);
    bool cancel_timer(TimerId id);
    size_t timer_count() const { return timer_tasks_.size(); }

    // fd readiness (EPOLLIN / EPOLLOUT ...). One handler per fd.
    bool add_fd(int fd, uint32_t events, FdHandler handler);
    bool modify_fd(int fd, uint32_t events);
    void remove_fd(int fd);

    // Thread-safe: queue a task for the loop thread
    void post(Task task);

    // Thread-safe: make run() return after the current iteration
    void stop();

    // Run until the token is cancelled or stop() is called
    void run(const CancellationToken& token);

    // Run until done() returns true or timeout_us elapses. Returns done().
    bool run_until_done(const std::function<bool()>& done, int64_t timeout_us);

    // Manual clock: fire everything due up to `when_us`, advancing the
    // clock to each timer's deadline before running it
    void run_until(int64_t when_us);

    // Run posted tasks and due timers without blocking
    void run_pending();

private:
    struct TimerEntry {
        int64_t when;
        uint64_t seq;
        TimerId id;
        bool operator>(const TimerEntry& o) const {
            return when != o.when ? when > o.when : seq > o.seq;
        }
    };

    void iterate(int timeout_ms);
    void poll_io(int timeout_ms);
    void run_posted();
    void fire_due_timers(int64_t now);
    bool next_deadline(int64_t& when);
    int wait_timeout_ms();

    Clock* clock_;
    std::unique_ptr<SteadyClock> own_clock_;
    bool manual_;

    int epoll_fd_ = -1;
    int wake_fd_ = -1;

    std::priority_queue<TimerEntry, std::vector<TimerEntry>, std::greater<TimerEntry>> timers_;
    std::unordered_map<TimerId, Task> timer_tasks_;
    TimerId next_timer_id_ = 1;
    uint64_t timer_seq_ = 0;

    std::map<int, std::shared_ptr<FdHandler>> fd_handlers_;

    std::mutex post_mutex_;
    std::vector<Task> posted_;

    std::atomic<bool> stop_requested_{false};
};

#endif // DISPATCH_LOOP_H
