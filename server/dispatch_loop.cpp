/*
 * Dispatch Loop Implementation
 */

#include "dispatch_loop.h"
#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace {

// Upper bound on a single epoll_wait so cancellation is noticed promptly
const int MAX_WAIT_MS = 100;

} // namespace

int64_t SteadyClock::now_us() const {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

DispatchLoop::DispatchLoop(Clock* clock)
    : clock_(clock)
    , manual_(clock != nullptr && dynamic_cast<ManualClock*>(clock) != nullptr)
{
    if (!clock_) {
        own_clock_.reset(new SteadyClock());
        clock_ = own_clock_.get();
    }
}

DispatchLoop::~DispatchLoop() {
    if (wake_fd_ >= 0) {
        close(wake_fd_);
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

bool DispatchLoop::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        fprintf(stderr, "[Loop] Failed to create epoll: %s\n", strerror(errno));
        return false;
    }

    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        fprintf(stderr, "[Loop] Failed to create eventfd: %s\n", strerror(errno));
        return false;
    }

    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = EPOLLIN;
    ev.data.fd = wake_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
        fprintf(stderr, "[Loop] Failed to add eventfd to epoll: %s\n", strerror(errno));
        return false;
    }
    return true;
}

DispatchLoop::TimerId DispatchLoop::schedule_at(int64_t when_us, Task task) {
    TimerId id = next_timer_id_++;
    timers_.push(TimerEntry{when_us, timer_seq_++, id});
    timer_tasks_[id] = std::move(task);
    return id;
}

DispatchLoop::TimerId DispatchLoop::schedule_after(int64_t delay_us, Task task) {
    return schedule_at(now_us() + delay_us, std::move(task));
}

bool DispatchLoop::cancel_timer(TimerId id) {
    // Heap entry is skipped when it surfaces
    return timer_tasks_.erase(id) > 0;
}

bool DispatchLoop::add_fd(int fd, uint32_t events, FdHandler handler) {
    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        fprintf(stderr, "[Loop] Failed to add fd %d to epoll: %s\n", fd, strerror(errno));
        return false;
    }
    fd_handlers_[fd] = std::make_shared<FdHandler>(std::move(handler));
    return true;
}

bool DispatchLoop::modify_fd(int fd, uint32_t events) {
    struct epoll_event ev;
    memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
        fprintf(stderr, "[Loop] Failed to modify fd %d: %s\n", fd, strerror(errno));
        return false;
    }
    return true;
}

void DispatchLoop::remove_fd(int fd) {
    if (fd_handlers_.erase(fd) == 0) {
        return;
    }
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        fprintf(stderr, "[Loop] Warning: Failed to remove fd %d from epoll: %s\n", fd, strerror(errno));
    }
}

void DispatchLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(post_mutex_);
        posted_.push_back(std::move(task));
    }
    if (wake_fd_ >= 0) {
        uint64_t one = 1;
        if (write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
            fprintf(stderr, "[Loop] Failed to wake loop: %s\n", strerror(errno));
        }
    }
}

void DispatchLoop::stop() {
    stop_requested_.store(true);
    post([]() {});
}

void DispatchLoop::run(const CancellationToken& token) {
    stop_requested_.store(false);
    while (!token.is_cancellation_requested() && !stop_requested_.load()) {
        iterate(wait_timeout_ms());
    }
}

bool DispatchLoop::run_until_done(const std::function<bool()>& done, int64_t timeout_us) {
    if (manual_) {
        // Simulated time: step through timers up to the deadline
        const int64_t deadline = now_us() + timeout_us;
        run_pending();
        while (!done() && now_us() < deadline) {
            int64_t next;
            int64_t step_to = deadline;
            if (next_deadline(next) && next < deadline) {
                step_to = next;
            }
            run_until(step_to);
        }
        return done();
    }

    const int64_t deadline = now_us() + timeout_us;
    while (!done()) {
        int64_t remaining = deadline - now_us();
        if (remaining <= 0) {
            break;
        }
        int timeout = wait_timeout_ms();
        int cap = static_cast<int>((remaining + 999) / 1000);
        if (timeout < 0 || timeout > cap) {
            timeout = cap;
        }
        iterate(timeout);
    }
    return done();
}

void DispatchLoop::run_until(int64_t when_us) {
    ManualClock* manual = dynamic_cast<ManualClock*>(clock_);

    while (true) {
        run_posted();
        poll_io(0);
        run_posted();

        int64_t next;
        if (!next_deadline(next) || next > when_us) {
            break;
        }
        if (manual && next > manual->now_us()) {
            manual->set(next);
        }
        fire_due_timers(next);
    }

    if (manual && manual->now_us() < when_us) {
        manual->set(when_us);
    }
    run_posted();
}

void DispatchLoop::run_pending() {
    run_posted();
    poll_io(0);
    fire_due_timers(now_us());
    run_posted();
}

void DispatchLoop::iterate(int timeout_ms) {
    poll_io(timeout_ms);
    run_posted();
    fire_due_timers(now_us());
}

void DispatchLoop::poll_io(int timeout_ms) {
    if (epoll_fd_ < 0) {
        return;
    }

    struct epoll_event events[32];
    int n = epoll_wait(epoll_fd_, events, 32, timeout_ms);
    if (n < 0) {
        if (errno != EINTR) {
            fprintf(stderr, "[Loop] epoll_wait error: %s\n", strerror(errno));
        }
        return;
    }

    for (int i = 0; i < n; i++) {
        int fd = events[i].data.fd;

        if (fd == wake_fd_) {
            // Consume the wakeup; posted tasks run after I/O
            uint64_t val;
            while (read(wake_fd_, &val, sizeof(val)) > 0) {
            }
            continue;
        }

        // Copy the handler: it may remove its own fd
        auto it = fd_handlers_.find(fd);
        if (it == fd_handlers_.end()) {
            continue;
        }
        std::shared_ptr<FdHandler> handler = it->second;
        (*handler)(events[i].events);
    }
}

void DispatchLoop::run_posted() {
    // Tasks posted while running wait for the next pass
    std::vector<Task> batch;
    {
        std::lock_guard<std::mutex> lock(post_mutex_);
        batch.swap(posted_);
    }
    for (auto& task : batch) {
        task();
    }
}

void DispatchLoop::fire_due_timers(int64_t now) {
    while (!timers_.empty() && timers_.top().when <= now) {
        TimerEntry entry = timers_.top();
        timers_.pop();

        auto it = timer_tasks_.find(entry.id);
        if (it == timer_tasks_.end()) {
            continue;  // Cancelled
        }
        Task task = std::move(it->second);
        timer_tasks_.erase(it);
        task();
    }
}

bool DispatchLoop::next_deadline(int64_t& when) {
    // Drop cancelled entries from the top of the heap
    while (!timers_.empty() && timer_tasks_.find(timers_.top().id) == timer_tasks_.end()) {
        timers_.pop();
    }
    if (timers_.empty()) {
        return false;
    }
    when = timers_.top().when;
    return true;
}

int DispatchLoop::wait_timeout_ms() {
    {
        std::lock_guard<std::mutex> lock(post_mutex_);
        if (!posted_.empty()) {
            return 0;
        }
    }

    int64_t next;
    if (!next_deadline(next)) {
        return MAX_WAIT_MS;
    }
    int64_t delta = next - now_us();
    if (delta <= 0) {
        return 0;
    }
    int64_t ms = (delta + 999) / 1000;
    return ms > MAX_WAIT_MS ? MAX_WAIT_MS : static_cast<int>(ms);
}
