/*
 * Dispatch loop, worker pool and cancellation tests.
 */

#include "test_util.h"
#include "../server/cancellation.h"
#include "../server/dispatch_loop.h"
#include "../server/worker_pool.h"
#include <atomic>
#include <stdexcept>
#include <string>
#include <sys/epoll.h>
#include <thread>
#include <unistd.h>

static void test_timer_order() {
    ManualClock clock(1000);
    DispatchLoop loop(&clock);
    CHECK(loop.init());
    CHECK(loop.manual_clock());

    std::string order;
    loop.schedule_at(3000, [&]() { order += "c"; });
    loop.schedule_at(2000, [&]() { order += "a"; });
    loop.schedule_at(2000, [&]() { order += "b"; });   // Same deadline, scheduled later
    loop.schedule_after(500, [&]() { order += "0"; });
    CHECK_EQ(loop.timer_count(), 4);

    loop.run_until(2500);
    CHECK(order == "0ab");
    CHECK_EQ(clock.now_us(), 2500);

    loop.run_until(3000);
    CHECK(order == "0abc");
    CHECK_EQ(loop.timer_count(), 0);
}

static void test_cancel_timer() {
    ManualClock clock;
    DispatchLoop loop(&clock);
    CHECK(loop.init());

    int fired = 0;
    DispatchLoop::TimerId keep = loop.schedule_at(100, [&]() { fired += 1; });
    DispatchLoop::TimerId drop = loop.schedule_at(50, [&]() { fired += 10; });
    CHECK(keep != drop);
    CHECK(loop.cancel_timer(drop));
    CHECK(!loop.cancel_timer(drop));

    loop.run_until(1000);
    CHECK_EQ(fired, 1);
}

static void test_clock_jumps_to_deadline() {
    ManualClock clock;
    DispatchLoop loop(&clock);
    CHECK(loop.init());

    // Each timer sees the clock at its own deadline
    std::vector<int64_t> seen;
    for (int i = 1; i <= 3; i++) {
        loop.schedule_at(i * 33333, [&]() { seen.push_back(loop.now_us()); });
    }
    loop.run_until(1000000);
    CHECK_EQ(seen.size(), 3);
    CHECK_EQ(seen[0], 33333);
    CHECK_EQ(seen[2], 99999);
    CHECK_EQ(clock.now_us(), 1000000);
}

static void test_timer_reschedules_itself() {
    ManualClock clock;
    DispatchLoop loop(&clock);
    CHECK(loop.init());

    int ticks = 0;
    std::function<void()> tick = [&]() {
        ticks++;
        loop.schedule_after(10000, tick);
    };
    loop.schedule_at(0, tick);
    loop.run_until(99999);
    CHECK_EQ(ticks, 10);
}

static void test_post_runs_before_later_timers() {
    ManualClock clock;
    DispatchLoop loop(&clock);
    CHECK(loop.init());

    std::string order;
    loop.schedule_at(10, [&]() {
        order += "t";
        loop.post([&]() { order += "p"; });
    });
    loop.schedule_at(20, [&]() { order += "u"; });
    loop.run_until(100);
    CHECK(order == "tpu");
}

static void test_cross_thread_post() {
    DispatchLoop loop;
    CHECK(loop.init());

    std::atomic<int> count(0);
    std::thread producer([&]() {
        for (int i = 0; i < 100; i++) {
            loop.post([&]() { count++; });
        }
    });
    bool done = loop.run_until_done([&]() { return count.load() == 100; }, 5000000);
    producer.join();
    CHECK(done);
    CHECK_EQ(count.load(), 100);
}

static void test_fd_handler() {
    DispatchLoop loop;
    CHECK(loop.init());

    int fds[2];
    CHECK(pipe(fds) == 0);

    std::string received;
    CHECK(loop.add_fd(fds[0], EPOLLIN, [&](uint32_t events) {
        CHECK((events & EPOLLIN) != 0);
        char buf[16];
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            received.append(buf, static_cast<size_t>(n));
        }
        // Handlers may remove their own fd
        loop.remove_fd(fds[0]);
    }));
    CHECK(!loop.add_fd(-1, EPOLLIN, [](uint32_t) {}));

    CHECK(write(fds[1], "ping", 4) == 4);
    CHECK(loop.run_until_done([&]() { return !received.empty(); }, 2000000));
    CHECK(received == "ping");

    close(fds[0]);
    close(fds[1]);
}

static void test_run_until_cancelled() {
    DispatchLoop loop;
    CHECK(loop.init());

    CancellationSource source;
    CHECK(!source.is_cancellation_requested());
    CancellationToken token = source.token();

    int ran = 0;
    loop.schedule_after(1000, [&]() {
        ran++;
        source.cancel();
    });
    loop.run(token);
    CHECK_EQ(ran, 1);
    CHECK(token.is_cancellation_requested());
}

static void test_stop_from_thread() {
    DispatchLoop loop;
    CHECK(loop.init());

    CancellationSource source;
    std::thread stopper([&]() {
        usleep(20000);
        loop.stop();
    });
    loop.run(source.token());
    stopper.join();
    CHECK(!source.is_cancellation_requested());
}

static void test_manual_run_until_done_times_out() {
    ManualClock clock;
    DispatchLoop loop(&clock);
    CHECK(loop.init());

    bool flag = false;
    loop.schedule_at(5000000, [&]() { flag = true; });
    CHECK(!loop.run_until_done([&]() { return flag; }, 2000000));
    CHECK_EQ(clock.now_us(), 2000000);
    CHECK(loop.run_until_done([&]() { return flag; }, 4000000));
    CHECK_EQ(clock.now_us(), 5000000);
}

static void test_worker_pool() {
    WorkerPool pool(4);
    CHECK_EQ(pool.num_workers(), 4);

    std::atomic<int> sum(0);
    for (int i = 1; i <= 100; i++) {
        CHECK(pool.submit([&sum, i]() { sum += i; }));
    }
    pool.shutdown();
    CHECK_EQ(sum.load(), 5050);
    CHECK(!pool.submit([]() {}));
}

static void test_strand_is_serial() {
    WorkerPool pool(4);
    std::shared_ptr<Strand> strand = std::make_shared<Strand>(pool);

    std::mutex mutex;
    std::vector<int> order;
    std::atomic<int> running(0);
    std::atomic<bool> overlapped(false);

    for (int i = 0; i < 50; i++) {
        CHECK(strand->post([&, i]() {
            if (running.fetch_add(1) != 0) {
                overlapped = true;
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(i);
            }
            running.fetch_sub(1);
        }));
    }
    pool.shutdown();

    CHECK(!overlapped.load());
    CHECK_EQ(order.size(), 50);
    bool in_order = true;
    for (size_t i = 0; i < order.size(); i++) {
        if (order[i] != static_cast<int>(i)) in_order = false;
    }
    CHECK(in_order);
    CHECK_EQ(strand->pending(), 0);
}

static void test_throwing_task_does_not_stop_workers() {
    WorkerPool pool(1);
    std::shared_ptr<Strand> strand = std::make_shared<Strand>(pool);

    std::atomic<int> ran(0);
    CHECK(pool.submit([]() { throw std::runtime_error("pool task"); }));
    CHECK(pool.submit([&ran]() { ran += 1; }));
    CHECK(strand->post([]() { throw std::runtime_error("strand task"); }));
    CHECK(strand->post([&ran]() { ran += 10; }));
    pool.shutdown();
    CHECK_EQ(ran.load(), 11);
    CHECK_EQ(strand->pending(), 0);
}

int main() {
    RUN_TEST(test_timer_order);
    RUN_TEST(test_cancel_timer);
    RUN_TEST(test_clock_jumps_to_deadline);
    RUN_TEST(test_timer_reschedules_itself);
    RUN_TEST(test_post_runs_before_later_timers);
    RUN_TEST(test_cross_thread_post);
    RUN_TEST(test_fd_handler);
    RUN_TEST(test_run_until_cancelled);
    RUN_TEST(test_stop_from_thread);
    RUN_TEST(test_manual_run_until_done_times_out);
    RUN_TEST(test_worker_pool);
    RUN_TEST(test_strand_is_serial);
    RUN_TEST(test_throwing_task_does_not_stop_workers);
    return test_summary("test_dispatch_loop");
}
