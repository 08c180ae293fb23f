#include <loom/platform/event_loop.h>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using loom::platform::EventLoop;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// 1. run_pending executes queued tasks in posting order
// ---------------------------------------------------------------------------
TEST(EventLoopTest, RunPendingKeepsPostingOrder) {
    EventLoop loop;
    std::string trace;
    loop.post_task([&trace]() { trace += 'a'; });
    loop.post_task([&trace]() { trace += 'b'; });
    loop.post_task([&trace]() { trace += 'c'; });
    EXPECT_EQ(loop.pending_count(), 3u);

    loop.run_pending();
    EXPECT_EQ(trace, "abc");
    EXPECT_EQ(loop.pending_count(), 0u);
}

// ---------------------------------------------------------------------------
// 2. run_pending on an empty queue does nothing
// ---------------------------------------------------------------------------
TEST(EventLoopTest, RunPendingOnEmptyQueue) {
    EventLoop loop;
    loop.run_pending();
    EXPECT_EQ(loop.pending_count(), 0u);
    EXPECT_FALSE(loop.is_running());
}

// ---------------------------------------------------------------------------
// 3. Tasks posted by a task wait for the next run_pending
// ---------------------------------------------------------------------------
TEST(EventLoopTest, NestedPostWaitsForNextBatch) {
    EventLoop loop;
    int depth = 0;
    loop.post_task([&]() {
        depth = 1;
        loop.post_task([&depth]() { depth = 2; });
    });

    loop.run_pending();
    EXPECT_EQ(depth, 1);
    EXPECT_EQ(loop.pending_count(), 1u);
    loop.run_pending();
    EXPECT_EQ(depth, 2);
}

// ---------------------------------------------------------------------------
// 4. quit() from a task ends run(); later tasks stay queued
// ---------------------------------------------------------------------------
TEST(EventLoopTest, QuitFromTaskEndsRun) {
    EventLoop loop;
    bool running_inside = false;
    bool after_quit = false;
    loop.post_task([&]() {
        running_inside = loop.is_running();
        loop.quit();
    });
    loop.post_task([&]() { after_quit = true; });

    loop.run();
    EXPECT_TRUE(running_inside);
    EXPECT_FALSE(loop.is_running());
    EXPECT_FALSE(after_quit);
    EXPECT_EQ(loop.pending_count(), 1u);
}

// ---------------------------------------------------------------------------
// 5. A quit issued before the loop starts ends the next run
// ---------------------------------------------------------------------------
TEST(EventLoopTest, QuitBeforeRunIsRemembered) {
    EventLoop loop;
    loop.quit();
    EXPECT_TRUE(loop.run_for(1000ms));

    // Consumed by that run.
    EXPECT_FALSE(loop.run_for(20ms));
}

// ---------------------------------------------------------------------------
// 6. run_for gives up at the deadline
// ---------------------------------------------------------------------------
TEST(EventLoopTest, RunForTimesOut) {
    EventLoop loop;
    int runs = 0;
    loop.post_task([&runs]() { ++runs; });

    const auto start = EventLoop::Clock::now();
    EXPECT_FALSE(loop.run_for(50ms));
    EXPECT_GE(EventLoop::Clock::now() - start, 50ms);
    EXPECT_EQ(runs, 1);
    EXPECT_FALSE(loop.is_running());
}

// ---------------------------------------------------------------------------
// 7. A task posted from another thread runs on the loop thread
// ---------------------------------------------------------------------------
TEST(EventLoopTest, CrossThreadPostRunsOnLoopThread) {
    EventLoop loop;
    const std::thread::id loop_thread = std::this_thread::get_id();
    std::thread::id ran_on;

    std::thread poster([&]() {
        std::this_thread::sleep_for(10ms);
        loop.post_task([&]() {
            ran_on = std::this_thread::get_id();
            loop.quit();
        });
    });

    EXPECT_TRUE(loop.run_for(2000ms));
    poster.join();
    EXPECT_EQ(ran_on, loop_thread);
}

// ---------------------------------------------------------------------------
// 8. Concurrent producers: every task runs exactly once
// ---------------------------------------------------------------------------
TEST(EventLoopTest, ConcurrentProducers) {
    constexpr int kProducers = 4;
    constexpr int kTasksEach = 250;
    EventLoop loop;
    std::atomic<int> executed{0};

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&]() {
            for (int i = 0; i < kTasksEach; ++i) {
                loop.post_task([&]() {
                    if (++executed == kProducers * kTasksEach) {
                        loop.quit();
                    }
                });
            }
        });
    }

    EXPECT_TRUE(loop.run_for(5000ms));
    for (auto& producer : producers) {
        producer.join();
    }
    EXPECT_EQ(executed.load(), kProducers * kTasksEach);
    EXPECT_EQ(loop.pending_count(), 0u);
}

// ---------------------------------------------------------------------------
// 9. The loop can be entered again after quitting
// ---------------------------------------------------------------------------
TEST(EventLoopTest, RunAgainAfterQuit) {
    EventLoop loop;
    int runs = 0;
    for (int round = 0; round < 2; ++round) {
        loop.post_task([&]() {
            ++runs;
            loop.quit();
        });
        loop.run();
    }
    EXPECT_EQ(runs, 2);
}
