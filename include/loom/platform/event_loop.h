#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace loom::platform {

// Task queue of the interactive thread. Any thread may post; only the thread
// inside run(), run_for() or run_pending() executes tasks, one at a time and
// in posting order.
class EventLoop {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    EventLoop() = default;
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post_task(Task task);

    // Blocks until quit().
    void run();

    // Returns true when quit() ended the loop, false when the timeout did.
    bool run_for(std::chrono::milliseconds timeout);

    // Runs what is queued right now and returns. Tasks posted meanwhile wait
    // for the next call.
    void run_pending();

    // Ends the current run, or the next one if none is active.
    void quit();

    bool is_running() const;
    size_t pending_count() const;

private:
    bool run_until(std::optional<Clock::time_point> deadline);

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<Task> queue_;
    bool running_ = false;
    bool quit_requested_ = false;
};

} // namespace loom::platform
