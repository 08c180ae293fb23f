#include <loom/platform/event_loop.h>

namespace loom::platform {

EventLoop::~EventLoop() {
    quit();
}

void EventLoop::post_task(Task task) {
    std::unique_lock lock(mutex_);
    queue_.push_back(std::move(task));
    lock.unlock();
    wake_.notify_one();
}

void EventLoop::run() {
    run_until(std::nullopt);
}

bool EventLoop::run_for(std::chrono::milliseconds timeout) {
    return run_until(Clock::now() + timeout);
}

bool EventLoop::run_until(std::optional<Clock::time_point> deadline) {
    std::unique_lock lock(mutex_);
    running_ = true;
    const auto has_work = [this]() { return quit_requested_ || !queue_.empty(); };

    bool quit = false;
    for (;;) {
        if (deadline) {
            if (Clock::now() >= *deadline && !quit_requested_) {
                break;
            }
            if (!wake_.wait_until(lock, *deadline, has_work)) {
                break;
            }
        } else {
            wake_.wait(lock, has_work);
        }

        if (quit_requested_) {
            quit_requested_ = false;
            quit = true;
            break;
        }

        Task task = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        task();
        lock.lock();
    }

    running_ = false;
    return quit;
}

void EventLoop::run_pending() {
    std::deque<Task> batch;
    {
        std::lock_guard lock(mutex_);
        batch.swap(queue_);
    }
    for (auto& task : batch) {
        task();
    }
}

void EventLoop::quit() {
    {
        std::lock_guard lock(mutex_);
        quit_requested_ = true;
    }
    wake_.notify_all();
}

bool EventLoop::is_running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

size_t EventLoop::pending_count() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

} // namespace loom::platform
