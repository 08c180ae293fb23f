#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace loom::platform {

// Unbounded multi-producer queue between threads. After close(), receivers
// drain what is left and then get nullopt; senders get an exception.
template<typename T>
class Channel {
public:
    Channel() = default;

    // Non-copyable, non-movable
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    void send(T value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                throw std::runtime_error("Channel is closed");
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    // Blocks until a value arrives or the channel is closed and empty.
    std::optional<T> receive() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
        return pop_locked();
    }

    std::optional<T> try_receive() {
        std::lock_guard lock(mutex_);
        return pop_locked();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> pop_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    std::deque<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace loom::platform
