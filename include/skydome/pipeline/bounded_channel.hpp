#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace skydome::pipeline {

/**
 * Multi-producer / single-consumer queue with a capacity bound.
 * push() blocks while full, pop() blocks while empty and returns nullopt
 * once the channel is closed and drained.
 */
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity) : capacity_(capacity < 1 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // False if the channel was closed before the item could be queued.
    bool push(T item) {
        std::unique_lock<std::mutex> lock(monitor_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(monitor_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return item;
    }

    void close() {
        std::lock_guard<std::mutex> lock(monitor_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

private:
    size_t capacity_;
    bool closed_ = false;
    std::deque<T> queue_;
    std::mutex monitor_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};

} // namespace skydome::pipeline
