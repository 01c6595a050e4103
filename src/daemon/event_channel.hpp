#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

// Bounded FIFO hand-off between threads. push() blocks while full and pop()
// blocks while empty; both give up when the stop token fires or the channel
// is closed. Values queued before close() can still be popped.
template <typename T>
class EventChannel {
public:
    explicit EventChannel(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    bool push(T value, std::stop_token st = {}) {
        std::unique_lock lock(mutex_);
        bool ready = not_full_.wait(lock, st, [this] {
            return closed_ || queue_.size() < capacity_;
        });
        if (!ready || closed_) return false;

        queue_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    bool try_push(T value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_ || queue_.size() >= capacity_) return false;
            queue_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> pop(std::stop_token st = {}) {
        std::unique_lock lock(mutex_);
        bool ready = not_empty_.wait(lock, st, [this] {
            return closed_ || !queue_.empty();
        });
        if (!ready || queue_.empty()) return std::nullopt;

        T value = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return value;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    // Reopens a closed channel, dropping anything still queued.
    void reset() {
        std::lock_guard lock(mutex_);
        queue_.clear();
        closed_ = false;
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable_any not_full_;
    std::condition_variable_any not_empty_;
    std::deque<T> queue_;
    bool closed_ = false;
};
