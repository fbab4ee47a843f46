#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace ms::concurrency {

// Multi-producer queue with close semantics. capacity 0 means unbounded;
// otherwise push blocks while the queue is full.
template <typename T>
class Channel {
public:
    explicit Channel(const size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false when the channel is closed or interrupt is raised before space frees up.
    bool push(T item, const std::atomic<bool>* interrupt = nullptr) {
        std::unique_lock lock(mutex_);
        while (capacity_ > 0 && queue_.size() >= capacity_ && !closed_) {
            if (interrupt && interrupt->load()) return false;
            notFull_.wait_for(lock, std::chrono::milliseconds(100));
        }
        if (closed_) return false;
        queue_.push_back(std::move(item));
        notEmpty_.notify_one();
        return true;
    }

    // Blocks until an item arrives or the channel is closed and empty.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        notEmpty_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return take();
    }

    // nullopt on timeout, or when closed and empty (see drained()).
    std::optional<T> popFor(const std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        notEmpty_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        return take();
    }

    void close() {
        {
            std::scoped_lock lock(mutex_);
            closed_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::scoped_lock lock(mutex_);
        return closed_;
    }

    [[nodiscard]] bool drained() const {
        std::scoped_lock lock(mutex_);
        return closed_ && queue_.empty();
    }

    [[nodiscard]] size_t size() const {
        std::scoped_lock lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<T> queue_;
    bool closed_ = false;

    std::optional<T> take() {
        if (queue_.empty()) return std::nullopt;
        T item = std::move(queue_.front());
        queue_.pop_front();
        notFull_.notify_one();
        return item;
    }
};

}
