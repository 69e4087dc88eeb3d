#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <utility>

// Single-producer/single-consumer channel with a fixed capacity.
//
// push() blocks while the queue is full, pop() blocks while it is empty.
// close() is the end-of-stream marker: pop() keeps draining what is queued and
// then reports the end. abort() wakes both sides immediately and discards
// whatever is still queued; it is how cancellation and errors unblock a stage
// that is waiting on the other one.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity)
        : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be at least 1");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Returns false when the queue was closed or aborted; the item is dropped.
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, [this] { return aborted_ || closed_ || items_.size() < capacity_; });
        if (aborted_ || closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        if (items_.size() > highWaterMark_) {
            highWaterMark_ = items_.size();
        }
        notEmpty_.notify_one();
        return true;
    }

    // Returns false at end of stream or after abort().
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return aborted_ || closed_ || !items_.empty(); });
        if (aborted_ || items_.empty()) {
            return false;
        }
        item = std::move(items_.front());
        items_.pop_front();
        notFull_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    void abort() {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_ = true;
        items_.clear();
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    bool isAborted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return aborted_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    // Largest number of items ever queued at once.
    size_t highWaterMark() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return highWaterMark_;
    }

private:
    const size_t capacity_;
    std::deque<T> items_;
    bool closed_{false};
    bool aborted_{false};
    size_t highWaterMark_{0};
    mutable std::mutex mutex_;
    std::condition_variable notFull_;
    std::condition_variable notEmpty_;
};
