#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace core {

// What push() does when the queue is already at capacity
enum class OverflowPolicy {
    DropNewest,  // reject the incoming item (chunk queue: never block the decoder)
    DropOldest   // evict the oldest unread item (result queue: keep the freshest)
};

// Thread-safe bounded queue shared between pipeline threads
// Design: producers never block. When the consumer falls behind, items are
//         dropped according to the overflow policy and counted.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity, OverflowPolicy policy = OverflowPolicy::DropNewest)
        : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Never blocks. Returns false if the item was not stored (stopped, or dropped under DropNewest).
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stopped_) {
            return false;
        }
        if (queue_.size() >= capacity_) {
            dropped_count_++;
            if (policy_ == OverflowPolicy::DropNewest) {
                return false;
            }
            queue_.pop_front();
        }
        queue_.push_back(std::move(item));
        cv_pop_.notify_one();
        return true;
    }

    // Blocks until an item is available or the queue is stopped and empty
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_pop_.wait(lock, [this] { return !queue_.empty() || stopped_; });
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    bool try_pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    std::vector<T> drain() {
        std::unique_lock<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(queue_.size());
        for (auto& item : queue_) out.push_back(std::move(item));
        queue_.clear();
        return out;
    }

    // Reject further pushes and wake every waiter. Items already queued can still be popped.
    void stop() {
        std::unique_lock<std::mutex> lock(mutex_);
        stopped_ = true;
        cv_pop_.notify_all();
    }

    bool stopped() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return stopped_;
    }

    size_t size() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

    size_t dropped_count() const {
        return dropped_count_.load();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_pop_;
    std::deque<T> queue_;
    const size_t capacity_;
    const OverflowPolicy policy_;
    bool stopped_ = false;
    std::atomic<size_t> dropped_count_{0};
};

} // namespace core
