#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <limits>
#include <mutex>

/*! Thread safe FIFO between one or more producers and one consumer.
 *
 *  `tryPush()` honors the capacity and never blocks, so it is safe to call from
 *  a real-time callback. `push()` ignores the capacity.
 *
 *  After `stop()`, `pop()` keeps returning queued items until the queue is
 *  empty, and then returns false.
 */
template <typename T>
class Queue
{
public:
    using type_t = T;

    explicit Queue(size_t capacity = std::numeric_limits<size_t>::max())
        : capacity_{capacity} {}

    void push(T && data)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(data));
        }
        cv_.notify_one();
    }

    // Returns false if the queue is full or stopped. `data` is left untouched in that case.
    bool tryPush(T && data)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push_back(std::move(data));
        }
        cv_.notify_one();
        return true;
    }

    bool pop(T &out)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]{ return !queue_.empty() || stopped_; });
        if (queue_.empty()) {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool stopped() const noexcept {
        return stopped_;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    const size_t capacity_;
    std::atomic_bool stopped_{false};
};
