#ifndef DCARCHIVE_RUNTIME_THREAD_SAFE_QUEUE_H
#define DCARCHIVE_RUNTIME_THREAD_SAFE_QUEUE_H

#include <condition_variable>
#include <mutex>
#include <queue>

namespace dcarchive {

template <typename T>
class ThreadSafeQueue {
   public:
    ThreadSafeQueue() = default;
    ThreadSafeQueue(const ThreadSafeQueue &) = delete;
    ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

    // Returns false once the queue is closed
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            queue_.push(std::move(value));
        }
        cond_.notify_one();
        return true;
    }

    bool try_pop(T &value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        value = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    /**
     * Block until an item is available. Items queued before close() are
     * still handed out; returns false when closed and drained.
     */
    bool wait_and_pop(T &value) {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return false;
        }
        value = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cond_.notify_all();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

   private:
    mutable std::mutex mutex_;
    std::queue<T> queue_;
    std::condition_variable cond_;
    bool closed_ = false;
};

}  // namespace dcarchive

#endif  // DCARCHIVE_RUNTIME_THREAD_SAFE_QUEUE_H
