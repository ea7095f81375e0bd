#ifndef DCARCHIVE_RUNTIME_WORKER_POOL_H
#define DCARCHIVE_RUNTIME_WORKER_POOL_H

#include <dcarchive/runtime/thread_safe_queue.h>

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace dcarchive {

/**
 * Fixed number of OS threads pulling jobs from one queue. Each submission
 * returns a future, so an exception in one job surfaces only through its
 * own future and never stops the other jobs.
 */
class WorkerPool {
   public:
    explicit WorkerPool(std::size_t num_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    template <typename F>
    auto submit(F &&job) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task =
            std::make_shared<std::packaged_task<R()>>(std::forward<F>(job));
        std::future<R> result = task->get_future();
        if (!queue_.push([task] { (*task)(); })) {
            throw std::runtime_error("WorkerPool is shut down");
        }
        return result;
    }

    // Finish queued jobs, then join the threads. Idempotent.
    void shutdown();

    std::size_t size() const { return workers_.size(); }
    std::size_t pending() const { return queue_.size(); }

   private:
    void worker_thread(std::size_t thread_id);

    ThreadSafeQueue<std::function<void()>> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> shut_down_{false};
};

}  // namespace dcarchive

#endif  // DCARCHIVE_RUNTIME_WORKER_POOL_H
