#include <dcarchive/common/logging.h>
#include <dcarchive/runtime/worker_pool.h>

namespace dcarchive {

WorkerPool::WorkerPool(std::size_t num_threads) {
    if (num_threads == 0) {
        throw std::invalid_argument("WorkerPool needs at least one thread");
    }
    workers_.reserve(num_threads);
    for (std::size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::worker_thread, this, i);
    }
    DCARCHIVE_LOG_DEBUG("WorkerPool started with %zu threads", num_threads);
}

WorkerPool::~WorkerPool() { shutdown(); }

void WorkerPool::shutdown() {
    if (shut_down_.exchange(true)) return;

    queue_.close();
    for (auto &worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    DCARCHIVE_LOG_DEBUG("WorkerPool shutdown complete");
}

void WorkerPool::worker_thread(std::size_t thread_id) {
    std::function<void()> job;
    while (queue_.wait_and_pop(job)) {
        // packaged_task stores any exception in the job's future
        job();
        job = nullptr;
    }
    DCARCHIVE_LOG_TRACE("Worker %zu exiting", thread_id);
}

}  // namespace dcarchive
