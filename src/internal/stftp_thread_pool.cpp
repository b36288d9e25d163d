#include "internal/stftp_thread_pool.h"
#include "stftp/stftp_logger.h"
#include <algorithm>

namespace stftp {
namespace internal {

ThreadPool::ThreadPool(size_t num_threads)
    : stopping_(false), active_tasks_(0) {

    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 4;
        }
    }
    num_threads = std::min(num_threads, size_t(256));

    STFTP_DEBUG("Creating thread pool with %zu worker threads", num_threads);

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::WorkerThread, this);
    }
}

ThreadPool::~ThreadPool() {
    Shutdown();
}

void ThreadPool::Shutdown() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stopping_.exchange(true)) {
            return;
        }
    }

    STFTP_DEBUG("Shutting down thread pool with %zu workers", workers_.size());
    condition_.notify_all();

    // Workers drain the queue before they exit
    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    STFTP_DEBUG("Thread pool shutdown completed");
}

bool ThreadPool::IsShuttingDown() const {
    return stopping_.load();
}

size_t ThreadPool::GetActiveTaskCount() const {
    return active_tasks_.load();
}

size_t ThreadPool::GetQueuedTaskCount() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

size_t ThreadPool::GetThreadCount() const {
    return workers_.size();
}

void ThreadPool::WorkerThread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });

            if (tasks_.empty()) {
                break;   // stopping and drained
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            active_tasks_.fetch_add(1);
        }

        // Task exceptions are stored in the task's future
        task();
        active_tasks_.fetch_sub(1);
    }
}

} // namespace internal
} // namespace stftp
