/**
 * @file stftp_thread_pool.h
 * @brief Fixed-size worker pool running server transfers
 */

#ifndef STFTP_THREAD_POOL_H_
#define STFTP_THREAD_POOL_H_

#include <thread>
#include <mutex>
#include <condition_variable>
#include <queue>
#include <functional>
#include <atomic>
#include <vector>
#include <future>
#include <memory>
#include <stdexcept>

namespace stftp {
namespace internal {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * @brief Queue a task
     * @return Future of the task's result; exceptions surface through it
     * @throws std::runtime_error once Shutdown has been called
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<typename std::invoke_result<F, Args...>::type>;

    // Stop accepting tasks, run what is queued, join the workers
    void Shutdown();

    bool IsShuttingDown() const;
    size_t GetActiveTaskCount() const;
    size_t GetQueuedTaskCount() const;
    size_t GetThreadCount() const;

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stopping_;
    std::atomic<size_t> active_tasks_;
};

template<typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {

    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            throw std::runtime_error("Cannot submit task to stopped thread pool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

} // namespace internal
} // namespace stftp

#endif // STFTP_THREAD_POOL_H_
