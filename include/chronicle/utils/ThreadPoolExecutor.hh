#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace chronicle {
namespace Utils {

/**
 * @brief Fixed-size worker pool for CPU-bound jobs such as parsing snapshots.
 *
 * submit() returns a future carrying the job's result or its exception.
 * Worker threads capture `this`, so the pool is neither copyable nor movable.
 */
class ThreadPoolExecutor {
  public:
    // 0 picks std::thread::hardware_concurrency().
    explicit ThreadPoolExecutor(size_t threadCount = 0);
    ~ThreadPoolExecutor();

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    template <typename F> auto submit(F&& job) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(job));
        std::future<R> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (shutdown_) {
                throw std::runtime_error("ThreadPoolExecutor is shut down");
            }
            taskQueue_.emplace([task]() { (*task)(); });
        }
        queueCondition_.notify_one();
        return result;
    }

    size_t getThreadCount() const { return workerThreads_.size(); }
    size_t getQueuedTaskCount() const;

    // Drops queued jobs and joins the workers. Jobs already running finish;
    // dropped jobs leave their futures with a broken_promise error. Returns
    // false when a worker did not stop within `timeout` and was detached.
    bool shutdown(std::chrono::milliseconds timeout = std::chrono::seconds(5));
    bool isShutdown() const { return shutdown_; }

  private:
    using Task = std::function<void()>;

    void workerThread();

    std::vector<std::thread> workerThreads_;
    std::queue<Task> taskQueue_;
    mutable std::mutex queueMutex_;
    std::condition_variable queueCondition_;
    std::atomic<bool> shutdown_{false};
    std::atomic<size_t> running_{0};
};

} // namespace Utils
} // namespace chronicle
