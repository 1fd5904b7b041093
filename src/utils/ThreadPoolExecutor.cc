#include "chronicle/utils/ThreadPoolExecutor.hh"
#include "chronicle/core/Log.hh"

#include <algorithm>
#include <system_error>

namespace chronicle {
namespace Utils {

ThreadPoolExecutor::ThreadPoolExecutor(size_t threadCount) {
    size_t count = threadCount > 0 ? threadCount : std::max<size_t>(1, std::thread::hardware_concurrency());
    workerThreads_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workerThreads_.emplace_back(&ThreadPoolExecutor::workerThread, this);
    }

    CHRONICLE_LOG_DEBUG("ThreadPoolExecutor created with {} threads", count);
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    if (!shutdown_) {
        try {
            shutdown(std::chrono::milliseconds(200));
        } catch (const std::system_error& e) {
            CHRONICLE_LOG_ERROR("Error during ThreadPoolExecutor shutdown: {}", e.what());
        }
    }
}

size_t ThreadPoolExecutor::getQueuedTaskCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return taskQueue_.size();
}

bool ThreadPoolExecutor::shutdown(std::chrono::milliseconds timeout) {
    std::queue<Task> dropped;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_ = true;
        std::swap(taskQueue_, dropped);
    }
    queueCondition_.notify_all();

    // Destroying the dropped tasks breaks their promises.
    size_t droppedCount = dropped.size();
    dropped = {};

    // Workers leave after their current job; wait for them up to `timeout`.
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (running_ > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    bool allJoined = running_ == 0;
    for (auto& thread : workerThreads_) {
        if (!thread.joinable()) {
            continue;
        }
        if (allJoined) {
            thread.join();
        } else {
            thread.detach();
        }
    }
    workerThreads_.clear();

    if (!allJoined) {
        CHRONICLE_LOG_WARN("ThreadPoolExecutor shutdown: some threads detached after timeout");
    } else {
        CHRONICLE_LOG_DEBUG("ThreadPoolExecutor shut down, {} queued jobs dropped", droppedCount);
    }
    return allJoined;
}

void ThreadPoolExecutor::workerThread() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCondition_.wait(lock, [this] { return !taskQueue_.empty() || shutdown_; });
            if (shutdown_) {
                break;
            }
            task = std::move(taskQueue_.front());
            taskQueue_.pop();
            ++running_;
        }

        // packaged_task stores the job's exception in its future.
        task();
        --running_;
    }
}

} // namespace Utils
} // namespace chronicle
