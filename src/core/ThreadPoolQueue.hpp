#ifndef THREAD_POOL_QUEUE_HPP
#define THREAD_POOL_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../interfaces/ILogger.hpp"

// Task and its enqueue time
struct TimedTask {
    std::function<void()> task;
    std::chrono::steady_clock::time_point enqueued_time;
};

// Fixed-size worker pool. Resolutions block on Redis and on the live fetch, so they run
// here instead of on the I/O threads.
class ThreadPoolQueue {
public:
    ThreadPoolQueue(
        size_t thread_count,
        std::shared_ptr<ILogger> logger)
        : logger_(logger),
        shutdown_(false) {
        if (thread_count == 0) {
            thread_count = 1;
        }
        threads_.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back([this] { worker_thread(); });
        }
        logger_->setup("ThreadPoolQueue initialized with " + std::to_string(thread_count) + " threads");
    }

    ~ThreadPoolQueue() {
        shutdown();
    }

    ThreadPoolQueue(const ThreadPoolQueue&) = delete;
    ThreadPoolQueue& operator=(const ThreadPoolQueue&) = delete;

    // Returns false once shutdown has started.
    bool enqueue(std::function<void()> fn) {
        {
            // Checked under the lock so no task lands after the workers drained and exited
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (shutdown_) {
                lock.unlock();
                logger_->error("Attempted to enqueue task on shutdown queue.");
                return false;
            }
            task_queue_.push_back({std::move(fn), std::chrono::steady_clock::now()});
        }
        cv_.notify_one();
        return true;
    }

    // Queued tasks are drained before the workers exit.
    void shutdown() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (shutdown_.exchange(true)) {
                return;
            }
        }
        logger_->debug("Shutting down ThreadPoolQueue...");
        cv_.notify_all();
        for (std::thread& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        logger_->debug("ThreadPoolQueue shut down complete.");
    }

    size_t pending() const {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return task_queue_.size();
    }

private:
    void worker_thread() {
        while (true) {
            TimedTask current_task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return !task_queue_.empty() || shutdown_; });

                if (shutdown_ && task_queue_.empty()) {
                    return;
                }

                current_task = std::move(task_queue_.front());
                task_queue_.pop_front();
            }

            auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - current_task.enqueued_time);
            if (waited.count() > 1000) {
                logger_->warn("Task waited " + std::to_string(waited.count()) + "ms in ThreadPoolQueue");
            }

            try {
                current_task.task();
            } catch (const std::exception& e) {
                logger_->error("Exception caught in worker thread task: " + std::string(e.what()));
            }
        }
    }

    std::shared_ptr<ILogger> logger_;
    std::deque<TimedTask> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> threads_;
    std::atomic<bool> shutdown_;
};

#endif // THREAD_POOL_QUEUE_HPP
