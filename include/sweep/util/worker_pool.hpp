#pragma once

#include <sweep/util/logger.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sweep {

/**
 * Cooperative cancellation flag.
 *
 * Copies share the same flag. Long-running operations check it at unit
 * boundaries (one directory entry, one file copy, one removal) and stop
 * scheduling new units once it is set. Work already applied is not undone.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true, std::memory_order_relaxed); }
    bool cancelled() const { return flag_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * Default parallelism: twice the hardware concurrency, capped at MAX_WORKERS.
 */
size_t default_worker_count();

/**
 * WorkerPool - Fixed-size pool of threads draining a FIFO task queue.
 *
 * One instance backs each parallel component (scanner, removal, snapshot
 * copy). A task that throws is recorded as a worker failure and logged;
 * the worker thread keeps running and the remaining tasks still execute.
 *
 * Thread safety: submit() and wait_idle() may be called from any thread,
 * but not from inside a task of the same pool.
 */
class WorkerPool {
public:
    /**
     * Start the worker threads.
     *
     * @param workers Number of threads (0 is treated as 1)
     * @param name Pool name used in log messages
     * @param logger Receives worker failure reports
     */
    explicit WorkerPool(size_t workers,
                        std::string name = "pool",
                        std::shared_ptr<Logger> logger = nullptr);

    /**
     * Drain outstanding tasks and join all threads.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> task);

    /**
     * Block until the queue is empty and no task is running.
     */
    void wait_idle();

    size_t worker_count() const { return workers_.size(); }

    size_t failure_count() const { return failures_.load(); }
    std::vector<std::string> failure_messages() const;

private:
    void worker_loop();
    void record_failure(const std::string& what);

    std::string name_;
    std::shared_ptr<Logger> logger_;
    std::vector<std::thread> workers_;

    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable task_available_;
    std::condition_variable idle_;
    size_t active_ = 0;
    bool stopping_ = false;

    std::atomic<size_t> failures_{0};
    std::vector<std::string> failure_messages_;
};

}  // namespace sweep
