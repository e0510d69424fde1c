#include <sweep/util/worker_pool.hpp>
#include <sweep/core_types.hpp>

#include <algorithm>
#include <exception>

namespace sweep {

size_t default_worker_count() {
    size_t hw = std::thread::hardware_concurrency();
    if (hw == 0) hw = 1;
    return std::min(MAX_WORKERS, hw * 2);
}

WorkerPool::WorkerPool(size_t workers, std::string name, std::shared_ptr<Logger> logger)
    : name_(std::move(name))
    , logger_(logger_or_null(std::move(logger)))
{
    size_t count = std::max<size_t>(1, workers);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    task_available_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(task));
    }
    task_available_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
}

std::vector<std::string> WorkerPool::failure_messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_messages_;
}

void WorkerPool::record_failure(const std::string& what) {
    failures_.fetch_add(1);
    logger_->error(name_ + ": worker task failed: " + what);
    std::lock_guard<std::mutex> lock(mutex_);
    failure_messages_.push_back(what);
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            // Outstanding tasks are drained even when stopping
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            record_failure(e.what());
        } catch (...) {
            record_failure("non-standard exception");
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            if (queue_.empty() && active_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

}  // namespace sweep
