#include <codegrader/engine/worker_pool.hpp>

#include <codegrader/logging.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

namespace codegrader {

WorkerPool::WorkerPool(std::size_t num_workers) {
    if (num_workers == 0) {
        num_workers = std::max(1U, std::thread::hardware_concurrency());
    }

    workers_.reserve(num_workers);

    for (std::size_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { work_loop(std::move(stop)); });
    }

    LOG_DEBUG("Started worker pool with {} workers", num_workers);
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard lock{mutex_};
        stopping_ = true;
        queue_.clear();
    }

    for (auto& worker : workers_) {
        worker.request_stop();
    }

    // jthread joins on destruction
    workers_.clear();
}

std::size_t WorkerPool::queued() const {
    std::lock_guard lock{mutex_};
    return queue_.size();
}

std::size_t WorkerPool::busy() const {
    std::lock_guard lock{mutex_};
    return busy_;
}

void WorkerPool::work_loop(std::stop_token stop) {
    while (true) {
        std::move_only_function<void()> task;

        {
            std::unique_lock lock{mutex_};

            if (!cv_.wait(lock, stop, [this] { return !queue_.empty(); })) {
                return;
            }

            task = std::move(queue_.front());
            queue_.pop_front();
            ++busy_;
        }

        // packaged_task stores any exception in its future
        task();

        std::lock_guard lock{mutex_};
        --busy_;
    }
}

} // namespace codegrader
