#pragma once

#include <codegrader/common/class_traits.hpp>

#include <libassert/assert.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace codegrader {

/// Fixed-size pool of threads draining a FIFO task queue.
///
/// Shared by every grading request, so the number of concurrently running sandboxes never exceeds
/// the pool size no matter how many requests are in flight.
class WorkerPool : NonMovable
{
public:
    /// ``num_workers`` of 0 means one per hardware thread
    explicit WorkerPool(std::size_t num_workers = 0);

    /// Stops accepting work, discards queued tasks (their futures report broken_promise)
    /// and joins the workers once their current tasks are done
    ~WorkerPool();

    template <typename Func>
    std::future<std::invoke_result_t<std::decay_t<Func>&>> submit(Func&& func) {
        using R = std::invoke_result_t<std::decay_t<Func>&>;

        std::packaged_task<R()> task{std::forward<Func>(func)};
        auto future = task.get_future();

        {
            std::lock_guard lock{mutex_};
            ASSERT(!stopping_, "Work submitted to a pool that is shutting down");
            queue_.emplace_back(std::move(task));
        }
        cv_.notify_one();

        return future;
    }

    std::size_t size() const { return workers_.size(); }

    /// Number of tasks waiting for a worker
    std::size_t queued() const;

    /// Number of tasks currently running
    std::size_t busy() const;

private:
    void work_loop(std::stop_token stop);

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<std::move_only_function<void()>> queue_;
    std::size_t busy_{};
    bool stopping_ = false;

    std::vector<std::jthread> workers_;
};

} // namespace codegrader
