#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace sonar {
namespace scan {

/**
 * @brief Fixed-size pool of worker threads for one scan's probe tasks.
 *
 * Tasks are dispatched FIFO. The destructor runs whatever is still queued
 * and joins every thread. Probe tasks watch the scan Deadline, so a
 * cancelled scan empties the queue quickly.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    template <typename F>
    auto submit(F &&fn) -> std::future<typename std::invoke_result<F>::type> {
        using R = typename std::invoke_result<F>::type;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.emplace_back([task]() { (*task)(); });
        }
        cond_.notify_one();
        return future;
    }

    size_t size() const { return threads_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> threads_;
    std::deque<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable cond_;
    bool shutdown_ = false;
};

}  // namespace scan
}  // namespace sonar
