#include "worker_pool.hpp"

#include <algorithm>

namespace sonar {
namespace scan {

WorkerPool::WorkerPool(size_t thread_count) {
    thread_count = std::max<size_t>(thread_count, 1);
    threads_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    cond_.notify_all();
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this] { return shutdown_ || !jobs_.empty(); });
            if (shutdown_ && jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        // packaged_task stores any exception in its future
        job();
    }
}

}  // namespace scan
}  // namespace sonar
