#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "scan/worker_pool.hpp"

using namespace sonar::scan;

TEST(WorkerPoolTest, ZeroThreadsStillRuns) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST(WorkerPoolTest, ResultsMatchTheirFutures) {
    WorkerPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 50; ++i) {
        futures.push_back(pool.submit([i] { return i * i; }));
    }
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(WorkerPoolTest, TasksRunConcurrently) {
    WorkerPool pool(4);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(pool.submit([&] {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            --running;
        }));
    }
    for (auto &f : futures) {
        f.get();
    }
    EXPECT_GT(peak.load(), 1);
}

TEST(WorkerPoolTest, ExceptionReachesTheFuture) {
    WorkerPool pool(2);
    auto failing = pool.submit([]() -> int { throw std::runtime_error("probe blew up"); });
    auto fine = pool.submit([] { return 1; });
    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(fine.get(), 1);
}

TEST(WorkerPoolTest, DestructorDrainsQueue) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 10; ++i) {
            pool.submit([&done] { ++done; });
        }
    }
    EXPECT_EQ(done.load(), 10);
}
