#include <gtest/gtest.h>
#include "mojrpc/worker_pool.hpp"
#include "mojrpc/error.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace mojrpc;

TEST(WorkerPool, SubmitReturnsValue) {
    WorkerPool pool(2);
    auto fut = pool.submit([] { return 6 * 7; });
    EXPECT_EQ(fut.get(), 42);
}

TEST(WorkerPool, AtLeastOneThread) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
}

TEST(WorkerPool, ExceptionTravelsThroughFuture) {
    WorkerPool pool(1);
    auto fut = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(fut.get(), std::runtime_error);
}

TEST(WorkerPool, RunsTasksConcurrently) {
    WorkerPool pool(4);
    auto start = std::chrono::steady_clock::now();
    std::vector<std::future<void>> futs;
    for (int i = 0; i < 4; ++i) {
        futs.push_back(pool.submit([] { std::this_thread::sleep_for(std::chrono::milliseconds(200)); }));
    }
    for (auto& f : futs) f.get();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(700));
}

TEST(WorkerPool, DrainsQueueOnDestruction) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 10; ++i) {
            pool.post([&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                ++done;
            });
        }
    }
    EXPECT_EQ(done.load(), 10);
}

TEST(WorkerPool, GrowsWhenAllWorkersAreBusy) {
    WorkerPool pool(1);
    std::atomic<int> entered{0};
    auto rendezvous = [&entered] {
        ++entered;
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (entered.load() < 3 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return entered.load() >= 3;
    };

    std::vector<std::future<bool>> futs;
    for (int i = 0; i < 3; ++i) {
        futs.push_back(pool.submit(rendezvous));
    }
    for (auto& f : futs) EXPECT_TRUE(f.get());
    EXPECT_GE(pool.size(), 3u);
}

TEST(WorkerPool, IdleWorkersAreReused) {
    WorkerPool pool(2);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(pool.submit([i] { return i; }).get(), i);
    }
    EXPECT_EQ(pool.size(), 2u);
}
