// EN: Unit tests for the fixed-size job worker pool.
// FR: Tests unitaires du pool de workers de taille fixe.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "infrastructure/threading/thread_pool.hpp"

using namespace CIP;
using namespace std::chrono_literals;

namespace {

ThreadPoolConfig poolConfig(size_t threads, size_t max_queue_size = 0) {
    ThreadPoolConfig config;
    config.threads = threads;
    config.max_queue_size = max_queue_size;
    return config;
}

} // namespace

TEST(ThreadPoolTest, ReturnsResultsThroughFutures) {
    ThreadPool pool(poolConfig(2));

    auto sum = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    auto name = pool.submitNamed("fmt", []() { return std::string("fmt done"); });

    EXPECT_EQ(sum.get(), 5);
    EXPECT_EQ(name.get(), "fmt done");
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(poolConfig(1));

    auto failing = pool.submit([]() -> int { throw std::runtime_error("spawn failed"); });
    EXPECT_THROW(failing.get(), std::runtime_error);

    auto next = pool.submit([]() { return 1; });
    EXPECT_EQ(next.get(), 1);
}

TEST(ThreadPoolTest, NeverExceedsWorkerCount) {
    ThreadPool pool(poolConfig(2));
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 6; ++i) {
        futures.push_back(pool.submit([&running, &peak]() {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(50ms);
            --running;
        }));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_LE(peak.load(), 2);
    EXPECT_LE(pool.getStats().peak_active_threads, 2u);
}

TEST(ThreadPoolTest, RunsTasksConcurrently) {
    ThreadPool pool(poolConfig(4));
    auto start = std::chrono::steady_clock::now();

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(pool.submit([]() { std::this_thread::sleep_for(200ms); }));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_LT(std::chrono::steady_clock::now() - start, 700ms);
}

TEST(ThreadPoolTest, BoundedQueueRejectsOverflow) {
    ThreadPool pool(poolConfig(1, 1));
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> started{false};

    auto blocker = pool.submit([gate, &started]() {
        started = true;
        gate.wait();
    });
    while (!started) {
        std::this_thread::sleep_for(1ms);
    }

    auto queued = pool.submit([]() {});
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);

    release.set_value();
    blocker.get();
    queued.get();
}

TEST(ThreadPoolTest, ShutdownDrainsQueueThenRejects) {
    ThreadPool pool(poolConfig(1));
    std::atomic<int> done{0};

    for (int i = 0; i < 5; ++i) {
        pool.submit([&done]() {
            std::this_thread::sleep_for(10ms);
            done++;
        });
    }
    pool.shutdown();

    EXPECT_EQ(done.load(), 5);
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);
    pool.shutdown();
}

TEST(ThreadPoolTest, CallbackReportsNamedTasks) {
    ThreadPool pool(poolConfig(2));
    std::mutex mutex;
    std::vector<std::string> names;
    pool.setTaskCallback([&](const std::string& name, bool success, std::chrono::milliseconds) {
        std::lock_guard<std::mutex> lock(mutex);
        if (success) {
            names.push_back(name);
        }
    });

    pool.submitNamed("test", []() {});
    pool.submitNamed("clippy", []() {});
    pool.waitForAll();

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(names.size(), 2u);
    EXPECT_EQ(pool.getStats().completed_tasks, 2u);
}

TEST(ThreadPoolTest, RejectsZeroThreads) {
    EXPECT_THROW(ThreadPool(poolConfig(0)), std::invalid_argument);
}
