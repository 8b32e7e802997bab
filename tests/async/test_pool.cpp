#include <gtest/gtest.h>
#include "deco/async/pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

class ThreadPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool = std::make_unique<deco::async::ThreadPool>(
            deco::async::ThreadPool::Options::createFixed(4));
    }

    void TearDown() override { pool.reset(); }

    std::unique_ptr<deco::async::ThreadPool> pool;
};

TEST_F(ThreadPoolTest, FixedOptionsSizeThePool) {
    EXPECT_EQ(pool->getThreadCount(), 4U);
    EXPECT_FALSE(pool->getOptions().allowThreadGrowth);
    EXPECT_EQ(pool->getOptions().maxThreadCount, 4U);
}

TEST_F(ThreadPoolTest, DefaultOptionsStartAtLeastOneWorker) {
    deco::async::ThreadPool defaults;
    EXPECT_GE(defaults.getThreadCount(), 1U);
    EXPECT_GE(defaults.getOptions().maxThreadCount,
              defaults.getOptions().initialThreadCount);
}

TEST_F(ThreadPoolTest, SubmitReturnsResult) {
    auto future = pool->submit([](int a, int b) { return a + b; }, 2, 3);
    EXPECT_EQ(future.get(), 5);
}

TEST_F(ThreadPoolTest, SubmitCopiesArguments) {
    std::string text = "abc";
    auto future = pool->submit(
        [](std::string& s) {
            s += "d";
            return s;
        },
        text);
    EXPECT_EQ(future.get(), "abcd");
    EXPECT_EQ(text, "abc");
}

TEST_F(ThreadPoolTest, ExceptionsTravelThroughFuture) {
    auto future =
        pool->submit([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives the failure.
    EXPECT_EQ(pool->submit([] { return 1; }).get(), 1);
}

TEST_F(ThreadPoolTest, RunsTasksConcurrently) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 4; ++i) {
        futures.push_back(pool->submit([&] {
            int now = ++running;
            int expected = peak.load();
            while (now > expected &&
                   !peak.compare_exchange_weak(expected, now)) {
            }
            std::this_thread::sleep_for(50ms);
            --running;
        }));
    }
    for (auto& future : futures) {
        future.get();
    }
    EXPECT_GT(peak.load(), 1);
}

TEST_F(ThreadPoolTest, WaitForTasksDrainsQueue) {
    std::atomic<int> done{0};
    for (int i = 0; i < 20; ++i) {
        (void)pool->submit([&done] {
            std::this_thread::sleep_for(1ms);
            ++done;
        });
    }
    pool->waitForTasks();
    EXPECT_EQ(done.load(), 20);
    EXPECT_EQ(pool->getQueueSize(), 0U);
}

TEST_F(ThreadPoolTest, ShutdownRunsQueuedWorkAndRejectsNewWork) {
    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool->submit([&done] {
            std::this_thread::sleep_for(2ms);
            ++done;
        }));
    }

    pool->shutdown();
    EXPECT_TRUE(pool->isShutdown());
    EXPECT_EQ(done.load(), 10);
    EXPECT_THROW((void)pool->submit([] {}), deco::async::ThreadPoolError);

    // A second shutdown is harmless.
    EXPECT_NO_THROW(pool->shutdown());
}

TEST_F(ThreadPoolTest, BoundedQueueRejectsOverflow) {
    auto options = deco::async::ThreadPool::Options::createFixed(1);
    options.maxQueueSize = 1;
    deco::async::ThreadPool bounded(options);

    std::promise<void> release;
    auto gate = release.get_future().share();
    std::promise<void> started;

    auto blocker = bounded.submit([gate, &started] {
        started.set_value();
        gate.wait();
    });
    started.get_future().wait();

    auto queued = bounded.submit([] {});
    EXPECT_THROW((void)bounded.submit([] {}), deco::async::ThreadPoolError);

    release.set_value();
    blocker.get();
    queued.get();
}

TEST_F(ThreadPoolTest, GrowsWhenWorkersAreBusy) {
    deco::async::ThreadPool::Options options;
    options.initialThreadCount = 1;
    options.maxThreadCount = 3;
    options.allowThreadGrowth = true;
    deco::async::ThreadPool growing(options);

    std::promise<void> release;
    auto gate = release.get_future().share();
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 3; ++i) {
        futures.push_back(growing.submit([gate] { gate.wait(); }));
    }

    EXPECT_GT(growing.getThreadCount(), 1U);
    EXPECT_LE(growing.getThreadCount(), 3U);

    release.set_value();
    for (auto& future : futures) {
        future.get();
    }
}

TEST(DefaultThreadPoolTest, ReturnsSharedInstance) {
    auto first = deco::async::defaultThreadPool();
    auto second = deco::async::defaultThreadPool();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->submit([] { return 7; }).get(), 7);
}

}  // namespace
