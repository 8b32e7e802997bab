#include <gtest/gtest.h>
#include "deco/async/completion.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

class CompletionQueueTest : public ::testing::Test {
protected:
    deco::async::ThreadPool pool{
        deco::async::ThreadPool::Options::createFixed(4)};
};

TEST_F(CompletionQueueTest, ReturnsResultsInCompletionOrder) {
    deco::async::CompletionQueue<int> queue(pool);

    std::promise<void> releaseSlow;
    auto slowGate = releaseSlow.get_future().share();

    queue.submit([slowGate] {
        slowGate.wait();
        return 1;
    });
    queue.submit([] { return 2; });

    EXPECT_EQ(queue.pending(), 2U);
    EXPECT_EQ(queue.next().get(), 2);

    releaseSlow.set_value();
    EXPECT_EQ(queue.next().get(), 1);
    EXPECT_EQ(queue.pending(), 0U);
}

TEST_F(CompletionQueueTest, NextReturnsReadyFuture) {
    deco::async::CompletionQueue<int> queue(pool);
    queue.submit([] {
        std::this_thread::sleep_for(5ms);
        return 9;
    });

    auto future = queue.next();
    EXPECT_EQ(future.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(future.get(), 9);
}

TEST_F(CompletionQueueTest, FailuresAreDeliveredThroughFutures) {
    deco::async::CompletionQueue<int> queue(pool);
    queue.submit([]() -> int { throw std::runtime_error("unit failed"); });

    auto future = queue.next();
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(CompletionQueueTest, VoidUnits) {
    deco::async::CompletionQueue<void> queue(pool);
    std::atomic<int> calls{0};
    for (int i = 0; i < 5; ++i) {
        queue.submit([&calls] { ++calls; });
    }
    while (queue.pending() > 0) {
        queue.next().get();
    }
    EXPECT_EQ(calls.load(), 5);
}

TEST_F(CompletionQueueTest, NextWithoutPendingWorkThrows) {
    deco::async::CompletionQueue<int> queue(pool);
    EXPECT_THROW((void)queue.next(), deco::error::RuntimeError);
}

TEST_F(CompletionQueueTest, DestructorWaitsForUnreadUnits) {
    std::atomic<int> finished{0};
    {
        deco::async::CompletionQueue<void> queue(pool);
        for (int i = 0; i < 3; ++i) {
            queue.submit([&finished] {
                std::this_thread::sleep_for(10ms);
                ++finished;
            });
        }
    }
    EXPECT_EQ(finished.load(), 3);
}

}  // namespace
