#ifndef DECO_ASYNC_POOL_HPP
#define DECO_ASYNC_POOL_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(__linux__)
#include <pthread.h>
#endif

#include <spdlog/spdlog.h>

#include "deco/error/exception.hpp"

namespace deco::async {

/**
 * @brief Exception class for thread pool errors
 */
class ThreadPoolError : public error::RuntimeError {
public:
    using error::RuntimeError::RuntimeError;
};

#define THROW_THREAD_POOL_ERROR(...)                                       \
    throw deco::async::ThreadPoolError(DECO_FILE_NAME, DECO_FILE_LINE,     \
                                       DECO_FUNC_NAME, __VA_ARGS__)

/**
 * @class ThreadPool
 * @brief Worker pool executing submitted units of work.
 *
 * Submission is thread-safe and may happen from any thread, including the
 * pool's own workers. A worker that blocks on work submitted to the same
 * saturated pool can deadlock it; allow thread growth when nesting.
 */
class ThreadPool {
public:
    /**
     * @brief Thread pool configuration options
     */
    struct Options {
        std::size_t initialThreadCount = 0;  // 0 means hardware thread count
        std::size_t maxThreadCount = 0;  // 0 means 4x the initial count
        std::size_t maxQueueSize = 0;    // 0 means unlimited
        bool allowThreadGrowth = true;   // Spawn workers when all are busy
        std::string threadNamePrefix = "deco-worker";

        static Options createDefault() { return {}; }

        /**
         * @brief Exactly @p threads workers, never more.
         */
        static Options createFixed(std::size_t threads) {
            Options opts;
            opts.initialThreadCount = threads;
            opts.maxThreadCount = threads;
            opts.allowThreadGrowth = false;
            return opts;
        }
    };

    /**
     * @brief Constructor
     * @param options Thread pool options
     */
    explicit ThreadPool(Options options = Options::createDefault())
        : options_(std::move(options)) {
        std::size_t numThreads = options_.initialThreadCount;
        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
        }
        // Ensure at least one thread
        numThreads = std::max<std::size_t>(1, numThreads);
        options_.initialThreadCount = numThreads;

        if (options_.maxThreadCount == 0) {
            options_.maxThreadCount = numThreads * 4;
        }
        options_.maxThreadCount =
            std::max(options_.maxThreadCount, options_.initialThreadCount);

        std::unique_lock lock(queueMutex_);
        for (std::size_t i = 0; i < numThreads; ++i) {
            createWorkerThread();
        }
        spdlog::debug("ThreadPool started with {} workers (max {})",
                      numThreads, options_.maxThreadCount);
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Destructor, drains queued work and joins all workers
     */
    ~ThreadPool() { shutdown(); }

    /**
     * @brief Submit a task to the thread pool
     * @tparam F Function type
     * @tparam Args Argument types
     * @param f Function to execute
     * @param args Function arguments, stored by value
     * @return Future resolving to the task's result or exception
     * @throws ThreadPoolError If the pool is shut down or the queue is full
     */
    template <typename F, typename... Args>
        requires std::invocable<std::decay_t<F>&, std::decay_t<Args>&...>
    auto submit(F&& f, Args&&... args)
        -> std::future<
            std::invoke_result_t<std::decay_t<F>&, std::decay_t<Args>&...>> {
        using ResultType =
            std::invoke_result_t<std::decay_t<F>&, std::decay_t<Args>&...>;
        using TaskType = std::packaged_task<ResultType()>;

        auto task = std::make_shared<TaskType>(
            [func = std::forward<F>(f),
             ... largs = std::forward<Args>(args)]() mutable -> ResultType {
                return std::invoke(func, largs...);
            });
        auto future = task->get_future();

        enqueue([task]() { (*task)(); });
        return future;
    }

    /**
     * @brief Get current queue size
     */
    [[nodiscard]] std::size_t getQueueSize() const {
        std::unique_lock lock(queueMutex_);
        return tasks_.size();
    }

    /**
     * @brief Get worker thread count
     */
    [[nodiscard]] std::size_t getThreadCount() const {
        std::unique_lock lock(queueMutex_);
        return workers_.size();
    }

    [[nodiscard]] std::size_t getActiveThreadCount() const {
        return activeThreads_.load();
    }

    [[nodiscard]] const Options& getOptions() const { return options_; }

    [[nodiscard]] bool isShutdown() const {
        return stop_.load(std::memory_order_acquire);
    }

    /**
     * @brief Wait for all current tasks to complete
     */
    void waitForTasks() {
        std::unique_lock lock(queueMutex_);
        waitEmpty_.wait(
            lock, [this] { return tasks_.empty() && activeThreads_ == 0; });
    }

    /**
     * @brief Stop accepting work, run what is queued, join all workers.
     *
     * Idempotent; later submissions throw ThreadPoolError.
     */
    void shutdown() {
        std::vector<std::thread> workers;
        {
            std::unique_lock lock(queueMutex_);
            if (stop_.exchange(true)) {
                return;
            }
            workers.swap(workers_);
        }

        condition_.notify_all();

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        spdlog::debug("ThreadPool stopped, {} workers joined", workers.size());
    }

private:
    void enqueue(std::function<void()> task) {
        {
            std::unique_lock lock(queueMutex_);

            if (stop_.load(std::memory_order_acquire)) {
                THROW_THREAD_POOL_ERROR(
                    "Cannot submit task: thread pool is shut down");
            }

            if (options_.maxQueueSize > 0 &&
                tasks_.size() >= options_.maxQueueSize) {
                spdlog::warn("ThreadPool queue full, rejecting task");
                THROW_THREAD_POOL_ERROR("Thread pool task queue is full ({})",
                                        options_.maxQueueSize);
            }

            tasks_.emplace_back(std::move(task));

            // Grow when every worker is busy and work is piling up.
            std::size_t idle = workers_.size() - activeThreads_.load();
            if (options_.allowThreadGrowth && tasks_.size() > idle &&
                workers_.size() < options_.maxThreadCount) {
                createWorkerThread();
            }
        }

        condition_.notify_one();
    }

    /**
     * @brief Create a worker thread; queueMutex_ must be held.
     */
    void createWorkerThread() {
        std::size_t id = workers_.size();
        workers_.emplace_back([this, id]() {
#if defined(__linux__)
            {
                // Linux limits thread names to 15 characters.
                std::string threadName =
                    (options_.threadNamePrefix + "-" + std::to_string(id))
                        .substr(0, 15);
                pthread_setname_np(pthread_self(), threadName.c_str());
            }
#endif
            workerLoop();
        });
    }

    void workerLoop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock lock(queueMutex_);
                condition_.wait(lock,
                                [this] { return stop_ || !tasks_.empty(); });

                // Queued work still runs after shutdown() was requested.
                if (stop_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop_front();
                activeThreads_++;
            }

            try {
                task();
            } catch (const std::exception& e) {
                // Submitted work reports through its future; this only
                // fires if the task wrapper itself fails.
                spdlog::error("ThreadPool task wrapper failed: {}", e.what());
            }

            {
                std::unique_lock lock(queueMutex_);
                activeThreads_--;
                if (activeThreads_ == 0 && tasks_.empty()) {
                    waitEmpty_.notify_all();
                }
            }
        }
    }

    Options options_;
    std::atomic<bool> stop_{false};
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;

    mutable std::mutex queueMutex_;
    std::condition_variable condition_;
    std::condition_variable waitEmpty_;

    std::atomic<std::size_t> activeThreads_{0};
};

/**
 * @brief Process-wide pool for callers that do not inject their own.
 *
 * Created on first use with Options::createDefault() and shared afterwards.
 * Prefer passing an explicit pool where isolation matters (tests, libraries).
 */
inline auto defaultThreadPool() -> std::shared_ptr<ThreadPool> {
    static const std::shared_ptr<ThreadPool> instance =
        std::make_shared<ThreadPool>(ThreadPool::Options::createDefault());
    return instance;
}

}  // namespace deco::async

#endif  // DECO_ASYNC_POOL_HPP
