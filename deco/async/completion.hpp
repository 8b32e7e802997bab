#ifndef DECO_ASYNC_COMPLETION_HPP
#define DECO_ASYNC_COMPLETION_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

#include "deco/async/pool.hpp"
#include "deco/error/exception.hpp"

namespace deco::async {

/**
 * @brief Collects work submitted to a ThreadPool and hands back the futures
 * in the order their work finished.
 *
 * The queue must be drained (or destroyed) by the thread that owns it. The
 * destructor waits for every submitted unit, so no work outlives the queue.
 *
 * @tparam T Result type of every unit of work
 */
template <typename T>
class CompletionQueue {
public:
    explicit CompletionQueue(ThreadPool& pool) : pool_(pool) {}

    CompletionQueue(const CompletionQueue&) = delete;
    CompletionQueue& operator=(const CompletionQueue&) = delete;

    ~CompletionQueue() { waitAll(); }

    /**
     * @brief Submit one unit of work returning T.
     * @throws ThreadPoolError If the pool rejects the work
     */
    template <typename F>
        requires std::is_invocable_r_v<T, std::decay_t<F>&>
    void submit(F&& work) {
        std::size_t index = futures_.size();
        futures_.push_back(pool_.submit(
            [state = state_, index,
             work = std::forward<F>(work)]() mutable -> T {
                // Signals after the return value is built; next() then
                // blocks in get() only for the final hand-off.
                Notifier notifier{state.get(), index};
                return work();
            }));
        ++pending_;
    }

    /**
     * @brief Number of submitted units not yet returned by next().
     */
    [[nodiscard]] auto pending() const noexcept -> std::size_t {
        return pending_;
    }

    /**
     * @brief Blocks until the next unit finishes and returns its future,
     * which is ready (holds a value or an exception).
     * @throws error::RuntimeError If nothing is pending
     */
    [[nodiscard]] auto next() -> std::future<T> {
        if (pending_ == 0) {
            THROW_RUNTIME_ERROR("CompletionQueue::next() with no pending work");
        }

        std::size_t index;
        {
            std::unique_lock lock(state_->mutex);
            state_->cv.wait(lock, [this] { return !state_->done.empty(); });
            index = state_->done.front();
            state_->done.pop_front();
        }
        --pending_;

        auto future = std::move(futures_[index]);
        future.wait();
        return future;
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::size_t> done;
    };

    struct Notifier {
        State* state;
        std::size_t index;

        ~Notifier() {
            {
                std::lock_guard lock(state->mutex);
                state->done.push_back(index);
            }
            state->cv.notify_one();
        }
    };

    void waitAll() noexcept {
        for (auto& future : futures_) {
            if (future.valid()) {
                future.wait();
            }
        }
    }

    ThreadPool& pool_;
    std::shared_ptr<State> state_ = std::make_shared<State>();
    std::vector<std::future<T>> futures_;
    std::size_t pending_ = 0;
};

}  // namespace deco::async

#endif  // DECO_ASYNC_COMPLETION_HPP
