/*!
 * \file repeat.hpp
 * \brief Repeated invocation of a target, in sequence or spread across a
 * thread pool
 * \copyright Copyright (C) The deco authors
 */

#ifndef DECO_WRAP_REPEAT_HPP
#define DECO_WRAP_REPEAT_HPP

#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

#include "deco/async/completion.hpp"
#include "deco/async/pool.hpp"
#include "deco/error/exception.hpp"
#include "deco/wrap/wrapper.hpp"

namespace deco::wrap {

/*!
 * \brief Calls the target count times in a row and returns the last result.
 *
 * Every call but the last receives the arguments as lvalues, so no
 * repetition observes a moved-from argument. A throw stops the loop.
 */
class RepeatPolicy {
public:
    explicit RepeatPolicy(int count) : count_(count) {}

    template <typename Target, typename... Args>
        requires std::invocable<Target&, Args&...> &&
                 std::invocable<Target&, Args...>
    decltype(auto) operator()(Target& target, Args&&... args) const {
        for (int i = 1; i < count_; ++i) {
            std::invoke(target, args...);
        }
        return std::invoke(target, std::forward<Args>(args)...);
    }

    [[nodiscard]] auto count() const noexcept -> int { return count_; }

private:
    int count_;
};

/*!
 * \brief Decorator produced by repeat(n).
 */
class Repeat {
public:
    /*!
     * \throws error::InvalidArgument if count is not positive
     */
    explicit Repeat(int count) : count_(count) {
        if (count_ < 1) {
            THROW_INVALID_ARGUMENT("repeat count must be positive, got {}",
                                   count_);
        }
    }

    template <typename F>
    auto operator()(F func) const -> Wrapper<F, RepeatPolicy> {
        requireTarget(func);
        return Wrapper<F, RepeatPolicy>(std::move(func), RepeatPolicy(count_));
    }

    [[nodiscard]] auto count() const noexcept -> int { return count_; }

private:
    int count_;
};

/*!
 * \brief Run the decorated callable @p count times per call, returning the
 * result of the final run.
 *
 * repeat(1) still wraps (one run per call); use repeat<1>(f) to get f back
 * untouched.
 */
inline auto repeat(int count = 1) -> Repeat { return Repeat(count); }

/*!
 * \brief Compile-time count; repeat<1>(f) returns f itself.
 */
template <int Count, typename F>
auto repeat(F func) {
    static_assert(Count > 0, "repeat count must be positive");
    if constexpr (Count == 1) {
        return func;
    } else {
        return Repeat(Count)(std::move(func));
    }
}

/*!
 * \brief Submits count calls of the target to a pool and waits for all.
 *
 * Every submission receives the caller's arguments as lvalues, as the
 * sequential repeat does; reference parameters therefore see the caller's
 * objects and the target must tolerate that sharing. The arguments outlive
 * all submissions because the call blocks until each one has finished.
 * Results are observed in completion order and the value of the one
 * observed last is returned: "last completed", not "first success" and not
 * "first submitted". If any call threw, the first failure observed is
 * rethrown once every call has finished.
 */
class ThreadedRepeatPolicy {
public:
    ThreadedRepeatPolicy(int count, std::shared_ptr<async::ThreadPool> pool)
        : count_(count), pool_(std::move(pool)) {}

    template <typename Target, typename... Args>
        requires std::invocable<Target&, Args&...>
    auto operator()(Target& target, Args&&... args) const
        -> std::remove_cvref_t<std::invoke_result_t<Target&, Args&...>> {
        using Result =
            std::remove_cvref_t<std::invoke_result_t<Target&, Args&...>>;

        async::CompletionQueue<Result> queue(*pool_);
        for (int i = 0; i < count_; ++i) {
            queue.submit([&target, &args...]() -> Result {
                return std::invoke(target, args...);
            });
        }

        std::exception_ptr firstFailure;
        int failures = 0;
        if constexpr (std::is_void_v<Result>) {
            while (queue.pending() > 0) {
                auto future = queue.next();
                try {
                    future.get();
                } catch (...) {
                    ++failures;
                    if (!firstFailure) {
                        firstFailure = std::current_exception();
                    }
                }
            }
            rethrowIfFailed(firstFailure, failures);
        } else {
            std::optional<Result> last;
            while (queue.pending() > 0) {
                auto future = queue.next();
                try {
                    last.emplace(future.get());
                } catch (...) {
                    ++failures;
                    if (!firstFailure) {
                        firstFailure = std::current_exception();
                    }
                }
            }
            rethrowIfFailed(firstFailure, failures);
            return std::move(*last);
        }
    }

    [[nodiscard]] auto count() const noexcept -> int { return count_; }

    [[nodiscard]] auto pool() const noexcept
        -> const std::shared_ptr<async::ThreadPool>& {
        return pool_;
    }

private:
    void rethrowIfFailed(const std::exception_ptr& failure,
                         int failures) const {
        if (failure) {
            spdlog::debug("threadedRepeat: {} of {} calls failed", failures,
                          count_);
            std::rethrow_exception(failure);
        }
    }

    int count_;
    std::shared_ptr<async::ThreadPool> pool_;
};

/*!
 * \brief Decorator produced by threadedRepeat(n, pool).
 */
class ThreadedRepeat {
public:
    /*!
     * \param count Calls per invocation, must be positive
     * \param pool Pool to run on; null selects async::defaultThreadPool()
     * \throws error::InvalidArgument if count is not positive
     */
    explicit ThreadedRepeat(int count,
                            std::shared_ptr<async::ThreadPool> pool = nullptr)
        : count_(count), pool_(std::move(pool)) {
        if (count_ < 1) {
            THROW_INVALID_ARGUMENT(
                "threadedRepeat count must be positive, got {}", count_);
        }
        if (!pool_) {
            pool_ = async::defaultThreadPool();
        }
    }

    template <typename F>
    auto operator()(F func) const -> Wrapper<F, ThreadedRepeatPolicy> {
        requireTarget(func);
        return Wrapper<F, ThreadedRepeatPolicy>(
            std::move(func), ThreadedRepeatPolicy(count_, pool_));
    }

    [[nodiscard]] auto count() const noexcept -> int { return count_; }

private:
    int count_;
    std::shared_ptr<async::ThreadPool> pool_;
};

/*!
 * \brief Run the decorated callable @p count times concurrently per call
 * and return the result of the run that completed last.
 *
 * Meant to absorb occasional spurious failures or variance by racing
 * several attempts; it neither lowers latency predictably nor picks a "best"
 * result. The target must tolerate concurrent calls. There is no cancellation
 * and no timeout: a hanging run hangs the call.
 */
inline auto threadedRepeat(int count = 1,
                           std::shared_ptr<async::ThreadPool> pool = nullptr)
    -> ThreadedRepeat {
    return ThreadedRepeat(count, std::move(pool));
}

}  // namespace deco::wrap

#endif  // DECO_WRAP_REPEAT_HPP
