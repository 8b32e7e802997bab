/*!
 * \file timing.hpp
 * \brief Execution-time measurement of a target with an injectable clock
 * \copyright Copyright (C) The deco authors
 */

#ifndef DECO_WRAP_TIMING_HPP
#define DECO_WRAP_TIMING_HPP

#include <chrono>
#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "deco/log/diagnostic.hpp"
#include "deco/wrap/wrapper.hpp"

namespace deco::wrap {

/*!
 * \brief Seconds on the steady high-resolution clock; the default timer.
 */
inline auto monotonicSeconds() -> double {
    using Clock = std::conditional_t<
        std::chrono::high_resolution_clock::is_steady,
        std::chrono::high_resolution_clock, std::chrono::steady_clock>;
    return std::chrono::duration<double>(Clock::now().time_since_epoch())
        .count();
}

/*!
 * \brief Configuration of timeit().
 */
struct TimingOptions {
    /// Name in reports; empty means the target's name.
    std::string name;
    /// Returns a timestamp in seconds; empty means monotonicSeconds.
    std::function<double()> timer;
    /// Called with (name, elapsed seconds) after each successful call.
    std::function<void(std::string_view, double)> handler;
    /// Always receives the timing; null means log::defaultSink().
    std::shared_ptr<log::DiagnosticSink> sink;
};

/*!
 * \brief Times one call of the target.
 *
 * An exception from the target propagates and nothing is reported. After a
 * normal return the handler (if any) and then the sink receive the elapsed
 * time; the result is returned unchanged.
 */
class TimingPolicy {
public:
    TimingPolicy(TimingOptions options, std::string name)
        : timer_(options.timer ? std::move(options.timer)
                               : std::function<double()>(monotonicSeconds)),
          handler_(std::move(options.handler)),
          sink_(options.sink ? std::move(options.sink) : log::defaultSink()),
          name_(std::move(name)) {}

    template <typename Target, typename... Args>
        requires std::invocable<Target&, Args...>
    auto operator()(Target& target, Args&&... args) const
        -> std::invoke_result_t<Target&, Args...> {
        using Result = std::invoke_result_t<Target&, Args...>;

        const double start = timer_();
        if constexpr (std::is_void_v<Result>) {
            std::invoke(target, std::forward<Args>(args)...);
            report(timer_() - start);
        } else {
            Result result = std::invoke(target, std::forward<Args>(args)...);
            report(timer_() - start);
            return std::forward<Result>(result);
        }
    }

    [[nodiscard]] auto name() const noexcept -> const std::string& {
        return name_;
    }

private:
    void report(double elapsed) const {
        if (handler_) {
            handler_(name_, elapsed);
        }
        sink_->reportTiming(name_, elapsed);
    }

    std::function<double()> timer_;
    std::function<void(std::string_view, double)> handler_;
    std::shared_ptr<log::DiagnosticSink> sink_;
    std::string name_;
};

/*!
 * \brief Decorator produced by timeit(options).
 */
class Timeit {
public:
    explicit Timeit(TimingOptions options = {})
        : options_(std::move(options)) {}

    template <typename F>
    auto operator()(F func) const -> Wrapper<F, TimingPolicy> {
        requireTarget(func);
        std::string name =
            options_.name.empty() ? targetName(func) : options_.name;
        return Wrapper<F, TimingPolicy>(
            std::move(func), TimingPolicy(options_, std::move(name)));
    }

private:
    TimingOptions options_;
};

/*!
 * \brief Parameterized form: timeit({.timer = clock, .handler = h}), or
 * timeit() for the defaults.
 */
inline auto timeit(TimingOptions options = {}) -> Timeit {
    return Timeit(std::move(options));
}

/*!
 * \brief Bare form: timeit(f) reports every call of f to the default sink.
 */
template <typename F>
    requires(!std::same_as<std::remove_cvref_t<F>, TimingOptions>)
auto timeit(F func) {
    return Timeit()(std::move(func));
}

}  // namespace deco::wrap

#endif  // DECO_WRAP_TIMING_HPP
