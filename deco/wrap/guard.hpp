/*!
 * \file guard.hpp
 * \brief Exception interception: matched exceptions become a typed
 * "no result" outcome plus one report
 * \copyright Copyright (C) The deco authors
 */

#ifndef DECO_WRAP_GUARD_HPP
#define DECO_WRAP_GUARD_HPP

#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "deco/error/caught.hpp"
#include "deco/log/diagnostic.hpp"
#include "deco/type/expected.hpp"
#include "deco/wrap/wrapper.hpp"

namespace deco::wrap {

/*!
 * \brief Outcome of a guarded call: the target's value, or the intercepted
 * exception standing in for "no result".
 */
template <typename R>
using Guarded = type::expected<R, error::CaughtError>;

/*!
 * \brief Configuration of guard().
 */
struct GuardOptions {
    /// Receives each intercepted exception instead of the sink.
    std::function<void(const error::CaughtError&)> handler;
    /// Report nothing, not even to the handler.
    bool silent = false;
    /// Sink used when there is no handler; null means log::defaultSink().
    std::shared_ptr<log::DiagnosticSink> sink;
    /// Name in reports; empty means the target's name.
    std::string name;
};

namespace detail {

// One nested try per matched class; the innermost runs the body.
template <typename Result, typename First, typename... Rest, typename Body>
auto runCatching(Body& body) -> Guarded<Result> {
    try {
        if constexpr (sizeof...(Rest) > 0) {
            return runCatching<Result, Rest...>(body);
        } else if constexpr (std::is_void_v<Result>) {
            body();
            return Guarded<Result>();
        } else {
            return Guarded<Result>(std::in_place, body());
        }
    } catch (const First& caught) {
        return Guarded<Result>(type::unexpect,
                               error::CaughtError::fromCurrent(caught));
    }
}

}  // namespace detail

/*!
 * \brief Runs the target, intercepting exceptions of the classes Es.
 *
 * Unmatched exceptions propagate unchanged. A matched one is reported to
 * exactly one of handler or sink unless silent, outside of any catch
 * clause, so an exception thrown by the handler propagates to the caller.
 */
template <typename... Es>
class GuardPolicy {
    static_assert(sizeof...(Es) > 0, "guard needs at least one class");

public:
    GuardPolicy(GuardOptions options, std::string name)
        : handler_(std::move(options.handler)),
          silent_(options.silent),
          sink_(std::move(options.sink)),
          name_(std::move(name)) {}

    template <typename Target, typename... Args>
        requires std::invocable<Target&, Args...>
    auto operator()(Target& target, Args&&... args) const
        -> Guarded<std::remove_cvref_t<std::invoke_result_t<Target&, Args...>>> {
        using Result =
            std::remove_cvref_t<std::invoke_result_t<Target&, Args...>>;

        auto body = [&]() -> decltype(auto) {
            return std::invoke(target, std::forward<Args>(args)...);
        };
        auto outcome = detail::runCatching<Result, Es...>(body);

        if (!outcome.has_value() && !silent_) {
            report(outcome.error());
        }
        return outcome;
    }

    [[nodiscard]] auto name() const noexcept -> const std::string& {
        return name_;
    }

private:
    void report(const error::CaughtError& caught) const {
        if (handler_) {
            handler_(caught);
            return;
        }
        auto sink = sink_ ? sink_ : log::defaultSink();
        sink->reportException(name_, caught);
    }

    std::function<void(const error::CaughtError&)> handler_;
    bool silent_;
    std::shared_ptr<log::DiagnosticSink> sink_;
    std::string name_;
};

/*!
 * \brief Decorator produced by guard<Es...>(options).
 */
template <typename... Es>
class Guard {
public:
    explicit Guard(GuardOptions options = {}) : options_(std::move(options)) {}

    template <typename F>
    auto operator()(F func) const -> Wrapper<F, GuardPolicy<Es...>> {
        requireTarget(func);
        std::string name =
            options_.name.empty() ? targetName(func) : options_.name;
        return Wrapper<F, GuardPolicy<Es...>>(
            std::move(func), GuardPolicy<Es...>(options_, std::move(name)));
    }

    [[nodiscard]] auto options() const noexcept -> const GuardOptions& {
        return options_;
    }

private:
    GuardOptions options_;
};

/*!
 * \brief Parameterized form: guard<std::invalid_argument>({.silent = true}).
 *
 * With no classes listed, every std::exception is intercepted. Listing
 * several classes intercepts any one of them.
 */
template <typename... Es>
auto guard(GuardOptions options = {}) {
    if constexpr (sizeof...(Es) == 0) {
        return Guard<std::exception>(std::move(options));
    } else {
        return Guard<Es...>(std::move(options));
    }
}

/*!
 * \brief Bare form: guard(f) intercepts every std::exception thrown by f
 * and reports it to the default sink.
 */
template <typename F>
    requires(!std::same_as<std::remove_cvref_t<F>, GuardOptions>)
auto guard(F func) {
    return Guard<std::exception>()(std::move(func));
}

}  // namespace deco::wrap

#endif  // DECO_WRAP_GUARD_HPP
