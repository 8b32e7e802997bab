/*!
 * \file wrapper.hpp
 * \brief Call wrapper core: a callable applying a policy around every call
 * of its target, plus target naming
 * \copyright Copyright (C) The deco authors
 */

#ifndef DECO_WRAP_WRAPPER_HPP
#define DECO_WRAP_WRAPPER_HPP

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "deco/error/exception.hpp"
#include "deco/meta/abi.hpp"

namespace deco::wrap {

/*!
 * \brief A callable carrying a human-readable name for reports.
 * \tparam F The wrapped callable type
 */
template <typename F>
class Named {
public:
    using callable_target_tag = void;

    Named(std::string name, F func)
        : name_(std::move(name)), func_(std::move(func)) {}

    template <typename... Args>
        requires std::invocable<const F&, Args...>
    decltype(auto) operator()(Args&&... args) const {
        return std::invoke(func_, std::forward<Args>(args)...);
    }

    template <typename... Args>
        requires std::invocable<F&, Args...>
    decltype(auto) operator()(Args&&... args) {
        return std::invoke(func_, std::forward<Args>(args)...);
    }

    [[nodiscard]] auto name() const noexcept -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto target() const noexcept -> const F& { return func_; }

private:
    std::string name_;
    F func_;
};

template <typename F>
auto named(std::string name, F func) -> Named<F> {
    return Named<F>(std::move(name), std::move(func));
}

/// Attach the spelled name of a function: DECO_NAMED(compute).
#define DECO_NAMED(func) ::deco::wrap::named(#func, func)

/*!
 * \brief Name used in reports for a target.
 *
 * Looks through wrappers to the innermost named target. A plain function is
 * named after its symbol when the symbol is exported; anything else falls
 * back to the demangled type of the callable.
 */
template <typename F>
auto targetName(const F& func) -> std::string {
    if constexpr (requires { func.name(); }) {
        return std::string(func.name());
    } else if constexpr (requires { func.target(); }) {
        return targetName(func.target());
    } else if constexpr (std::is_function_v<F>) {
        return targetName(&func);
    } else if constexpr (std::is_pointer_v<F> &&
                         std::is_function_v<std::remove_pointer_t<F>>) {
        if (auto symbol = meta::DemangleHelper::functionName(
                reinterpret_cast<const void*>(func))) {
            return *symbol;
        }
        return meta::DemangleHelper::demangleType<F>();
    } else {
        return meta::DemangleHelper::demangleType<F>();
    }
}

/*!
 * \brief Reject targets that cannot be called at all.
 * \throws error::InvalidArgument for a null function pointer or an empty
 * std::function
 */
template <typename F>
void requireTarget(const F& func) {
    if constexpr (std::is_pointer_v<F> || std::is_member_pointer_v<F>) {
        if (func == nullptr) {
            THROW_INVALID_ARGUMENT("Cannot wrap a null function pointer");
        }
    } else if constexpr (requires { static_cast<bool>(func); } &&
                         requires { func.target_type(); }) {
        if (!static_cast<bool>(func)) {
            THROW_INVALID_ARGUMENT("Cannot wrap an empty std::function");
        }
    }
}

/*!
 * \brief A target combined with the policy applied to each of its calls.
 *
 * The policy is invoked as policy(target, args...) and decides how often,
 * where and under which guards the target runs. Wrapper and policy are
 * immutable after construction, so one wrapper may be called concurrently.
 *
 * \tparam F The target callable type
 * \tparam Policy The call policy type
 */
template <typename F, typename Policy>
class Wrapper {
public:
    using callable_target_tag = void;
    using target_type = F;
    using policy_type = Policy;

    Wrapper(F target, Policy policy) noexcept(
        std::is_nothrow_move_constructible_v<F> &&
        std::is_nothrow_move_constructible_v<Policy>)
        : target_(std::move(target)), policy_(std::move(policy)) {}

    template <typename... Args>
        requires std::invocable<const Policy&, const F&, Args...>
    decltype(auto) operator()(Args&&... args) const {
        return policy_(target_, std::forward<Args>(args)...);
    }

    template <typename... Args>
        requires std::invocable<const Policy&, F&, Args...>
    decltype(auto) operator()(Args&&... args) {
        return policy_(target_, std::forward<Args>(args)...);
    }

    [[nodiscard]] auto target() const noexcept -> const F& { return target_; }

    [[nodiscard]] auto policy() const noexcept -> const Policy& {
        return policy_;
    }

private:
    F target_;
    Policy policy_;
};

}  // namespace deco::wrap

#endif  // DECO_WRAP_WRAPPER_HPP
