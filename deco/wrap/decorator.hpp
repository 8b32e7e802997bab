/*!
 * \file decorator.hpp
 * \brief Builds decorators that work both bare, deco(f), and configured,
 * deco(args...)(f), from one implementation function
 * \copyright Copyright (C) The deco authors
 */

#ifndef DECO_WRAP_DECORATOR_HPP
#define DECO_WRAP_DECORATOR_HPP

#include <concepts>
#include <functional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include "deco/error/exception.hpp"
#include "deco/meta/kwargs.hpp"
#include "deco/wrap/wrapper.hpp"

namespace deco::wrap {

/**
 * @brief Thrown when a decorator receives keyword arguments its
 * implementation cannot take.
 */
class DecoratorError : public error::Exception {
public:
    using Exception::Exception;
};

#define THROW_DECORATOR_ERROR(...)                                        \
    throw deco::wrap::DecoratorError(DECO_FILE_NAME, DECO_FILE_LINE,      \
                                     DECO_FUNC_NAME, __VA_ARGS__)

namespace detail {

inline auto joinNames(const meta::Kwargs& kwargs) -> std::string {
    std::string joined;
    for (const auto& name : kwargs.names()) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

// impl(target, positional..., kwargs), or impl(target, positional...) when
// the implementation takes no keyword set.
template <typename Impl, typename Target, typename Positional>
decltype(auto) invokeImpl(Impl& impl, Target& target, Positional&& positional,
                          const meta::Kwargs& kwargs) {
    return std::apply(
        [&](auto&&... pos) -> decltype(auto) {
            if constexpr (std::invocable<Impl&, Target&, decltype(pos)...,
                                         const meta::Kwargs&>) {
                return std::invoke(impl, target,
                                   std::forward<decltype(pos)>(pos)...,
                                   kwargs);
            } else {
                if (!kwargs.empty()) {
                    THROW_DECORATOR_ERROR(
                        "Decorator implementation takes no keyword "
                        "arguments, got: {}",
                        joinNames(kwargs));
                }
                return std::invoke(impl, target,
                                   std::forward<decltype(pos)>(pos)...);
            }
        },
        std::forward<Positional>(positional));
}

template <typename Tuple>
auto refTuple(Tuple& stored) {
    return std::apply([](auto&... values) { return std::tie(values...); },
                      stored);
}

}  // namespace detail

/**
 * @brief A target decorated by a builder implementation.
 *
 * Each call runs impl(target, dargs..., call positional...,
 * dkwargs merged with call kwargs). Call-time keywords win over
 * decoration-time keywords of the same name.
 *
 * @tparam Impl The implementation callable
 * @tparam Target The decorated callable
 * @tparam DArgs Tuple of positional decoration-time arguments
 */
template <typename Impl, typename Target, typename DArgs = std::tuple<>>
class Decorated {
public:
    using callable_target_tag = void;

    Decorated(Impl impl, Target target, DArgs dargs = {},
              meta::Kwargs dkwargs = {})
        : impl_(std::move(impl)),
          target_(std::move(target)),
          dargs_(std::move(dargs)),
          dkwargs_(std::move(dkwargs)) {}

    template <typename... Args>
    decltype(auto) operator()(Args&&... args) const {
        const meta::Kwargs kwargs =
            dkwargs_.merged(meta::collectKwargs(args...));
        return detail::invokeImpl(
            impl_, target_,
            std::tuple_cat(detail::refTuple(dargs_),
                           meta::forwardPositional(std::forward<Args>(args)...)),
            kwargs);
    }

    template <typename... Args>
    decltype(auto) operator()(Args&&... args) {
        const meta::Kwargs kwargs =
            dkwargs_.merged(meta::collectKwargs(args...));
        return detail::invokeImpl(
            impl_, target_,
            std::tuple_cat(detail::refTuple(dargs_),
                           meta::forwardPositional(std::forward<Args>(args)...)),
            kwargs);
    }

    [[nodiscard]] auto target() const noexcept -> const Target& {
        return target_;
    }

    [[nodiscard]] auto keywords() const noexcept -> const meta::Kwargs& {
        return dkwargs_;
    }

private:
    Impl impl_;
    Target target_;
    DArgs dargs_;
    meta::Kwargs dkwargs_;
};

/**
 * @brief Decoration-time arguments waiting for a target.
 */
template <typename Impl, typename DArgs>
class ConfiguredDecorator {
public:
    ConfiguredDecorator(Impl impl, DArgs dargs, meta::Kwargs dkwargs)
        : impl_(std::move(impl)),
          dargs_(std::move(dargs)),
          dkwargs_(std::move(dkwargs)) {}

    template <typename F>
    auto operator()(F target) const -> Decorated<Impl, F, DArgs> {
        requireTarget(target);
        return Decorated<Impl, F, DArgs>(impl_, std::move(target), dargs_,
                                         dkwargs_);
    }

    [[nodiscard]] auto arguments() const noexcept -> const DArgs& {
        return dargs_;
    }

    [[nodiscard]] auto keywords() const noexcept -> const meta::Kwargs& {
        return dkwargs_;
    }

private:
    Impl impl_;
    DArgs dargs_;
    meta::Kwargs dkwargs_;
};

/**
 * @brief Result of decorator(impl).
 *
 * factory(f) with a single argument satisfying meta::CallableTarget
 * decorates f directly. Every other shape (no arguments, several, any
 * keyword, one non-callable) is configuration and returns a
 * ConfiguredDecorator. A lone callable meant as configuration is therefore
 * taken as the target; use configure() to force the second form and wrap()
 * to force the first.
 *
 * Generic lambdas and classes with an overloaded or templated operator()
 * have no single &T::operator() and so fail meta::CallableTarget: passed
 * alone they are taken as configuration. Decorate them with wrap(), or
 * specialize meta::is_callable_target for the class.
 */
template <typename Impl>
class DecoratorFactory {
public:
    explicit DecoratorFactory(Impl impl) : impl_(std::move(impl)) {}

    template <typename... Args>
    auto operator()(Args&&... args) const {
        if constexpr (sizeof...(Args) == 1 &&
                      (meta::CallableTarget<Args> && ...)) {
            return wrap(std::forward<Args>(args)...);
        } else {
            return configure(std::forward<Args>(args)...);
        }
    }

    template <typename F>
    auto wrap(F target) const -> Decorated<Impl, F> {
        requireTarget(target);
        return Decorated<Impl, F>(impl_, std::move(target));
    }

    /**
     * @throws error::InvalidArgument if a keyword name repeats
     */
    template <typename... Args>
    auto configure(Args&&... args) const {
        meta::Kwargs dkwargs = meta::collectKwargs(args...);
        auto dargs = meta::collectPositional(std::forward<Args>(args)...);
        return ConfiguredDecorator<Impl, decltype(dargs)>(
            impl_, std::move(dargs), std::move(dkwargs));
    }

private:
    Impl impl_;
};

/**
 * @brief Turn impl(target, args..., kwargs) into a decorator usable bare
 * or with arguments.
 */
template <typename Impl>
auto decorator(Impl impl) -> DecoratorFactory<Impl> {
    return DecoratorFactory<Impl>(std::move(impl));
}

}  // namespace deco::wrap

#endif  // DECO_WRAP_DECORATOR_HPP
