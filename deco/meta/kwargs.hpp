/*!
 * \file kwargs.hpp
 * \brief Named arguments for decorator implementations, and the predicate
 * that tells a decoration target apart from configuration
 * \copyright Copyright (C) The deco authors
 */

#ifndef DECO_META_KWARGS_HPP
#define DECO_META_KWARGS_HPP

#include <any>
#include <concepts>
#include <functional>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "deco/error/exception.hpp"
#include "deco/meta/abi.hpp"

namespace deco::meta {

/*!
 * \brief One named argument, e.g. kw("retries", 3).
 */
class Keyword {
public:
    Keyword(std::string name, std::any value)
        : name_(std::move(name)), value_(std::move(value)) {}

    [[nodiscard]] auto name() const noexcept -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto value() const noexcept -> const std::any& {
        return value_;
    }

private:
    std::string name_;
    std::any value_;
};

/*!
 * \brief Build a named argument. String literals are stored as std::string.
 */
template <typename T>
auto kw(std::string name, T&& value) -> Keyword {
    using Stored = std::decay_t<T>;
    if constexpr (std::is_same_v<Stored, const char*> ||
                  std::is_same_v<Stored, char*>) {
        return Keyword(std::move(name), std::any(std::string(value)));
    } else {
        return Keyword(std::move(name), std::any(std::forward<T>(value)));
    }
}

/*!
 * \brief An ordered set of named arguments.
 */
class Kwargs {
public:
    Kwargs() = default;

    Kwargs(std::initializer_list<Keyword> keywords) {
        for (const auto& keyword : keywords) {
            add(keyword);
        }
    }

    /*!
     * \brief Add a keyword that must not already be present.
     * \throws error::InvalidArgument on a repeated name
     */
    void add(const Keyword& keyword) {
        auto [it, inserted] =
            values_.try_emplace(keyword.name(), keyword.value());
        if (!inserted) {
            THROW_INVALID_ARGUMENT("Keyword argument '{}' given more than once",
                                   keyword.name());
        }
    }

    /*!
     * \brief Add every keyword of @p other; names must not repeat.
     */
    void addAll(const Kwargs& other) {
        for (const auto& [name, value] : other.values_) {
            add(Keyword(name, value));
        }
    }

    /*!
     * \brief Add or replace a keyword.
     */
    void set(const Keyword& keyword) {
        values_.insert_or_assign(keyword.name(), keyword.value());
    }

    [[nodiscard]] auto contains(std::string_view name) const -> bool {
        return values_.find(name) != values_.end();
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return values_.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
        return values_.empty();
    }

    /*!
     * \brief Value of @p name as a @p T.
     * \throws error::InvalidArgument if absent or stored with another type
     */
    template <typename T>
    [[nodiscard]] auto get(std::string_view name) const -> T {
        auto it = values_.find(name);
        if (it == values_.end()) {
            THROW_INVALID_ARGUMENT("Missing keyword argument '{}'", name);
        }
        if (const T* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        THROW_INVALID_ARGUMENT(
            "Keyword argument '{}' holds {}, requested {}", name,
            DemangleHelper::demangle(it->second.type().name()),
            DemangleHelper::demangleType<T>());
    }

    template <typename T>
    [[nodiscard]] auto getOr(std::string_view name, T fallback) const -> T {
        if (!contains(name)) {
            return fallback;
        }
        return get<T>(name);
    }

    /*!
     * \brief Copy of this set with @p overrides applied on top.
     */
    [[nodiscard]] auto merged(const Kwargs& overrides) const -> Kwargs {
        Kwargs result = *this;
        for (const auto& [name, value] : overrides.values_) {
            result.values_.insert_or_assign(name, value);
        }
        return result;
    }

    [[nodiscard]] auto names() const -> std::vector<std::string> {
        std::vector<std::string> result;
        result.reserve(values_.size());
        for (const auto& entry : values_) {
            result.push_back(entry.first);
        }
        return result;
    }

private:
    std::map<std::string, std::any, std::less<>> values_;
};

/*!
 * \brief Arguments that travel as named arguments rather than positionally.
 */
template <typename T>
concept KeywordArgument = std::same_as<std::remove_cvref_t<T>, Keyword> ||
                          std::same_as<std::remove_cvref_t<T>, Kwargs>;

/*!
 * \brief Opt-in for callable class types the predicate cannot see, such as
 * ones whose operator() is a template. Specialize to std::true_type.
 */
template <typename T>
struct is_callable_target : std::false_type {};

namespace detail {

template <typename T>
concept HasCallOperator = requires { &T::operator(); };

// Wrapper types of this library declare `using callable_target_tag = void;`.
template <typename T>
concept TaggedCallable = requires { typename T::callable_target_tag; };

}  // namespace detail

/*!
 * \brief Whether an argument is taken as the target of a bare decorator.
 *
 * True for functions, function pointers, member pointers, class types with a
 * single non-template operator() (lambdas without auto parameters,
 * std::function), the wrappers of this library, and types opted in through
 * is_callable_target. Keyword arguments never qualify.
 */
template <typename T>
concept CallableTarget =
    !KeywordArgument<T> &&
    (std::is_function_v<std::remove_pointer_t<std::decay_t<T>>> ||
     std::is_member_pointer_v<std::decay_t<T>> ||
     detail::HasCallOperator<std::decay_t<T>> ||
     detail::TaggedCallable<std::decay_t<T>> ||
     is_callable_target<std::decay_t<T>>::value);

/*!
 * \brief Collect every keyword argument of a pack into one Kwargs.
 * \throws error::InvalidArgument if a name repeats
 */
template <typename... Args>
auto collectKwargs(const Args&... args) -> Kwargs {
    Kwargs result;
    auto collect = [&result](const auto& arg) {
        using Arg = std::remove_cvref_t<decltype(arg)>;
        if constexpr (std::same_as<Arg, Keyword>) {
            result.add(arg);
        } else if constexpr (std::same_as<Arg, Kwargs>) {
            result.addAll(arg);
        }
    };
    (collect(args), ...);
    return result;
}

/*!
 * \brief Copies of the positional (non-keyword) arguments of a pack.
 */
template <typename... Args>
auto collectPositional(Args&&... args) {
    auto pick = []<typename Arg>(Arg&& arg) {
        if constexpr (KeywordArgument<Arg>) {
            return std::tuple<>();
        } else {
            return std::tuple<std::decay_t<Arg>>(std::forward<Arg>(arg));
        }
    };
    return std::tuple_cat(pick(std::forward<Args>(args))...);
}

/*!
 * \brief References to the positional arguments of a pack, keeping each
 * argument's value category.
 */
template <typename... Args>
auto forwardPositional(Args&&... args) {
    auto pick = []<typename Arg>(Arg&& arg) {
        if constexpr (KeywordArgument<Arg>) {
            return std::tuple<>();
        } else {
            return std::tuple<Arg&&>(std::forward<Arg>(arg));
        }
    };
    return std::tuple_cat(pick(std::forward<Args>(args))...);
}

}  // namespace deco::meta

#endif  // DECO_META_KWARGS_HPP
