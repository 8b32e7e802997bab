#ifndef DECO_TYPE_EXPECTED_HPP
#define DECO_TYPE_EXPECTED_HPP

#include <concepts>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace deco::type {

/**
 * @brief Tag selecting the error alternative of an expected, so that a value
 * type and an error type may coincide.
 */
struct unexpect_t {
    explicit unexpect_t() = default;
};

inline constexpr unexpect_t unexpect{};

/**
 * @brief An `unexpected` class template similar to `std::unexpected`.
 *
 * This class represents an unexpected error value that can be used to construct
 * an expected object in an error state.
 *
 * @tparam E The type of the error value
 */
template <typename E>
class unexpected {
public:
    template <typename U = E>
        requires std::constructible_from<E, U>
    constexpr explicit unexpected(U&& error) noexcept(
        std::is_nothrow_constructible_v<E, U>)
        : error_(std::forward<U>(error)) {}

    [[nodiscard]] constexpr const E& error() const& noexcept { return error_; }

    [[nodiscard]] constexpr E&& error() && noexcept {
        return std::move(error_);
    }

private:
    E error_;
};

/// Deduction guide for unexpected
template <typename E>
unexpected(E) -> unexpected<E>;

/**
 * @brief A class template representing a value that may be either a valid value
 * or an error.
 *
 * This is similar to std::expected (C++23), with the monadic operations
 * needed by the library.
 *
 * @tparam T The type of the expected value
 * @tparam E The type of the error
 */
template <typename T, typename E>
class expected {
private:
    std::variant<T, E> value_;

public:
    using value_type = T;
    using error_type = E;
    using unexpected_type = unexpected<E>;

    constexpr expected() noexcept(std::is_nothrow_default_constructible_v<T>)
        requires std::is_default_constructible_v<T>
        : value_(std::in_place_index<0>) {}

    /**
     * @brief Constructs an expected with a value.
     *
     * @tparam U The type of the value to construct from
     * @param value The value to store
     */
    template <typename U = T>
        requires std::constructible_from<T, U> &&
                 (!std::same_as<std::remove_cvref_t<U>, expected>) &&
                 (!std::same_as<std::remove_cvref_t<U>, unexpected<E>>) &&
                 (!std::same_as<std::remove_cvref_t<U>, std::in_place_t>) &&
                 (!std::same_as<std::remove_cvref_t<U>, unexpect_t>)
    constexpr expected(U&& value) noexcept(
        std::is_nothrow_constructible_v<T, U>)
        : value_(std::in_place_index<0>, std::forward<U>(value)) {}

    template <typename... Args>
        requires std::constructible_from<T, Args...>
    constexpr explicit expected(std::in_place_t, Args&&... args)
        : value_(std::in_place_index<0>, std::forward<Args>(args)...) {}

    template <typename... Args>
        requires std::constructible_from<E, Args...>
    constexpr explicit expected(unexpect_t, Args&&... args)
        : value_(std::in_place_index<1>, std::forward<Args>(args)...) {}

    template <typename U>
        requires std::constructible_from<E, const U&>
    constexpr expected(const unexpected<U>& unex)
        : value_(std::in_place_index<1>, unex.error()) {}

    template <typename U>
        requires std::constructible_from<E, U>
    constexpr expected(unexpected<U>&& unex)
        : value_(std::in_place_index<1>, std::move(unex).error()) {}

    /**
     * @brief Checks if the expected contains a value (not an error).
     */
    [[nodiscard]] constexpr bool has_value() const noexcept {
        return value_.index() == 0;
    }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    /**
     * @brief Gets the stored value with bounds checking.
     *
     * @throws std::logic_error if the expected contains an error
     */
    [[nodiscard]] constexpr T& value() & {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
        return std::get<0>(value_);
    }

    [[nodiscard]] constexpr const T& value() const& {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
        return std::get<0>(value_);
    }

    [[nodiscard]] constexpr T&& value() && {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
        return std::get<0>(std::move(value_));
    }

    /**
     * @brief Gets the stored value or a default value if an error is present.
     */
    template <typename U>
    [[nodiscard]] constexpr T value_or(U&& default_value) const& {
        return has_value() ? std::get<0>(value_)
                           : static_cast<T>(std::forward<U>(default_value));
    }

    template <typename U>
    [[nodiscard]] constexpr T value_or(U&& default_value) && {
        return has_value() ? std::get<0>(std::move(value_))
                           : static_cast<T>(std::forward<U>(default_value));
    }

    /**
     * @note No checking is performed. Use only when you know the expected
     * contains a value.
     */
    [[nodiscard]] constexpr T& operator*() & noexcept {
        return std::get<0>(value_);
    }

    [[nodiscard]] constexpr const T& operator*() const& noexcept {
        return std::get<0>(value_);
    }

    [[nodiscard]] constexpr T* operator->() noexcept {
        return &std::get<0>(value_);
    }

    [[nodiscard]] constexpr const T* operator->() const noexcept {
        return &std::get<0>(value_);
    }

    /**
     * @brief Gets the stored error with bounds checking.
     *
     * @throws std::logic_error if the expected contains a value
     */
    [[nodiscard]] constexpr const E& error() const& {
        if (has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access error, but it contains a value.");
        }
        return std::get<1>(value_);
    }

    [[nodiscard]] constexpr E&& error() && {
        if (has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access error, but it contains a value.");
        }
        return std::get<1>(std::move(value_));
    }

    /**
     * @brief Monadic bind: chains a computation returning another expected.
     */
    template <typename Func>
    constexpr auto and_then(Func&& func) const& {
        using Result = std::invoke_result_t<Func, const T&>;
        if (has_value()) {
            return std::invoke(std::forward<Func>(func), std::get<0>(value_));
        }
        return Result(unexpect, std::get<1>(value_));
    }

    /**
     * @brief Transforms the value if present, keeping the error otherwise.
     */
    template <typename Func>
    constexpr auto map(Func&& func) const& {
        using Mapped = std::invoke_result_t<Func, const T&>;
        if (has_value()) {
            if constexpr (std::is_void_v<Mapped>) {
                std::invoke(std::forward<Func>(func), std::get<0>(value_));
                return expected<void, E>();
            } else {
                return expected<Mapped, E>(
                    std::in_place,
                    std::invoke(std::forward<Func>(func), std::get<0>(value_)));
            }
        }
        return expected<Mapped, E>(unexpect, std::get<1>(value_));
    }

    /**
     * @brief Invokes func with the error if present; passes a value through.
     */
    template <typename Func>
        requires std::invocable<Func, const E&>
    constexpr auto or_else(Func&& func) const& -> expected {
        if (has_value()) {
            return *this;
        }
        return std::invoke(std::forward<Func>(func), std::get<1>(value_));
    }
};

/**
 * @brief Specialization of expected for void type.
 *
 * Represents success with no value, or an error.
 *
 * @tparam E The type of the error
 */
template <typename E>
class expected<void, E> {
private:
    std::variant<std::monostate, E> value_;

public:
    using value_type = void;
    using error_type = E;
    using unexpected_type = unexpected<E>;

    constexpr expected() noexcept : value_(std::monostate{}) {}

    template <typename... Args>
        requires std::constructible_from<E, Args...>
    constexpr explicit expected(unexpect_t, Args&&... args)
        : value_(std::in_place_index<1>, std::forward<Args>(args)...) {}

    template <typename U>
        requires std::constructible_from<E, const U&>
    constexpr expected(const unexpected<U>& unex)
        : value_(std::in_place_index<1>, unex.error()) {}

    template <typename U>
        requires std::constructible_from<E, U>
    constexpr expected(unexpected<U>&& unex)
        : value_(std::in_place_index<1>, std::move(unex).error()) {}

    [[nodiscard]] constexpr bool has_value() const noexcept {
        return value_.index() == 0;
    }

    constexpr explicit operator bool() const noexcept { return has_value(); }

    /**
     * @brief Validates that the expected contains a success state.
     *
     * @throws std::logic_error if the expected contains an error
     */
    constexpr void value() const {
        if (!has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access value, but it contains an error.");
        }
    }

    [[nodiscard]] constexpr const E& error() const& {
        if (has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access error, but it contains a value.");
        }
        return std::get<1>(value_);
    }

    [[nodiscard]] constexpr E&& error() && {
        if (has_value()) [[unlikely]] {
            throw std::logic_error(
                "Attempted to access error, but it contains a value.");
        }
        return std::get<1>(std::move(value_));
    }

    template <typename Func>
        requires std::invocable<Func, const E&>
    constexpr auto or_else(Func&& func) const& -> expected {
        if (has_value()) {
            return *this;
        }
        return std::invoke(std::forward<Func>(func), std::get<1>(value_));
    }
};

/**
 * @brief Creates an unexpected error object.
 */
template <typename E>
constexpr auto make_unexpected(E&& error) -> unexpected<std::decay_t<E>> {
    return unexpected<std::decay_t<E>>(std::forward<E>(error));
}

}  // namespace deco::type

#endif  // DECO_TYPE_EXPECTED_HPP
