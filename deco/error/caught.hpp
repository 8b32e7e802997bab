/*
 * caught.hpp
 *
 * Copyright (C) The deco authors
 */

/*************************************************

Description: Record of an exception intercepted by a guard

**************************************************/

#ifndef DECO_ERROR_CAUGHT_HPP
#define DECO_ERROR_CAUGHT_HPP

#include <exception>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "deco/error/stacktrace.hpp"
#include "deco/meta/abi.hpp"

namespace deco::error {

/**
 * @brief An intercepted exception together with what is needed to report
 * it after the catch block has ended.
 *
 * Keeps the original exception object alive through its exception_ptr.
 */
class CaughtError {
public:
    CaughtError(std::exception_ptr exception, std::string typeName,
                std::string message, StackTrace catchSite)
        : exception_(std::move(exception)),
          typeName_(std::move(typeName)),
          message_(std::move(message)),
          catchSite_(std::make_shared<const StackTrace>(std::move(catchSite))) {
    }

    /**
     * @brief Build a record for the exception currently being handled.
     *
     * Must be called from inside the catch clause that caught @p caught.
     */
    template <typename E>
    static auto fromCurrent(const E& caught) -> CaughtError {
        std::string typeName;
        if constexpr (std::is_polymorphic_v<E>) {
            typeName = meta::DemangleHelper::demangleType(caught);
        } else {
            typeName = meta::DemangleHelper::demangleType<E>();
        }

        std::string message;
        if constexpr (std::is_base_of_v<std::exception, E>) {
            message = caught.what();
        }

        return CaughtError(std::current_exception(), std::move(typeName),
                           std::move(message), StackTrace(1));
    }

    [[nodiscard]] auto exception() const noexcept -> const std::exception_ptr& {
        return exception_;
    }

    /**
     * @brief Demangled dynamic type of the exception object.
     */
    [[nodiscard]] auto typeName() const noexcept -> const std::string& {
        return typeName_;
    }

    /**
     * @brief what() of the exception, empty for non-std exceptions.
     */
    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return message_;
    }

    /**
     * @brief Stack of the thread at the point the exception was caught.
     */
    [[nodiscard]] auto catchSite() const noexcept -> const StackTrace& {
        return *catchSite_;
    }

    /**
     * @brief The original exception object if it is an @p E, else nullptr.
     */
    template <typename E>
    [[nodiscard]] auto get() const -> const E* {
        if (!exception_) {
            return nullptr;
        }
        try {
            std::rethrow_exception(exception_);
        } catch (const E& e) {
            return &e;
        } catch (...) {
            // Not an E; the record keeps the exception.
            return nullptr;
        }
    }

    template <typename E>
    [[nodiscard]] auto is() const -> bool {
        return get<E>() != nullptr;
    }

    [[noreturn]] void rethrow() const { std::rethrow_exception(exception_); }

    /**
     * @brief "<type>: <message>" followed by the catch-site stack trace.
     */
    [[nodiscard]] auto toString() const -> std::string {
        std::string out = typeName_;
        if (!message_.empty()) {
            out += ": ";
            out += message_;
        }
        out += "\n";
        out += catchSite_->toString();
        return out;
    }

private:
    std::exception_ptr exception_;
    std::string typeName_;
    std::string message_;
    std::shared_ptr<const StackTrace> catchSite_;
};

}  // namespace deco::error

#endif  // DECO_ERROR_CAUGHT_HPP
