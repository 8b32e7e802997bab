/*
 * exception.hpp
 *
 * Copyright (C) The deco authors
 */

/*************************************************

Description: Exception hierarchy carrying source location and stack trace

**************************************************/

#ifndef DECO_ERROR_EXCEPTION_HPP
#define DECO_ERROR_EXCEPTION_HPP

#include <exception>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "deco/error/stacktrace.hpp"
#include "deco/macro.hpp"

namespace deco::error {

/**
 * @brief Base exception of the library.
 *
 * Records where it was thrown (file, line, function), the throwing thread and
 * the stack at construction. The message is a fmt-style format string with
 * its arguments.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              std::string_view format, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          message_(formatMessage(format, std::forward<Args>(args)...)),
          thread_id_(std::this_thread::get_id()),
          stack_trace_(1) {}

    /**
     * @brief Full report: location, thread, message and stack trace.
     */
    [[nodiscard]] auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;
    [[nodiscard]] auto getStackTrace() const -> const StackTrace&;

private:
    template <typename... Args>
    static auto formatMessage(std::string_view format, Args&&... args)
        -> std::string {
        if constexpr (sizeof...(Args) == 0) {
            return std::string(format);
        } else {
            return fmt::format(fmt::runtime(format),
                               std::forward<Args>(args)...);
        }
    }

    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
    StackTrace stack_trace_;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

}  // namespace deco::error

#define THROW_EXCEPTION(...)                                            \
    throw deco::error::Exception(DECO_FILE_NAME, DECO_FILE_LINE,        \
                                 DECO_FUNC_NAME, __VA_ARGS__)

#define THROW_RUNTIME_ERROR(...)                                        \
    throw deco::error::RuntimeError(DECO_FILE_NAME, DECO_FILE_LINE,     \
                                    DECO_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                     \
    throw deco::error::InvalidArgument(DECO_FILE_NAME, DECO_FILE_LINE,  \
                                       DECO_FUNC_NAME, __VA_ARGS__)

#endif  // DECO_ERROR_EXCEPTION_HPP
