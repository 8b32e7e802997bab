/*
 * exception.cpp
 *
 * Copyright (C) The deco authors
 */

/*************************************************

Description: Exception hierarchy carrying source location and stack trace

**************************************************/

#include "exception.hpp"

#include <sstream>

namespace deco::error {

auto Exception::what() const noexcept -> const char* {
    if (full_message_.empty()) {
        try {
            std::ostringstream oss;
            oss << "Exception occurred:\n";
            oss << "  File: " << file_ << "\n";
            oss << "  Line: " << line_ << "\n";
            oss << "  Function: " << func_ << "()\n";
            oss << "  Thread ID: " << thread_id_ << "\n";
            oss << "  Message: " << message_ << "\n";
            oss << "  " << stack_trace_.toString();
            full_message_ = oss.str();
        } catch (const std::exception&) {
            // Rendering the trace failed; the plain message still helps.
            return message_.c_str();
        }
    }
    return full_message_.c_str();
}

auto Exception::getFile() const -> std::string { return file_; }
auto Exception::getLine() const -> int { return line_; }
auto Exception::getFunction() const -> std::string { return func_; }
auto Exception::getMessage() const -> std::string { return message_; }
auto Exception::getThreadId() const -> std::thread::id { return thread_id_; }
auto Exception::getStackTrace() const -> const StackTrace& {
    return stack_trace_;
}

}  // namespace deco::error
