/*
 * stacktrace.hpp
 *
 * Copyright (C) The deco authors
 */

/*************************************************

Description: Call stack capture used by exception reports

**************************************************/

#ifndef DECO_ERROR_STACKTRACE_HPP
#define DECO_ERROR_STACKTRACE_HPP

#include <cstddef>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

namespace deco::error {

/**
 * @brief Captures the call stack of the constructing thread.
 *
 * Frames are resolved lazily: construction only records return addresses,
 * symbol lookup and demangling happen in toString().
 */
class StackTrace {
public:
    /**
     * @brief Captures the current stack trace.
     * @param skip Number of innermost frames to drop in addition to the
     * constructor's own frame.
     */
    explicit StackTrace(std::size_t skip = 0);

    /**
     * @brief Renders the captured frames, one per line, innermost first.
     */
    [[nodiscard]] auto toString() const -> std::string;

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return frames_.size();
    }

    [[nodiscard]] auto empty() const noexcept -> bool {
        return frames_.empty();
    }

private:
    void capture(std::size_t skip);

    [[nodiscard]] auto processFrame(std::size_t frameIndex) const
        -> std::string;

    std::vector<void*> frames_;
#if defined(__APPLE__) || defined(__linux__)
    std::shared_ptr<char*> symbols_;
#endif
};

}  // namespace deco::error

#endif  // DECO_ERROR_STACKTRACE_HPP
