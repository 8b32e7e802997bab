/*
 * diagnostic.hpp
 *
 * Copyright (C) The deco authors
 */

/*************************************************

Description: Side channel receiving exception and timing reports from the
wrappers, with an spdlog-backed default

**************************************************/

#ifndef DECO_LOG_DIAGNOSTIC_HPP
#define DECO_LOG_DIAGNOSTIC_HPP

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "deco/error/caught.hpp"

namespace deco::log {

/// Logger receiving intercepted exceptions (stderr by default).
inline constexpr std::string_view TRACE_LOGGER_NAME = "deco.trace";
/// Logger receiving timing reports (stdout by default).
inline constexpr std::string_view TIMING_LOGGER_NAME = "deco.timing";

/**
 * @brief Destination of the reports wrappers emit when no handler takes
 * them.
 *
 * Implementations must be safe to call from several threads at once.
 */
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;

    /**
     * @brief An exception was intercepted while calling @p target.
     */
    virtual void reportException(std::string_view target,
                                 const error::CaughtError& error) = 0;

    /**
     * @brief A call to @p target took @p seconds.
     */
    virtual void reportTiming(std::string_view target, double seconds) = 0;
};

/**
 * @brief Writes reports through two spdlog loggers.
 */
class SpdlogDiagnosticSink : public DiagnosticSink {
public:
    SpdlogDiagnosticSink(std::shared_ptr<spdlog::logger> traceLogger,
                         std::shared_ptr<spdlog::logger> timingLogger);

    /**
     * @brief Sink over the registry loggers "deco.trace" and "deco.timing",
     * creating them (stderr and stdout color sinks) when the application
     * has not registered loggers of those names.
     */
    static auto create() -> std::shared_ptr<SpdlogDiagnosticSink>;

    void reportException(std::string_view target,
                         const error::CaughtError& error) override;

    void reportTiming(std::string_view target, double seconds) override;

private:
    std::shared_ptr<spdlog::logger> traceLogger_;
    std::shared_ptr<spdlog::logger> timingLogger_;
};

/**
 * @brief The process-wide default sink, created on first use.
 */
auto defaultSink() -> std::shared_ptr<DiagnosticSink>;

/**
 * @brief "<target> executed in <seconds> seconds"
 */
auto formatTiming(std::string_view target, double seconds) -> std::string;

/**
 * @brief Full report for an intercepted exception: where it was caught,
 * its type and message, and the catch-site stack trace.
 */
auto formatException(std::string_view target, const error::CaughtError& error)
    -> std::string;

/**
 * @brief Apply log levels from the SPDLOG_LEVEL environment variable, e.g.
 * SPDLOG_LEVEL=deco.timing=off to silence timing reports.
 */
void configureFromEnv();

}  // namespace deco::log

#endif  // DECO_LOG_DIAGNOSTIC_HPP
