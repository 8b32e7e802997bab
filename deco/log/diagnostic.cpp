/*
 * diagnostic.cpp
 *
 * Copyright (C) The deco authors
 */

/*************************************************

Description: Side channel receiving exception and timing reports from the
wrappers, with an spdlog-backed default

**************************************************/

#include "diagnostic.hpp"

#include <mutex>
#include <utility>

#include <spdlog/cfg/env.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "deco/error/exception.hpp"

namespace deco::log {

namespace {

// Reuse a logger the application registered under this name, otherwise
// create one.
auto registryLogger(std::string_view name, bool toStderr)
    -> std::shared_ptr<spdlog::logger> {
    static std::mutex creationMutex;
    std::lock_guard lock(creationMutex);

    std::string key(name);
    if (auto existing = spdlog::get(key)) {
        return existing;
    }
    if (toStderr) {
        return spdlog::stderr_color_mt(key);
    }
    return spdlog::stdout_color_mt(key);
}

// Python-style float rendering: always show a fractional part.
auto formatSeconds(double seconds) -> std::string {
    std::string text = fmt::format("{}", seconds);
    if (text.find_first_of(".eEn") == std::string::npos) {
        text += ".0";
    }
    return text;
}

}  // namespace

SpdlogDiagnosticSink::SpdlogDiagnosticSink(
    std::shared_ptr<spdlog::logger> traceLogger,
    std::shared_ptr<spdlog::logger> timingLogger)
    : traceLogger_(std::move(traceLogger)),
      timingLogger_(std::move(timingLogger)) {
    if (!traceLogger_ || !timingLogger_) {
        THROW_INVALID_ARGUMENT("SpdlogDiagnosticSink requires two loggers");
    }
}

auto SpdlogDiagnosticSink::create() -> std::shared_ptr<SpdlogDiagnosticSink> {
    return std::make_shared<SpdlogDiagnosticSink>(
        registryLogger(TRACE_LOGGER_NAME, true),
        registryLogger(TIMING_LOGGER_NAME, false));
}

void SpdlogDiagnosticSink::reportException(std::string_view target,
                                           const error::CaughtError& error) {
    traceLogger_->error("{}", formatException(target, error));
}

void SpdlogDiagnosticSink::reportTiming(std::string_view target,
                                        double seconds) {
    timingLogger_->info("{}", formatTiming(target, seconds));
}

auto defaultSink() -> std::shared_ptr<DiagnosticSink> {
    static const std::shared_ptr<DiagnosticSink> instance =
        SpdlogDiagnosticSink::create();
    return instance;
}

auto formatTiming(std::string_view target, double seconds) -> std::string {
    return fmt::format("{} executed in {} seconds", target,
                       formatSeconds(seconds));
}

auto formatException(std::string_view target, const error::CaughtError& error)
    -> std::string {
    return fmt::format("Exception caught in {}:\n{}", target,
                       error.toString());
}

void configureFromEnv() { spdlog::cfg::load_env_levels(); }

}  // namespace deco::log
