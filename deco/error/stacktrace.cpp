/*
 * stacktrace.cpp
 *
 * Copyright (C) The deco authors
 */

/*************************************************

Description: Call stack capture used by exception reports

**************************************************/

#include "stacktrace.hpp"

#include <cstdint>
#include <iomanip>
#include <regex>
#include <sstream>
#include <utility>

#include "deco/meta/abi.hpp"

#if defined(__APPLE__) || defined(__linux__)
#include <dlfcn.h>
#include <execinfo.h>
#endif

namespace deco::error {

namespace {

#if defined(__linux__) || defined(__APPLE__)
// backtrace_symbols() gives "module(_Z...+0x1f) [0x...]"; demangle the
// symbol part in place.
auto processString(const std::string& input) -> std::string {
    size_t startIndex = input.find("_Z");
    if (startIndex == std::string::npos) {
        return input;
    }

    size_t endIndex = input.find('+', startIndex);
    if (endIndex == std::string::npos) {
        return input;
    }

    std::string abiName = input.substr(startIndex, endIndex - startIndex);
    abiName = meta::DemangleHelper::demangle(abiName);

    std::string result = input;
    result.replace(startIndex, endIndex - startIndex, abiName);
    return result;
}
#endif

auto prettifyStacktrace(const std::string& input) -> std::string {
    static const std::vector<std::pair<std::regex, std::string>> REPLACEMENTS =
        {{std::regex("std::__1::"), "std::"},
         {std::regex("std::__cxx11::"), "std::"},
         {std::regex(", std::allocator<[^<>]+>"), ""}};

    std::string output = input;
    for (const auto& [from, to] : REPLACEMENTS) {
        output = std::regex_replace(output, from, to);
    }
    return output;
}

auto formatAddress(std::uintptr_t address) -> std::string {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0')
        << std::setw(sizeof(void*) * 2) << address;
    return oss.str();
}

auto getBaseName(const std::string& path) -> std::string {
    size_t lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        return path.substr(lastSlash + 1);
    }
    return path;
}

}  // namespace

StackTrace::StackTrace(std::size_t skip) { capture(skip); }

auto StackTrace::toString() const -> std::string {
    std::ostringstream oss;
    oss << "Stack trace:\n";

    if (frames_.empty()) {
        oss << "\tStack trace not available on this platform.\n";
        return oss.str();
    }

    for (std::size_t i = 0; i < frames_.size(); ++i) {
        oss << "\t[" << i << "] " << processFrame(i) << "\n";
    }

    return prettifyStacktrace(oss.str());
}

#if defined(__APPLE__) || defined(__linux__)
auto StackTrace::processFrame(std::size_t frameIndex) const -> std::string {
    void* frame = frames_[frameIndex];
    auto address = reinterpret_cast<std::uintptr_t>(frame);

    Dl_info dlInfo;
    std::string functionName = "<unknown function>";
    std::string moduleName;
    std::uintptr_t offset = 0;

    if (dladdr(frame, &dlInfo) != 0) {
        if (dlInfo.dli_fname != nullptr) {
            moduleName = dlInfo.dli_fname;
        }
        if (dlInfo.dli_fbase != nullptr) {
            offset =
                address - reinterpret_cast<std::uintptr_t>(dlInfo.dli_fbase);
        }
        if (dlInfo.dli_sname != nullptr) {
            functionName = meta::DemangleHelper::demangle(dlInfo.dli_sname);
        }
    }

    if (functionName == "<unknown function>" && symbols_) {
        functionName = processString(symbols_.get()[frameIndex]);
    }

    std::ostringstream oss;
    oss << functionName << " at " << formatAddress(address);
    if (!moduleName.empty()) {
        oss << " in " << getBaseName(moduleName);
        if (offset > 0) {
            oss << " (+" << std::hex << offset << ")";
        }
    }
    return oss.str();
}

void StackTrace::capture(std::size_t skip) {
    constexpr int MAX_FRAMES = 128;
    void* framePtrs[MAX_FRAMES];
    int captured = backtrace(framePtrs, MAX_FRAMES);

    // Drop capture() and the constructor.
    std::size_t first = skip + 2;
    if (captured <= 0 || static_cast<std::size_t>(captured) <= first) {
        frames_.clear();
        symbols_.reset();
        return;
    }

    frames_.assign(framePtrs + first, framePtrs + captured);
    symbols_.reset(
        backtrace_symbols(frames_.data(), static_cast<int>(frames_.size())),
        [](char** ptr) { std::free(ptr); });
}

#else
auto StackTrace::processFrame(std::size_t frameIndex) const -> std::string {
    return "<frame information unavailable> at " +
           formatAddress(reinterpret_cast<std::uintptr_t>(frames_[frameIndex]));
}

void StackTrace::capture(std::size_t /*skip*/) { frames_.clear(); }
#endif

}  // namespace deco::error
