/**
 * Examples for the deco call-wrapper combinators
 *
 * This file demonstrates:
 * 1. Sequential repeat
 * 2. Concurrent repeat on a thread pool
 * 3. Guarding against exceptions
 * 4. Timing calls
 * 5. Building custom decorators with positional and keyword arguments
 * 6. Composition
 */

#include "deco/deco.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

using namespace deco;
using namespace std::chrono_literals;

// Helper function to print section headers
void printHeader(const std::string& title) {
    std::cout << "\n==========================================================="
              << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << "==========================================================="
              << std::endl;
}

//=============================================================================
// Example functions to decorate
//=============================================================================

int square(int value) { return value * value; }

// Fails for negative input, and for large input in a different way.
double checkedSqrt(double value) {
    if (value < 0) {
        throw std::invalid_argument("checkedSqrt of a negative number");
    }
    if (value > 1e6) {
        throw std::out_of_range("checkedSqrt input too large");
    }
    double guess = value / 2 + 1;
    for (int i = 0; i < 20; ++i) {
        guess = (guess + value / guess) / 2;
    }
    return guess;
}

// Sleeps for a random short while and returns how long it slept.
int jitteryWork(int base) {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dist(0, 30);
    int sleptMs = dist(gen);
    std::this_thread::sleep_for(std::chrono::milliseconds(sleptMs));
    return base + sleptMs;
}

//=============================================================================
// 1. Sequential repeat
//=============================================================================

void repeatExample() {
    printHeader("1. Sequential repeat");

    int calls = 0;
    auto counted = wrap::repeat(3)([&calls](int x) {
        ++calls;
        return square(x);
    });
    std::cout << "repeat(3)(square)(7) = " << counted(7) << " after " << calls
              << " calls" << std::endl;

    auto same = wrap::repeat<1>(square);
    std::cout << "repeat<1>(square) is square itself: " << std::boolalpha
              << (same == &square) << std::endl;

    try {
        (void)wrap::repeat(0);
    } catch (const error::InvalidArgument& e) {
        std::cout << "repeat(0) rejected: " << e.getMessage() << std::endl;
    }
}

//=============================================================================
// 2. Concurrent repeat
//=============================================================================

void threadedRepeatExample() {
    printHeader("2. Concurrent repeat");

    auto pool = std::make_shared<async::ThreadPool>(
        async::ThreadPool::Options::createFixed(4));

    std::atomic<int> calls{0};
    auto raced = wrap::threadedRepeat(4, pool)([&calls](int base) {
        ++calls;
        return jitteryWork(base);
    });

    int last = raced(100);
    std::cout << "Value of the call that finished last: " << last << " ("
              << calls.load() << " calls ran)" << std::endl;

    auto failing = wrap::threadedRepeat(3, pool)(
        []() -> int { throw std::runtime_error("every attempt fails"); });
    try {
        (void)failing();
    } catch (const std::runtime_error& e) {
        std::cout << "All attempts ran, then: " << e.what() << std::endl;
    }
}

//=============================================================================
// 3. Guard
//=============================================================================

void guardExample() {
    printHeader("3. Guard");

    auto safeSqrt = wrap::guard<std::invalid_argument>(
        {.handler = [](const error::CaughtError& caught) {
            std::cout << "Handled " << caught.typeName() << ": "
                      << caught.message() << std::endl;
        }})(checkedSqrt);

    auto good = safeSqrt(16.0);
    std::cout << "safeSqrt(16) = " << good.value() << std::endl;

    auto bad = safeSqrt(-4.0);
    std::cout << "safeSqrt(-4) has a value: " << std::boolalpha
              << bad.has_value() << std::endl;

    try {
        (void)safeSqrt(1e9);
    } catch (const std::out_of_range& e) {
        std::cout << "Not guarded, propagated: " << e.what() << std::endl;
    }

    // The bare form reports the full trace to the "deco.trace" logger.
    auto logged = wrap::guard(DECO_NAMED(checkedSqrt));
    (void)logged(-1.0);

    auto quiet = wrap::guard({.silent = true})(checkedSqrt);
    std::cout << "Silent guard value or default: "
              << quiet(-9.0).value_or(0.0) << std::endl;
}

//=============================================================================
// 4. Timing
//=============================================================================

void timingExample() {
    printHeader("4. Timing");

    // Reports "jitteryWork executed in ... seconds" to "deco.timing".
    auto timed = wrap::timeit(DECO_NAMED(jitteryWork));
    (void)timed(1);

    auto measured = wrap::timeit(
        {.name = "sleep",
         .handler = [](std::string_view name, double seconds) {
             std::cout << "Handler: " << name << " took " << seconds * 1000
                       << " ms" << std::endl;
         }})([] { std::this_thread::sleep_for(15ms); });
    measured();
}

//=============================================================================
// 5. Custom decorators
//=============================================================================

void customDecoratorExample() {
    printHeader("5. Custom decorators");

    // impl(target, positional..., kwargs)
    auto clamp = wrap::decorator([](const auto& target, int value,
                                    const meta::Kwargs& kwargs) {
        int low = kwargs.getOr("low", 0);
        int high = kwargs.getOr("high", 100);
        int result = target(value);
        return result < low ? low : (result > high ? high : result);
    });

    auto clampedSquare = clamp(square);
    std::cout << "clamp(square)(20) = " << clampedSquare(20) << std::endl;
    std::cout << "clamp(square)(20, high=1000) = "
              << clampedSquare(20, meta::kw("high", 1000)) << std::endl;

    auto tight = clamp(meta::kw("low", 10), meta::kw("high", 50))(square);
    std::cout << "clamp(low=10, high=50)(square)(2) = " << tight(2)
              << std::endl;

    auto prefixed = wrap::decorator(
        [](const auto& target, const std::string& label, int value) {
            return label + std::to_string(target(value));
        });
    auto labelled = prefixed(std::string("square = "))(square);
    std::cout << labelled(9) << std::endl;
}

//=============================================================================
// 6. Composition
//=============================================================================

void compositionExample() {
    printHeader("6. Composition");

    auto pipeline = wrap::timeit({.name = "guarded repeat"})(
        wrap::guard({.silent = true})(wrap::repeat(2)(checkedSqrt)));

    auto ok = pipeline(81.0);
    std::cout << "pipeline(81) = " << ok.value() << std::endl;
    std::cout << "pipeline(-1) has a value: " << std::boolalpha
              << pipeline(-1.0).has_value() << std::endl;
}

int main() {
    log::configureFromEnv();

    repeatExample();
    threadedRepeatExample();
    guardExample();
    timingExample();
    customDecoratorExample();
    compositionExample();

    return 0;
}
