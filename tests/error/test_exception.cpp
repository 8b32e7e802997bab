#include <gtest/gtest.h>
#include "deco/error/exception.hpp"

#include <string>
#include <thread>

namespace {

class ExceptionTest : public ::testing::Test {};

void throwRuntime(int code) {
    THROW_RUNTIME_ERROR("operation failed with code {}", code);
}

TEST_F(ExceptionTest, FormatsMessageArguments) {
    try {
        throwRuntime(42);
        FAIL() << "expected RuntimeError";
    } catch (const deco::error::RuntimeError& e) {
        EXPECT_EQ(e.getMessage(), "operation failed with code 42");
    }
}

TEST_F(ExceptionTest, MessageWithoutArgumentsIsKeptVerbatim) {
    deco::error::Exception e(DECO_FILE_NAME, DECO_FILE_LINE, DECO_FUNC_NAME,
                             "braces {} stay");
    EXPECT_EQ(e.getMessage(), "braces {} stay");
}

TEST_F(ExceptionTest, RecordsThrowSite) {
    try {
        THROW_INVALID_ARGUMENT("bad value {}", "x");
    } catch (const deco::error::InvalidArgument& e) {
        EXPECT_NE(e.getFile().find("test_exception.cpp"), std::string::npos);
        EXPECT_GT(e.getLine(), 0);
        EXPECT_FALSE(e.getFunction().empty());
        EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
        return;
    }
    FAIL() << "expected InvalidArgument";
}

TEST_F(ExceptionTest, WhatContainsLocationAndMessage) {
    try {
        THROW_EXCEPTION("something {} happened", "odd");
    } catch (const deco::error::Exception& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("something odd happened"), std::string::npos);
        EXPECT_NE(what.find("test_exception.cpp"), std::string::npos);
        return;
    }
    FAIL() << "expected Exception";
}

TEST_F(ExceptionTest, DerivedTypesAreStdExceptions) {
    EXPECT_THROW(throwRuntime(1), deco::error::Exception);
    EXPECT_THROW(throwRuntime(1), std::exception);
}

}  // namespace
