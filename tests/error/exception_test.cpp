#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>

#include "strata/error/exception.hpp"
#include "strata/error/stacktrace.hpp"

namespace strata::error::test {

class ExceptionTest : public ::testing::Test {};

TEST_F(ExceptionTest, MessageIsStreamedFromArguments) {
    const Exception e("file.cpp", 12, "func", "value ", 42, ' ', 1.5);
    EXPECT_EQ(e.getMessage(), "value 42 1.5");
    EXPECT_EQ(e.getFile(), "file.cpp");
    EXPECT_EQ(e.getLine(), 12);
    EXPECT_EQ(e.getFunction(), "func");
    EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
}

TEST_F(ExceptionTest, MessageMayBeEmpty) {
    const RuntimeError e("file.cpp", 3, "func");
    EXPECT_TRUE(e.getMessage().empty());
    EXPECT_EQ(e.getLine(), 3);
}

TEST_F(ExceptionTest, WhatContainsReport) {
    const Exception e("file.cpp", 7, "func", "broken");
    const std::string report = e.what();
    EXPECT_THAT(report, ::testing::HasSubstr("File: file.cpp"));
    EXPECT_THAT(report, ::testing::HasSubstr("Line: 7"));
    EXPECT_THAT(report, ::testing::HasSubstr("Function: func()"));
    EXPECT_THAT(report, ::testing::HasSubstr("Message: broken"));
    EXPECT_THAT(report, ::testing::HasSubstr("Stack trace:"));
    // The report is cached.
    EXPECT_EQ(e.what(), e.what());
}

TEST_F(ExceptionTest, MacrosRecordThrowSite) {
    try {
        THROW_INVALID_ARGUMENT("bad ", "argument");
    } catch (const InvalidArgument& e) {
        EXPECT_EQ(e.getMessage(), "bad argument");
        EXPECT_EQ(e.getFile(), __FILE__);
        EXPECT_EQ(e.getFunction(), "TestBody");
        EXPECT_GT(e.getLine(), 0);
    }
}

TEST_F(ExceptionTest, SubclassesAreExceptions) {
    EXPECT_THROW(THROW_RUNTIME_ERROR("r"), RuntimeError);
    EXPECT_THROW(THROW_LOGIC_ERROR("l"), Exception);
    EXPECT_THROW(THROW_OUT_OF_RANGE("o"), std::exception);
    EXPECT_THROW(THROW_EXCEPTION("e"), Exception);
}

TEST_F(ExceptionTest, NestedExceptionKeepsCause) {
    try {
        try {
            throw std::runtime_error("inner");
        } catch (const std::runtime_error&) {
            THROW_NESTED_EXCEPTION("outer");
        }
    } catch (const Exception& e) {
        EXPECT_EQ(e.getMessage(), "outer");
        try {
            std::rethrow_if_nested(e);
            FAIL() << "expected a nested exception";
        } catch (const std::runtime_error& inner) {
            EXPECT_STREQ(inner.what(), "inner");
        }
    }
}

TEST_F(ExceptionTest, StackTraceRenders) {
    const StackTrace trace;
    EXPECT_FALSE(trace.toString().empty());
}

}  // namespace strata::error::test

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
