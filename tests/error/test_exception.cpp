#include <gtest/gtest.h>

#include <string>
#include <thread>

#include "gentrie/error/exception.hpp"
#include "gentrie/error/stacktrace.hpp"
#include "gentrie/trie/error.hpp"

using namespace gentrie;

namespace {
void raiseDepthError() { THROW_KEY_DEPTH_ERROR("key of length {} too long", 4096); }
}  // namespace

TEST(ExceptionTest, RecordsLocationAndMessage) {
    try {
        THROW_RUNTIME_ERROR("value {} is {}", 42, "wrong");
        FAIL() << "expected an exception";
    } catch (const error::RuntimeError& e) {
        EXPECT_EQ(e.getMessage(), "value 42 is wrong");
        EXPECT_NE(e.getFile().find("test_exception.cpp"), std::string::npos);
        EXPECT_GT(e.getLine(), 0);
        EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
    }
}

TEST(ExceptionTest, WhatContainsMessage) {
    try {
        THROW_INVALID_ARGUMENT("bad argument");
    } catch (const std::exception& e) {
        EXPECT_NE(std::string(e.what()).find("bad argument"), std::string::npos);
    }
}

TEST(ExceptionTest, DomainErrorsDeriveFromException) {
    EXPECT_THROW(raiseDepthError(), KeyDepthError);
    EXPECT_THROW(raiseDepthError(), error::Exception);
    try {
        raiseDepthError();
    } catch (const KeyDepthError& e) {
        EXPECT_EQ(e.getFunction(), "raiseDepthError");
        EXPECT_EQ(e.getMessage(), "key of length 4096 too long");
    }
}

TEST(ExceptionTest, InvariantErrorIsCopyable) {
    TrieInvariantError raised(GENTRIE_FILE_NAME, GENTRIE_FILE_LINE,
                              GENTRIE_FUNC_NAME, "broken {}", "node");
    TrieInvariantError copy = raised;
    EXPECT_EQ(copy.getMessage(), "broken node");
}

TEST(StackTraceTest, RendersFrames) {
    error::StackTrace trace;
    const std::string text = trace.toString();
    EXPECT_EQ(text.rfind("Stack trace:\n", 0), 0U);
#if defined(__APPLE__) || defined(__linux__)
    ASSERT_GT(trace.size(), 0U);
    EXPECT_NE(text.find("\t[0] "), std::string::npos);
    EXPECT_NE(text.find(" at 0x"), std::string::npos);
#endif
}
