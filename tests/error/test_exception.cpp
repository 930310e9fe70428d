/*!
 * \file test_exception.cpp
 * \brief Unit tests for the enumkit exception hierarchy
 * \author Max Qian <lightapt.com>
 * \date 2024-6-12
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>
#include "enumkit/error/exception.hpp"

#include <string>
#include <thread>

using namespace enumkit::error;

namespace {
void throwOverflow() { THROW_OVERFLOW("value {} does not fit in {}", 999, "u8"); }
}  // namespace

TEST(ExceptionTest, FormatsMessageArguments) {
    try {
        throwOverflow();
        FAIL() << "expected Overflow";
    } catch (const Overflow& e) {
        EXPECT_EQ(e.getMessage(), "value 999 does not fit in u8");
        EXPECT_EQ(e.getFunction(), "throwOverflow");
        EXPECT_GT(e.getLine(), 0);
        EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
    }
}

TEST(ExceptionTest, MessageWithoutArgumentsIsVerbatim) {
    try {
        THROW_PARSER_ERROR("braces {} stay as they are");
    } catch (const ParserError& e) {
        EXPECT_EQ(e.getMessage(), "braces {} stay as they are");
    }
}

TEST(ExceptionTest, WhatCarriesLocationAndMessage) {
    try {
        THROW_INVALID_ARGUMENT("delimiter must not be empty");
    } catch (const Exception& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("delimiter must not be empty"), std::string::npos);
        EXPECT_NE(what.find(e.getFile()), std::string::npos);
        EXPECT_NE(what.find("Line: " + std::to_string(e.getLine())),
                  std::string::npos);
    }
}

TEST(ExceptionTest, MacrosThrowTheirOwnTypes) {
    EXPECT_THROW(THROW_INVALID_ARGUMENT("x"), InvalidArgument);
    EXPECT_THROW(THROW_OVERFLOW("x"), Overflow);
    EXPECT_THROW(THROW_PARSER_ERROR("x"), ParserError);
    EXPECT_THROW(THROW_INVALID_FORMAT("x"), InvalidFormat);
    EXPECT_THROW(THROW_INVALID_FORMAT("x"), Exception);
    EXPECT_THROW(THROW_OVERFLOW("x"), std::exception);
}
