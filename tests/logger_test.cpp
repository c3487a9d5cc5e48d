/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "noirlings/logger.hpp"

using namespace noirlings;

TEST(Logger, ParsesLevelNamesInAnyCase) {
    EXPECT_EQ(Logger::parseLevel("error", LogLevel::INFO), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("Warning", LogLevel::INFO), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("DEBUG", LogLevel::INFO), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("trace", LogLevel::INFO), LogLevel::TRACE);
}

TEST(Logger, UnknownLevelFallsBack) {
    EXPECT_EQ(Logger::parseLevel("loud", LogLevel::WARN), LogLevel::WARN);
    EXPECT_EQ(Logger::parseLevel("", LogLevel::ERROR), LogLevel::ERROR);
}

TEST(Logger, SetLevelOverridesEnvironment) {
    const LogLevel previous = Logger::level();
    Logger::setLevel(LogLevel::TRACE);
    EXPECT_EQ(Logger::level(), LogLevel::TRACE);
    Logger::setLevel(previous);
}
