// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include <chrono>
#include <cstdint>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#include "commands/duration.hpp"

using namespace TimestampDateKit::cmd::interface;

namespace
{

constexpr int64_t NS_PER_SEC = 1'000'000'000LL;
constexpr int64_t NS_PER_MS = 1'000'000LL;
constexpr int64_t NS_PER_US = 1'000LL;
constexpr int64_t NS_PER_MIN = 60LL * NS_PER_SEC;
constexpr int64_t NS_PER_HOUR = 3600LL * NS_PER_SEC;

} // namespace

// ============================================================================
// Duration suffix tests
// ============================================================================

TEST(DurationTest, Suffix_Nanoseconds)
{
	EXPECT_EQ(parse_duration_ns("1000ns"), 1000LL);
}

TEST(DurationTest, Suffix_Microseconds)
{
	EXPECT_EQ(parse_duration_ns("1000us"), 1000LL * NS_PER_US);
}

TEST(DurationTest, Suffix_Milliseconds)
{
	EXPECT_EQ(parse_duration_ns("250ms"), 250LL * NS_PER_MS);
}

TEST(DurationTest, Suffix_Seconds)
{
	EXPECT_EQ(parse_duration_ns("60s"), 60LL * NS_PER_SEC);
}

TEST(DurationTest, Suffix_Minutes)
{
	EXPECT_EQ(parse_duration_ns("60m"), 60LL * NS_PER_MIN);
}

TEST(DurationTest, Suffix_Hours)
{
	EXPECT_EQ(parse_duration_ns("24h"), 24LL * NS_PER_HOUR);
}

TEST(DurationTest, Suffix_DefaultIsSeconds)
{
	EXPECT_EQ(parse_duration_ns("60"), 60LL * NS_PER_SEC);
}

TEST(DurationTest, FractionalSeconds)
{
	EXPECT_EQ(parse_duration_ns("1.5s"), static_cast<int64_t>(1.5 * NS_PER_SEC));
}

TEST(DurationTest, FractionalMinutes)
{
	EXPECT_EQ(parse_duration_ns("0.5m"), 30LL * NS_PER_SEC);
}

TEST(DurationTest, Zero)
{
	EXPECT_EQ(parse_duration_ns("0"), 0LL);
	EXPECT_EQ(parse_duration_ns("0ms"), 0LL);
}

TEST(DurationTest, AsChronoDuration)
{
	EXPECT_EQ(parse_duration("2m"), std::chrono::minutes(2));
	EXPECT_EQ(parse_duration("10ms"), std::chrono::milliseconds(10));
}

// ============================================================================
// Error handling tests
// ============================================================================

TEST(DurationTest, Error_Empty)
{
	EXPECT_THROW(parse_duration_ns(""), std::invalid_argument);
}

TEST(DurationTest, Error_NoNumber)
{
	EXPECT_THROW(parse_duration_ns("ms"), std::invalid_argument);
	EXPECT_THROW(parse_duration_ns("-1s"), std::invalid_argument);
}

TEST(DurationTest, Error_UnknownSuffix)
{
	EXPECT_THROW(parse_duration_ns("30x"), std::invalid_argument);
	EXPECT_THROW(parse_duration_ns("30S"), std::invalid_argument);
	EXPECT_THROW(parse_duration_ns("30 s"), std::invalid_argument);
	EXPECT_THROW(parse_duration_ns("1.5.3s"), std::invalid_argument);
}

TEST(DurationTest, Error_OutOfRange)
{
	EXPECT_THROW(parse_duration_ns("9999999999999h"), std::invalid_argument);
	// beyond what a double holds
	EXPECT_THROW(parse_duration_ns("1" + std::string(400, '0') + "ms"), std::invalid_argument);
}

TEST(DurationTest, Error_Malformed)
{
	EXPECT_THROW(parse_duration_ns("."), std::invalid_argument);
	EXPECT_THROW(parse_duration_ns("1..s"), std::invalid_argument);
}
