// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/conformance/FuzzDriver.hpp"
#include <algorithm>
#include <cstdlib>
#include <cstdint>
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

using namespace TimestampDateKit;
using namespace TimestampDateKit::conformance;
using oracle::Date;
using oracle::Instant;
using oracle::NS_PER_DAY;

static constexpr int64_t NS_PER_HOUR = 3600 * oracle::NS_PER_SEC;

static int64_t at(const char *date, int64_t hours = 0)
{
	return Date::parse(date).midnight().unix_ns + hours * NS_PER_HOUR;
}

static FuzzCase make_case(int64_t start, int64_t end, int64_t value)
{
	FuzzCase c;
	c.start_epoch_ns = start;
	c.end_epoch_ns = end;
	c.value_epoch_ns = value;
	return c;
}

// fails the test if called
static oracle::DateRange must_not_convert(const oracle::InstantRange &)
{
	ADD_FAILURE() << "skipped case was converted";
	return {};
}

static oracle::DateRange truncating_convert(const oracle::InstantRange &range)
{
	oracle::DateRange result = oracle::timestamp_range_to_date_range(range);
	if (range.start)
		result.start = Date::containing(range.start->utc()).format();
	return result;
}

TEST(FuzzCase, RangeAndDescription)
{
	FuzzCase c = make_case(at("2024-07-15", 12), 0, at("2024-07-15", 3));
	c.start_offset_s = 36000;
	c.ignore_end = true;
	const auto range = c.range();
	ASSERT_TRUE(range.start.has_value());
	EXPECT_EQ(range.start->unix_ns, at("2024-07-15", 12));
	EXPECT_EQ(range.start->offset_s, 36000);
	EXPECT_FALSE(range.end.has_value());
	EXPECT_EQ(c.describe(), "[2024-07-15T22:00:00+10:00, (unset)) value 2024-07-15");
}

// ============================================================================
// seed_corpus
// ============================================================================

TEST(seed_corpus, CrossesEveryTripleWithOffsetPairs)
{
	const std::vector<oracle::StringRange> ranges{{"2024-07-15T00:00:00+10:00", "2024-07-17T00:00:00Z"}};
	const std::vector<std::string> values{"2024-07-15"};
	const auto corpus = seed_corpus(ranges, values);
	// as given, without start, without end; 16 start offsets times 16 end offsets
	ASSERT_EQ(corpus.size(), 3u * 16 * 16);

	const FuzzCase &first = corpus.front();
	EXPECT_EQ(first.start_epoch_ns, Instant::parse("2024-07-15T00:00:00+10:00").unix_ns);
	EXPECT_EQ(first.start_offset_s, 36000);
	EXPECT_EQ(first.end_epoch_ns, at("2024-07-17"));
	EXPECT_EQ(first.end_offset_s, 0);
	EXPECT_EQ(first.value_epoch_ns, at("2024-07-15"));
	EXPECT_FALSE(first.ignore_start);
	EXPECT_FALSE(first.ignore_end);

	EXPECT_EQ(corpus[1].start_offset_s, 36000);
	EXPECT_EQ(corpus[1].end_offset_s, FUZZ_OFFSETS[0]);
	EXPECT_EQ(corpus[16].start_offset_s, FUZZ_OFFSETS[0]);
	EXPECT_EQ(corpus[16].end_offset_s, 0);

	EXPECT_TRUE(corpus[256].ignore_start);
	EXPECT_FALSE(corpus[256].ignore_end);
	EXPECT_TRUE(corpus[512].ignore_end);
	EXPECT_FALSE(corpus[512].ignore_start);
}

TEST(seed_corpus, OffsetsKeepTheInstant)
{
	const auto corpus = seed_corpus({{"2024-07-15T00:00:00+10:00", ""}}, {"2024-07-15"});
	for (const auto &c : corpus)
		if (!c.ignore_start)
			EXPECT_EQ(c.start_epoch_ns, Instant::parse("2024-07-15T00:00:00+10:00").unix_ns);
}

// ============================================================================
// check_case
// ============================================================================

TEST(check_case, SkipsFullyUnsetRange)
{
	FuzzCase c = make_case(at("2024-07-15"), at("2024-07-20"), at("2024-07-16"));
	c.ignore_start = true;
	c.ignore_end = true;
	EXPECT_EQ(check_case(c, must_not_convert), FuzzOutcome::Skipped);
}

TEST(check_case, SkipsEmptyAndInvertedRanges)
{
	EXPECT_EQ(check_case(make_case(at("2024-07-15"), at("2024-07-15"), at("2024-07-15")), must_not_convert),
			  FuzzOutcome::Skipped);
	EXPECT_EQ(check_case(make_case(at("2024-07-20"), at("2024-07-15"), at("2024-07-15")), must_not_convert),
			  FuzzOutcome::Skipped);
}

TEST(check_case, SkipsRangesShorterThanADay)
{
	EXPECT_EQ(check_case(make_case(at("2024-07-15"), at("2024-07-15", 23), at("2024-07-15")), must_not_convert),
			  FuzzOutcome::Skipped);
	EXPECT_EQ(check_case(make_case(at("2024-07-15"), at("2024-07-16") - 1, at("2024-07-15")), must_not_convert),
			  FuzzOutcome::Skipped);
}

TEST(check_case, RangesCoveringNoWholeDayAreChecked)
{
	// 25 hours, but no day lies completely inside; the reference narrows to an inverted range
	const auto c = make_case(at("2024-07-15", 12), at("2024-07-16", 13), at("2024-07-15"));
	EXPECT_EQ(check_case(c, oracle::timestamp_range_to_date_range), FuzzOutcome::Checked);
	EXPECT_THROW(check_case(c, truncating_convert), exception::AssertionFailure);
}

TEST(check_case, TruncatedStartFailsWithinTheFirstDay)
{
	const auto c = make_case(at("2024-07-15") + 30 * 60 * oracle::NS_PER_SEC, at("2024-07-16", 6),
							 at("2024-07-15", 12));
	EXPECT_EQ(check_case(c, oracle::timestamp_range_to_date_range), FuzzOutcome::Checked);
	try {
		check_case(c, truncating_convert);
		FAIL() << "expected an AssertionFailure";
	} catch (const exception::AssertionFailure &e) {
		const std::string message = e.what();
		EXPECT_NE(message.find("got true matching date 2024-07-15"), std::string::npos) << message;
		EXPECT_NE(message.find("-> date range [2024-07-15, 2024-07-15]"), std::string::npos) << message;
	}
}

TEST(check_case, SkipsOutsideTheEpochWindow)
{
	EXPECT_EQ(check_case(make_case(MAX_FUZZ_EPOCH_NS + 1, MAX_FUZZ_EPOCH_NS + 10 * NS_PER_DAY, 0), must_not_convert),
			  FuzzOutcome::Skipped);
	EXPECT_EQ(check_case(make_case(0, 10 * NS_PER_DAY, -MAX_FUZZ_EPOCH_NS - 1), must_not_convert),
			  FuzzOutcome::Skipped);
}

TEST(check_case, SkipsOffsetsBeyondEighteenHours)
{
	FuzzCase c = make_case(at("2024-07-15"), at("2024-07-20"), at("2024-07-16"));
	c.start_offset_s = 19 * 3600;
	EXPECT_EQ(check_case(c, must_not_convert), FuzzOutcome::Skipped);
}

TEST(check_case, ExactDayIsChecked)
{
	EXPECT_EQ(check_case(make_case(at("2024-07-15"), at("2024-07-16"), at("2024-07-15", 5)),
						 oracle::timestamp_range_to_date_range),
			  FuzzOutcome::Checked);
}

TEST(check_case, OpenRangesAreChecked)
{
	FuzzCase c = make_case(at("2024-07-15", 12), 0, at("2024-07-15"));
	c.ignore_end = true;
	EXPECT_EQ(check_case(c, oracle::timestamp_range_to_date_range), FuzzOutcome::Checked);
	c.ignore_end = false;
	c.ignore_start = true;
	c.end_epoch_ns = at("2024-07-15", 12);
	EXPECT_EQ(check_case(c, oracle::timestamp_range_to_date_range), FuzzOutcome::Checked);
}

TEST(check_case, TruncatedStartFails)
{
	const auto c = make_case(at("2024-07-15", 12), at("2024-07-18"), at("2024-07-15", 1));
	try {
		check_case(c, truncating_convert);
		FAIL() << "expected an AssertionFailure";
	} catch (const exception::AssertionFailure &e) {
		const std::string message = e.what();
		EXPECT_NE(message.find("expected false (false && true), got true matching date 2024-07-15"),
				  std::string::npos)
			<< message;
		EXPECT_NE(message.find("-> date range [2024-07-15, 2024-07-17]"), std::string::npos) << message;
	}
}

TEST(check_case, SetBoundForUnsetInput)
{
	FuzzCase c = make_case(at("2024-07-15"), 0, at("2024-07-15"));
	c.ignore_end = true;
	EXPECT_THROW(check_case(c, [](const oracle::InstantRange &) { return oracle::DateRange{"2024-07-15", "2024-07-15"}; }),
				 exception::AssertionFailure);
}

TEST(check_case, EmptyBoundForSetInput)
{
	EXPECT_THROW(check_case(make_case(at("2024-07-15"), at("2024-07-18"), at("2024-07-15")),
							[](const oracle::InstantRange &) { return oracle::DateRange{"2024-07-15", ""}; }),
				 exception::AssertionFailure);
}

TEST(check_case, NonCanonicalDate)
{
	EXPECT_THROW(check_case(make_case(at("2024-07-15"), at("2024-07-18"), at("2024-07-15")),
							[](const oracle::InstantRange &) { return oracle::DateRange{"2024-7-15", "2024-07-17"}; }),
				 exception::AssertionFailure);
}

TEST(check_case, InvertedDateRange)
{
	EXPECT_THROW(check_case(make_case(at("2024-07-15"), at("2024-07-18"), at("2024-07-15")),
							[](const oracle::InstantRange &) { return oracle::DateRange{"2024-07-17", "2024-07-15"}; }),
				 exception::AssertionFailure);
}

// ============================================================================
// random_case, decode_fuzz_case
// ============================================================================

TEST(random_case, DeterministicForASeed)
{
	const auto seeds = seed_corpus(oracle::timestamp_range_values(), oracle::date_values());
	std::mt19937_64 a(7), b(7);
	for (int i = 0; i < 100; ++i)
		ASSERT_EQ(random_case(a, seeds), random_case(b, seeds));
}

TEST(random_case, FromScratchStaysInWindow)
{
	std::mt19937_64 engine(1);
	for (int i = 0; i < 1000; ++i) {
		const FuzzCase c = random_case(engine, {});
		EXPECT_LE(std::abs(c.start_epoch_ns), MAX_FUZZ_EPOCH_NS);
		EXPECT_LE(std::abs(c.end_epoch_ns), MAX_FUZZ_EPOCH_NS);
		EXPECT_NE(std::find(FUZZ_OFFSETS.begin(), FUZZ_OFFSETS.end(), c.start_offset_s), FUZZ_OFFSETS.end());
		EXPECT_NE(std::find(FUZZ_OFFSETS.begin(), FUZZ_OFFSETS.end(), c.end_offset_s), FUZZ_OFFSETS.end());
	}
}

TEST(decode_fuzz_case, MissingBytesReadAsZero)
{
	const FuzzCase c = decode_fuzz_case(nullptr, 0);
	EXPECT_EQ(c.start_epoch_ns, -200LL * 365 * NS_PER_DAY);
	EXPECT_EQ(c.end_epoch_ns, c.start_epoch_ns - 2000 * NS_PER_DAY);
	EXPECT_EQ(c.start_offset_s, FUZZ_OFFSETS[0]);
	EXPECT_FALSE(c.ignore_start);
	EXPECT_FALSE(c.ignore_end);
}

TEST(decode_fuzz_case, FlagsAndBounds)
{
	std::mt19937_64 engine(3);
	std::uniform_int_distribution<int> byte(0, 255);
	for (int i = 0; i < 1000; ++i) {
		std::vector<uint8_t> data(27);
		for (auto &b : data)
			b = static_cast<uint8_t>(byte(engine));
		const FuzzCase c = decode_fuzz_case(data.data(), data.size());
		EXPECT_EQ(c.ignore_start, (data[26] & 0x1) != 0);
		EXPECT_EQ(c.ignore_end, (data[26] & 0x2) != 0);
		EXPECT_LE(std::abs(c.start_epoch_ns), 200LL * 365 * NS_PER_DAY);
		EXPECT_LE(std::abs(c.end_epoch_ns - c.start_epoch_ns), 2000 * NS_PER_DAY);
		EXPECT_EQ(c, decode_fuzz_case(data.data(), data.size()));
	}
}

// ============================================================================
// fuzz
// ============================================================================

TEST(fuzz, ReferenceConversionHoldsTheProperties)
{
	const auto seeds = seed_corpus(oracle::timestamp_range_values(), oracle::date_values());
	const FuzzReport report = fuzz(seeds, oracle::timestamp_range_to_date_range, 20000, 42);
	EXPECT_GT(report.checked, 0u);
	EXPECT_EQ(report.checked + report.skipped, seeds.size() + 20000);
}

TEST(fuzz, ReferenceConversionWithoutSeeds)
{
	const FuzzReport report = fuzz({}, oracle::timestamp_range_to_date_range, 20000, 1234);
	EXPECT_GT(report.checked, 0u);
}

TEST(fuzz, TruncatingConversionIsCaught)
{
	const auto seeds = seed_corpus(oracle::timestamp_range_values(), oracle::date_values());
	EXPECT_THROW(fuzz(seeds, truncating_convert, 1000, 42), exception::AssertionFailure);
}

TEST(fuzz, ReportsProgress)
{
	std::vector<std::string> info;
	fuzz({}, oracle::timestamp_range_to_date_range, 10, 5, [&info](Level level, const std::string &message) {
		if (level == Level::info)
			info.push_back(message);
	});
	ASSERT_EQ(info.size(), 3u);
	EXPECT_EQ(info[0], "checking 0 seed cases");
	EXPECT_EQ(info[1], "checking 10 random cases with seed 5");
	EXPECT_EQ(info[2].find(" skipped") != std::string::npos, true);
}
