// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_CONFORMANCE_FUZZDRIVER_HPP
#define TDK_CONFORMANCE_FUZZDRIVER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "TimestampDateKit/conformance/Common.hpp"
#include "TimestampDateKit/oracle/Fixtures.hpp"
#include "TimestampDateKit/oracle/Oracle.hpp"

namespace TimestampDateKit::conformance
{

/**
 * One fuzz input: a timestamp range given as epochs and offsets, and a date
 * value given as an epoch inside that day. An ignored bound is unset.
 */
struct FuzzCase {
	int64_t start_epoch_ns = 0;
	int32_t start_offset_s = 0;
	int64_t end_epoch_ns = 0;
	int32_t end_offset_s = 0;
	int64_t value_epoch_ns = 0;
	bool ignore_start = false;
	bool ignore_end = false;

	[[nodiscard]] oracle::InstantRange range() const;
	[[nodiscard]] std::string describe() const;

	friend bool operator==(const FuzzCase &, const FuzzCase &) = default;
};

// UTC offsets tried for every seed bound, in seconds east of UTC
constexpr std::array<int32_t, 15> FUZZ_OFFSETS{-43200, -36000, -32400, -25200, -18000,
											   -14400, -7200,  0,	   3600,   7200,
											   14400,  18000,  25200,  32400,  43200};

// epochs further than this from 1970 are skipped
constexpr int64_t MAX_FUZZ_EPOCH_NS = 250LL * 365 * oracle::NS_PER_DAY;

/**
 * Seeds from range_test_cases: every triple with the parsed offsets, crossed
 * with every pair of FUZZ_OFFSETS for start and end.
 */
std::vector<FuzzCase> seed_corpus(const std::vector<oracle::StringRange> &ranges,
								  const std::vector<std::string> &values);

enum class FuzzOutcome { Skipped, Checked };

/**
 * Converts one case and checks the properties every narrowing conversion
 * has to hold:
 *   - a bound is empty exactly when it was unset
 *   - produced dates are canonical
 *   - start date <= end date, unless the range covers no whole UTC day
 *   - the date matches exactly when its whole day lies inside the range
 *
 * Ranges shorter than one day are skipped.
 * Throws AssertionFailure.
 */
FuzzOutcome check_case(const FuzzCase &fuzz_case, const oracle::TimestampToDate &convert);

// mutates a seed, or makes up a case from scratch when seeds is empty or by chance
FuzzCase random_case(std::mt19937_64 &engine, const std::vector<FuzzCase> &seeds);

// maps arbitrary fuzzer bytes onto a case, missing bytes read as zero
FuzzCase decode_fuzz_case(const uint8_t *data, size_t size);

struct FuzzReport {
	size_t checked = 0;
	size_t skipped = 0;
};

/**
 * Checks the seeds, then `iterations` random cases. Stops at the first
 * AssertionFailure, which propagates.
 */
FuzzReport fuzz(const std::vector<FuzzCase> &seeds, const oracle::TimestampToDate &convert,
				size_t iterations, uint64_t seed, const Reporter &reporter = {});

} // namespace TimestampDateKit::conformance

#endif // TDK_CONFORMANCE_FUZZDRIVER_HPP
