// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_CONFORMANCE_CONFORMANCERUNNER_HPP
#define TDK_CONFORMANCE_CONFORMANCERUNNER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "TimestampDateKit/conformance/Common.hpp"
#include "TimestampDateKit/oracle/Fixtures.hpp"
#include "TimestampDateKit/oracle/Oracle.hpp"

namespace TimestampDateKit::conformance
{

struct CaseFailure {
	oracle::MatchKey key; // {range start, range end, value}
	std::string message;
};

struct RunReport {
	size_t cases = 0;
	std::vector<CaseFailure> failures;
	oracle::MatchTable actual; // triples that matched with the converted ranges

	[[nodiscard]] bool passed() const noexcept { return failures.empty(); }
};

/**
 * Checks a timestamp range to date range conversion against a match table.
 *
 * Every range_test_cases triple is converted and matched with matches_date.
 * A disagreement with the table is recorded as a CaseFailure and the run
 * goes on. Exceptions other than AssertionFailure and the oracle's parse
 * errors, e.g. a failing external command, abort the run.
 */
RunReport run_timestamp_to_date(const std::vector<oracle::StringRange> &ranges,
								const std::vector<std::string> &values, const oracle::MatchTable &matches,
								const oracle::TimestampToDate &convert, const Reporter &reporter = {});

// The inverse direction: date ranges against timestamp values, matched with matches_instant.
RunReport run_date_to_timestamp(const std::vector<oracle::StringRange> &ranges,
								const std::vector<std::string> &values, const oracle::MatchTable &matches,
								const oracle::DateToTimestamp &convert, const Reporter &reporter = {});

// one {"start", "end", "value"} line per triple
std::string format_match_table(const oracle::MatchTable &table);

} // namespace TimestampDateKit::conformance

#endif // TDK_CONFORMANCE_CONFORMANCERUNNER_HPP
