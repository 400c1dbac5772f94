// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/conformance/ConformanceRunner.hpp"

#include <functional>
#include <optional>
#include <sstream>

namespace TimestampDateKit::conformance
{

static void report(const Reporter &reporter, Level level, const std::string &message)
{
	if (reporter)
		reporter(level, message);
}

static std::string case_name(const oracle::MatchKey &key)
{
	return key[0] + "-" + key[1] + "-" + key[2];
}

static std::string bool_string(bool b)
{
	return b ? "true" : "false";
}

static void assert_date(const std::string &value)
{
	if (!oracle::is_canonical_date(value))
		TDK_CONFORMANCE_THROW(exception::AssertionFailure, "not a canonical date: \"" + value + "\"");
}

static std::string format_bound(const std::optional<oracle::Instant> &bound)
{
	return bound ? bound->format() : std::string{};
}

// Runs one check per case, collects failures, keeps the actual match table.
static RunReport run_cases(const std::vector<oracle::StringRange> &ranges,
						   const std::vector<std::string> &values, const oracle::MatchTable &matches,
						   const Reporter &reporter,
						   const std::function<bool(const oracle::StringRange &, const std::string &,
													std::string &)> &check)
{
	RunReport result;
	oracle::range_test_cases(ranges, values, [&](const oracle::StringRange &range, const std::string &value) {
		const oracle::MatchKey key{range[0], range[1], value};
		++result.cases;
		try {
			std::string converted;
			const bool actual = check(range, value, converted);
			if (actual)
				result.actual.insert(key);
			else
				result.actual.erase(key);

			const bool expected = matches.count(key) != 0;
			if (actual != expected)
				TDK_CONFORMANCE_THROW(exception::AssertionFailure,
									  "expected " + bool_string(expected) + ", got " + bool_string(actual) +
										  ": " + converted + " matching " + value);
			report(reporter, Level::verbose, "PASS " + case_name(key));
		} catch (const exception::AssertionFailure &e) {
			result.failures.push_back(CaseFailure{key, e.what()});
			report(reporter, Level::error, "FAIL " + case_name(key) + ": " + e.what());
		} catch (const oracle::exception::Exception &e) {
			result.failures.push_back(CaseFailure{key, e.what()});
			report(reporter, Level::error, "FAIL " + case_name(key) + ": " + e.what());
		}
		return true;
	});
	report(reporter, Level::info,
		   std::to_string(result.cases - result.failures.size()) + "/" + std::to_string(result.cases) +
			   " cases passed");
	return result;
}

RunReport run_timestamp_to_date(const std::vector<oracle::StringRange> &ranges,
								const std::vector<std::string> &values, const oracle::MatchTable &matches,
								const oracle::TimestampToDate &convert, const Reporter &reporter)
{
	return run_cases(ranges, values, matches, reporter,
					 [&convert](const oracle::StringRange &range, const std::string &value, std::string &converted) {
						 oracle::InstantRange input;
						 if (!range[0].empty())
							 input.start = oracle::Instant::parse(range[0]);
						 if (!range[1].empty())
							 input.end = oracle::Instant::parse(range[1]);

						 assert_date(value);

						 const oracle::DateRange output = convert(input);
						 converted = "[" + output.start + ", " + output.end + "]";
						 if (input.start)
							 assert_date(output.start);
						 if (input.end)
							 assert_date(output.end);

						 return oracle::matches_date(output, value);
					 });
}

RunReport run_date_to_timestamp(const std::vector<oracle::StringRange> &ranges,
								const std::vector<std::string> &values, const oracle::MatchTable &matches,
								const oracle::DateToTimestamp &convert, const Reporter &reporter)
{
	return run_cases(ranges, values, matches, reporter,
					 [&convert](const oracle::StringRange &range, const std::string &value, std::string &converted) {
						 const oracle::Instant instant = oracle::Instant::parse(value);

						 if (!range[0].empty())
							 assert_date(range[0]);
						 if (!range[1].empty())
							 assert_date(range[1]);

						 const oracle::DateRange input{range[0], range[1]};
						 const oracle::InstantRange output = convert(input);
						 converted = "[" + format_bound(output.start) + ", " + format_bound(output.end) + ")";
						 if (range[0].empty() != !output.start.has_value())
							 TDK_CONFORMANCE_THROW(exception::AssertionFailure,
												   "start time unset mismatch for input: \"" + range[0] + "\"");
						 if (range[1].empty() != !output.end.has_value())
							 TDK_CONFORMANCE_THROW(exception::AssertionFailure,
												   "end time unset mismatch for input: \"" + range[1] + "\"");

						 return oracle::matches_instant(output, instant);
					 });
}

std::string format_match_table(const oracle::MatchTable &table)
{
	std::ostringstream out;
	for (const auto &key : table)
		out << "{\"" << key[0] << "\", \"" << key[1] << "\", \"" << key[2] << "\"}\n";
	return out.str();
}

} // namespace TimestampDateKit::conformance
