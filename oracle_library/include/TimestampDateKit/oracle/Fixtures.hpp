// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_ORACLE_FIXTURES_HPP
#define TDK_ORACLE_FIXTURES_HPP

#include <array>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace TimestampDateKit::oracle
{

using StringRange = std::array<std::string, 2>; // {start, end}, "" = unset
using MatchKey = std::array<std::string, 3>;	// {start, end, value}
using MatchTable = std::set<MatchKey>;

// Fixture corpora, the text forms are used verbatim as match table keys.
const std::vector<std::string> &date_values();
const std::vector<StringRange> &date_range_values();
const std::vector<std::string> &timestamp_values();
const std::vector<StringRange> &timestamp_range_values();

/**
 * Every (start, end, value) triple that matches under the reference
 * conversion, for timestamp ranges against date values and for date ranges
 * against timestamp values. Triples not in the table must not match.
 */
const MatchTable &example_matches();

/**
 * Calls f for each range crossed with each value, including the variants of
 * every range with its start or its end cleared. Duplicate triples are
 * visited once. Iteration stops when f returns false.
 */
void range_test_cases(const std::vector<StringRange> &ranges, const std::vector<std::string> &values,
					  const std::function<bool(const StringRange &, const std::string &)> &f);

} // namespace TimestampDateKit::oracle

#endif // TDK_ORACLE_FIXTURES_HPP
