// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_ORACLE_ORACLE_HPP
#define TDK_ORACLE_ORACLE_HPP

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "TimestampDateKit/oracle/Instant.hpp"

namespace TimestampDateKit::oracle
{

// [start, end) - either bound may be unset, meaning unbounded on that side
struct InstantRange {
	std::optional<Instant> start;
	std::optional<Instant> end;

	friend bool operator==(const InstantRange &, const InstantRange &) = default;
};

// [start, end] - an empty string is an unset bound
struct DateRange {
	std::string start;
	std::string end;

	friend bool operator==(const DateRange &, const DateRange &) = default;
};

// Converts a timestamp range for comparison against UTC dates.
using TimestampToDate = std::function<DateRange(const InstantRange &)>;

// Converts a date range for selecting data by timestamp.
using DateToTimestamp = std::function<InstantRange(const DateRange &)>;

/**
 * Narrowing conversion: the date range holds only the UTC days that the
 * instant range covers entirely.
 *
 * start: normalised to UTC, rounded up to the next midnight unless it already
 *        is one, then truncated to its date.
 * end:   normalised to UTC, moved back one day (exclusive to inclusive), then
 *        truncated to its date.
 *
 * A range shorter than one full day may produce start > end, which stands for
 * an empty date range and is returned as-is.
 */
[[nodiscard]] DateRange timestamp_range_to_date_range(const InstantRange &range);

/**
 * Lossless conversion: start is midnight UTC of the start date, end is
 * midnight UTC of the day after the end date. Throws InvalidDate.
 */
[[nodiscard]] InstantRange date_range_to_timestamp_range(const DateRange &range);

[[nodiscard]] Instant widen_start(const Instant &t) noexcept; // truncate to UTC day start
[[nodiscard]] Instant widen_end(const Instant &t) noexcept;	  // next UTC midnight, or t if midnight

// Moves both set bounds outward to the enclosing UTC day boundaries. Idempotent.
[[nodiscard]] InstantRange widen_range(const InstantRange &range) noexcept;

// Half-open, because time is continuous.
[[nodiscard]] bool matches_instant(const InstantRange &range, const Instant &value) noexcept;

// Closed, because dates are discrete. Throws InvalidDate.
[[nodiscard]] bool matches_date(const DateRange &range, std::string_view value);

} // namespace TimestampDateKit::oracle

#endif // TDK_ORACLE_ORACLE_HPP
