// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/oracle/Oracle.hpp"
#include "low_level/civil.hpp"

using namespace TimestampDateKit::oracle::source::low_level;

namespace TimestampDateKit::oracle
{

DateRange timestamp_range_to_date_range(const InstantRange &range)
{
	DateRange result;

	if (range.start) {
		Instant start = range.start->utc();
		// round up, so a partially covered first day is never matched
		if (!start.is_utc_midnight())
			start = start.add(NS_PER_DAY);
		result.start = Date::containing(start).format();
	}

	if (range.end) {
		// exclusive end to inclusive end
		const Instant end = range.end->utc().add(-NS_PER_DAY);
		result.end = Date::containing(end).format();
	}

	return result;
}

InstantRange date_range_to_timestamp_range(const DateRange &range)
{
	InstantRange result;

	if (!range.start.empty())
		result.start = Date::parse(range.start).midnight();

	if (!range.end.empty())
		result.end = Date::parse(range.end).midnight().add(NS_PER_DAY);

	return result;
}

Instant widen_start(const Instant &t) noexcept
{
	return Instant{floor_div(t.unix_ns, NS_PER_DAY) * NS_PER_DAY, t.offset_s};
}

Instant widen_end(const Instant &t) noexcept
{
	const Instant truncated = widen_start(t);
	if (truncated == t)
		return t;
	return truncated.add(NS_PER_DAY);
}

InstantRange widen_range(const InstantRange &range) noexcept
{
	InstantRange result;
	if (range.start)
		result.start = widen_start(*range.start);
	if (range.end)
		result.end = widen_end(*range.end);
	return result;
}

bool matches_instant(const InstantRange &range, const Instant &value) noexcept
{
	if (range.start && value < *range.start)
		return false;
	if (range.end && !(value < *range.end)) // exclusive
		return false;
	return true;
}

bool matches_date(const DateRange &range, std::string_view value)
{
	const Date date = Date::parse(value);
	if (!range.start.empty() && date < Date::parse(range.start))
		return false;
	if (!range.end.empty() && date > Date::parse(range.end))
		return false;
	return true;
}

} // namespace TimestampDateKit::oracle
