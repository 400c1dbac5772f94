// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_ORACLE_INSTANT_HPP
#define TDK_ORACLE_INSTANT_HPP

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

#include "TimestampDateKit/oracle/Common.hpp"

namespace TimestampDateKit::oracle
{

/**
 * Instant - a nanosecond point on the timeline
 *
 * The value is the number of nanoseconds since 1970-01-01T00:00:00Z. The
 * offset only records the UTC offset the instant was expressed in, it is used
 * when formatting and never when comparing: two instants are equal when they
 * name the same point on the timeline.
 *
 * Text form is RFC 3339 with up to nanosecond precision:
 *   - 2024-07-15T00:00:00Z
 *   - 2024-07-15T09:30:00.5+10:00
 *   - 2024-07-16T15:00:00.000000001-11:35
 */
struct Instant {
	int64_t unix_ns = 0;
	int32_t offset_s = 0; // seconds east of UTC

	static Instant parse(std::string_view input); // throws InvalidTimestamp

	[[nodiscard]] std::string format() const;
	void append_to(std::string &buffer) const;

	[[nodiscard]] Instant utc() const noexcept { return Instant{unix_ns, 0}; }
	[[nodiscard]] Instant in_offset(int32_t offset) const noexcept { return Instant{unix_ns, offset}; }
	[[nodiscard]] Instant add(int64_t ns) const noexcept { return Instant{unix_ns + ns, offset_s}; }

	[[nodiscard]] bool is_utc_midnight() const noexcept;

	friend bool operator==(const Instant &a, const Instant &b) noexcept
	{
		return a.unix_ns == b.unix_ns;
	}
	friend std::strong_ordering operator<=>(const Instant &a, const Instant &b) noexcept
	{
		return a.unix_ns <=> b.unix_ns;
	}
};

/**
 * Date - a UTC calendar day, "YYYY-MM-DD"
 *
 * Stored as days since 1970-01-01. A date always stands for midnight UTC of
 * that day.
 */
struct Date {
	int64_t days = 0;

	static Date parse(std::string_view input); // throws InvalidDate
	static Date containing(const Instant &instant) noexcept;

	[[nodiscard]] std::string format() const;
	[[nodiscard]] Instant midnight() const noexcept { return Instant{days * NS_PER_DAY, 0}; }

	friend bool operator==(const Date &, const Date &) noexcept = default;
	friend std::strong_ordering operator<=>(const Date &, const Date &) noexcept = default;
};

// true if input parses as a date and formats back to the identical text
[[nodiscard]] bool is_canonical_date(std::string_view input) noexcept;

} // namespace TimestampDateKit::oracle

#endif // TDK_ORACLE_INSTANT_HPP
