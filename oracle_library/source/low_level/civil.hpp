// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#pragma once

#include <cstdint>

namespace TimestampDateKit::oracle::source::low_level
{

// Proleptic Gregorian calendar conversions without timezone lookup.
// Based on Howard Hinnant's date algorithms:
// http://howardhinnant.github.io/date_algorithms.html
struct CivilDate {
	int64_t year;
	uint32_t month; // [1, 12]
	uint32_t day;	// [1, 31]
};

struct TimeOfDay {
	uint32_t hour;
	uint32_t minute;
	uint32_t second;
	uint32_t nanosecond;
};

constexpr int64_t floor_div(int64_t a, int64_t b) noexcept
{
	const int64_t q = a / b;
	return (a % b != 0 && ((a < 0) != (b < 0))) ? q - 1 : q;
}

constexpr int64_t floor_mod(int64_t a, int64_t b) noexcept
{
	return a - floor_div(a, b) * b;
}

constexpr bool is_leap_year(int64_t y) noexcept
{
	return y % 4 == 0 && (y % 100 != 0 || y % 400 == 0);
}

constexpr uint32_t days_in_month(int64_t y, uint32_t m) noexcept
{
	constexpr uint32_t days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	return (m == 2 && is_leap_year(y)) ? 29 : days[m - 1];
}

constexpr int64_t days_from_civil(int64_t y, uint32_t m, uint32_t d) noexcept
{
	y -= m <= 2 ? 1 : 0;
	const int64_t era = (y >= 0 ? y : y - 399) / 400;
	const uint32_t yoe = static_cast<uint32_t>(y - era * 400);			 // [0, 399]
	const uint32_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1; // [0, 365]
	const uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;			 // [0, 146096]
	return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

constexpr CivilDate civil_from_days(int64_t days) noexcept
{
	// Shift epoch from 1970-01-01 to 0000-03-01 (eliminates leap year special case)
	days += 719468;

	const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
	const uint32_t doe = static_cast<uint32_t>(days - era * 146097); // day of era [0, 146096]
	const uint32_t yoe =
		(doe - doe / 1460 + doe / 36524 - doe / 146096) / 365; // year of era [0, 399]
	const int64_t y = static_cast<int64_t>(yoe) + era * 400;
	const uint32_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100); // day of year [0, 365]
	const uint32_t mp = (5 * doy + 2) / 153;					  // month [0, 11]

	CivilDate date{};
	date.day = doy - (153 * mp + 2) / 5 + 1;	  // day [1, 31]
	date.month = mp < 10 ? mp + 3 : mp - 9; // month [1, 12]
	date.year = y + (date.month <= 2 ? 1 : 0);
	return date;
}

constexpr TimeOfDay time_of_day(int64_t ns_into_day) noexcept
{
	TimeOfDay t{};
	t.nanosecond = static_cast<uint32_t>(ns_into_day % 1'000'000'000LL);
	int64_t secs = ns_into_day / 1'000'000'000LL;
	t.second = static_cast<uint32_t>(secs % 60);
	secs /= 60;
	t.minute = static_cast<uint32_t>(secs % 60);
	t.hour = static_cast<uint32_t>(secs / 60);
	return t;
}

template <unsigned width> inline char *write_digits(char *p, uint64_t v) noexcept
{
	for (int i = static_cast<int>(width) - 1; i >= 0; --i) {
		p[i] = static_cast<char>('0' + (v % 10));
		v /= 10;
	}
	return p + width;
}

} // namespace TimestampDateKit::oracle::source::low_level
