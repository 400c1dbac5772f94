// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/oracle/Instant.hpp"
#include "low_level/civil.hpp"

#include <array>
#include <boost/regex.hpp>
#include <cstdlib>
#include <limits>

using namespace TimestampDateKit::oracle::source::low_level;

namespace TimestampDateKit::oracle
{

namespace
{

// int64 nanoseconds cover roughly 1677-09-21 .. 2262-04-11; two days are kept
// free on either side so a day can be added to or taken from any parsed instant
constexpr int64_t max_unix_sec = std::numeric_limits<int64_t>::max() / NS_PER_SEC - 2 * SEC_PER_DAY;

uint32_t to_uint(const boost::ssub_match &match)
{
	uint32_t value = 0;
	for (const char c : match.str())
		value = value * 10 + static_cast<uint32_t>(c - '0');
	return value;
}

} // namespace

Instant Instant::parse(std::string_view input)
{
	static const boost::regex pattern{R"(^(\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2}))"
									  R"((?:\.(\d{1,9}))?(?:(Z)|([+-])(\d{2}):(\d{2}))$)"};

	const std::string text(input);
	boost::smatch m;
	if (!boost::regex_match(text, m, pattern))
		TDK_ORACLE_THROW(exception::InvalidTimestamp, "not an RFC 3339 timestamp: \"" + text + "\"");

	const int64_t year = to_uint(m[1]);
	const uint32_t month = to_uint(m[2]);
	const uint32_t day = to_uint(m[3]);
	const uint32_t hour = to_uint(m[4]);
	const uint32_t minute = to_uint(m[5]);
	const uint32_t second = to_uint(m[6]);

	if (month < 1 || month > 12)
		TDK_ORACLE_THROW(exception::InvalidTimestamp, "month out of range: \"" + text + "\"");
	if (day < 1 || day > days_in_month(year, month))
		TDK_ORACLE_THROW(exception::InvalidTimestamp, "day out of range: \"" + text + "\"");
	if (hour > 23 || minute > 59 || second > 59)
		TDK_ORACLE_THROW(exception::InvalidTimestamp, "time out of range: \"" + text + "\"");

	int64_t fraction_ns = 0;
	if (m[7].matched) {
		const std::string digits = m[7].str();
		fraction_ns = to_uint(m[7]);
		for (size_t i = digits.size(); i < 9; ++i)
			fraction_ns *= 10;
	}

	int32_t offset = 0;
	if (!m[8].matched) {
		const uint32_t offset_hour = to_uint(m[10]);
		const uint32_t offset_minute = to_uint(m[11]);
		if (offset_hour > 23 || offset_minute > 59)
			TDK_ORACLE_THROW(exception::InvalidTimestamp,
							 "offset out of range: \"" + text + "\"");
		offset = static_cast<int32_t>(offset_hour * 3600 + offset_minute * 60);
		if (m[9].str() == "-")
			offset = -offset;
	}

	const int64_t local_sec = days_from_civil(year, month, day) * SEC_PER_DAY + hour * 3600LL +
							  minute * 60LL + second;
	const int64_t unix_sec = local_sec - offset;
	if (unix_sec > max_unix_sec || unix_sec < -max_unix_sec)
		TDK_ORACLE_THROW(exception::InvalidTimestamp,
						 "timestamp not representable in nanoseconds: \"" + text + "\"");

	return Instant{unix_sec * NS_PER_SEC + fraction_ns, offset};
}

void Instant::append_to(std::string &buffer) const
{
	// "YYYY-MM-DDTHH:MM:SS.nnnnnnnnn+hh:mm"
	std::array<char, 36> buf{};
	char *p = buf.data();

	int64_t days = floor_div(unix_ns, NS_PER_DAY);
	int64_t ns_into_day = floor_mod(unix_ns, NS_PER_DAY) + static_cast<int64_t>(offset_s) * NS_PER_SEC;
	days += floor_div(ns_into_day, NS_PER_DAY);
	ns_into_day = floor_mod(ns_into_day, NS_PER_DAY);

	const CivilDate date = civil_from_days(days);
	const TimeOfDay time = time_of_day(ns_into_day);

	p = write_digits<4>(p, static_cast<uint64_t>(date.year));
	*p++ = '-';
	p = write_digits<2>(p, date.month);
	*p++ = '-';
	p = write_digits<2>(p, date.day);
	*p++ = 'T';
	p = write_digits<2>(p, time.hour);
	*p++ = ':';
	p = write_digits<2>(p, time.minute);
	*p++ = ':';
	p = write_digits<2>(p, time.second);

	if (time.nanosecond != 0) {
		*p++ = '.';
		char *const fraction = p;
		p = write_digits<9>(p, time.nanosecond);
		while (p > fraction && p[-1] == '0') // trailing zeros are dropped
			--p;
	}

	if (offset_s == 0) {
		*p++ = 'Z';
	} else {
		const int32_t magnitude = std::abs(offset_s);
		*p++ = offset_s < 0 ? '-' : '+';
		p = write_digits<2>(p, static_cast<uint64_t>(magnitude / 3600));
		*p++ = ':';
		p = write_digits<2>(p, static_cast<uint64_t>((magnitude % 3600) / 60));
	}

	buffer.append(buf.data(), p);
}

std::string Instant::format() const
{
	std::string result;
	append_to(result);
	return result;
}

bool Instant::is_utc_midnight() const noexcept
{
	return unix_ns % NS_PER_DAY == 0;
}

Date Date::parse(std::string_view input)
{
	static const boost::regex pattern{R"(^(\d{4})-(\d{2})-(\d{2})$)"};

	const std::string text(input);
	boost::smatch m;
	if (!boost::regex_match(text, m, pattern))
		TDK_ORACLE_THROW(exception::InvalidDate, "not a YYYY-MM-DD date: \"" + text + "\"");

	const int64_t year = to_uint(m[1]);
	const uint32_t month = to_uint(m[2]);
	const uint32_t day = to_uint(m[3]);
	if (month < 1 || month > 12)
		TDK_ORACLE_THROW(exception::InvalidDate, "month out of range: \"" + text + "\"");
	if (day < 1 || day > days_in_month(year, month))
		TDK_ORACLE_THROW(exception::InvalidDate, "day out of range: \"" + text + "\"");

	const Date date{days_from_civil(year, month, day)};
	if (date.days >= max_unix_sec / SEC_PER_DAY || date.days <= -(max_unix_sec / SEC_PER_DAY))
		TDK_ORACLE_THROW(exception::InvalidDate,
						 "date not representable in nanoseconds: \"" + text + "\"");
	return date;
}

Date Date::containing(const Instant &instant) noexcept
{
	return Date{floor_div(instant.unix_ns, NS_PER_DAY)};
}

std::string Date::format() const
{
	const CivilDate date = civil_from_days(days);
	std::array<char, 10> buf{};
	char *p = buf.data();
	p = write_digits<4>(p, static_cast<uint64_t>(date.year));
	*p++ = '-';
	p = write_digits<2>(p, date.month);
	*p++ = '-';
	write_digits<2>(p, date.day);
	return std::string(buf.data(), buf.size());
}

bool is_canonical_date(std::string_view input) noexcept
{
	try {
		return Date::parse(input).format() == input;
	} catch (const exception::InvalidDate &) {
		return false;
	}
}

} // namespace TimestampDateKit::oracle
