// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/oracle/Instant.hpp"
#include "commands/duration.hpp"
#include "commands/interface.hpp"
#include <stdexcept>
#include <string>

using namespace std::string_literals;

namespace TimestampDateKit::cmd::interface
{

// ============================================================================
// Verbosity Control Implementation
// ============================================================================

static Verbosity g_verbosity = Verbosity::normal;

Verbosity get_verbosity(void)
{
	return g_verbosity;
}

void set_verbosity(Verbosity level)
{
	g_verbosity = level;
}

// ============================================================================
// Validators Implementation
// ============================================================================

namespace validator
{

Duration::Duration(void) : CLI::Validator("DURATION")
{
	func_ = [](const std::string &input) {
		try {
			if (parse_duration_ns(input) < 0)
				return "negative duration"s;
			return std::string(); // valid
		} catch (const std::invalid_argument &e) {
			return std::string(e.what());
		} catch (const std::out_of_range &e) {
			return std::string(e.what());
		}
	};
}

Timestamp::Timestamp(void) : CLI::Validator("TIMESTAMP")
{
	func_ = [](const std::string &input) {
		if (input.empty())
			return std::string(); // unset bound
		try {
			(void)oracle::Instant::parse(input);
			return std::string();
		} catch (const oracle::exception::InvalidTimestamp &e) {
			return std::string(e.what());
		}
	};
}

Date::Date(void) : CLI::Validator("DATE")
{
	func_ = [](const std::string &input) {
		if (input.empty() || oracle::is_canonical_date(input))
			return std::string();
		return "invalid date, expected YYYY-MM-DD"s;
	};
}

} // namespace validator

} // namespace TimestampDateKit::cmd::interface
