// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/duration.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace TimestampDateKit::cmd::interface
{

namespace
{

constexpr std::array<std::pair<std::string_view, int64_t>, 6> units{{
	{"ns", 1LL},
	{"us", 1'000LL},
	{"ms", 1'000'000LL},
	{"s", 1'000'000'000LL},
	{"m", 60LL * 1'000'000'000LL},
	{"h", 3600LL * 1'000'000'000LL},
}};

int64_t unit_ns(std::string_view suffix, std::string_view input)
{
	if (suffix.empty())
		return 1'000'000'000LL;
	for (const auto &[name, ns] : units)
		if (name == suffix)
			return ns;
	throw std::invalid_argument("Unknown duration suffix \"" + std::string(suffix) + "\" in \"" +
								std::string(input) + "\"");
}

} // namespace

int64_t parse_duration_ns(std::string_view input)
{
	if (input.empty())
		throw std::invalid_argument("Empty duration string");

	const size_t digits_end = std::min(input.find_first_not_of("0123456789."), input.size());
	const std::string number(input.substr(0, digits_end));
	const int64_t multiplier = unit_ns(input.substr(digits_end), input);

	if (number.empty() || number == ".")
		throw std::invalid_argument("No numeric value in duration: " + std::string(input));

	double value = 0;
	size_t consumed = 0;
	try {
		value = std::stod(number, &consumed);
	} catch (const std::out_of_range &) {
		throw std::invalid_argument("Duration out of range: " + std::string(input));
	}
	if (consumed != number.size())
		throw std::invalid_argument("Malformed duration: " + std::string(input));

	const double ns = value * static_cast<double>(multiplier);
	if (!std::isfinite(ns) || ns >= static_cast<double>(std::numeric_limits<int64_t>::max()))
		throw std::invalid_argument("Duration out of range: " + std::string(input));
	return static_cast<int64_t>(ns);
}

} // namespace TimestampDateKit::cmd::interface
