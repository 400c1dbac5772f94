// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_CMD_DURATION_HPP
#define TDK_CMD_DURATION_HPP

#include <chrono>
#include <cstdint>
#include <string_view>

namespace TimestampDateKit::cmd::interface
{

/**
 * Parses a duration such as "30s", "1.5m" or "250ms".
 *
 * Duration suffixes:
 *   - ns  - nanoseconds
 *   - us  - microseconds
 *   - ms  - milliseconds
 *   - s   - seconds (default)
 *   - m   - minutes
 *   - h   - hours
 *
 * Throws std::invalid_argument for malformed input.
 */
int64_t parse_duration_ns(std::string_view input);

inline std::chrono::nanoseconds parse_duration(std::string_view input)
{
	return std::chrono::nanoseconds(parse_duration_ns(input));
}

} // namespace TimestampDateKit::cmd::interface

#endif // TDK_CMD_DURATION_HPP
