// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_CONFORMANCE_OPTIONS_HPP
#define TDK_CONFORMANCE_OPTIONS_HPP

#include <optional>
#include <string>
#include <vector>

#include "TimestampDateKit/bridge/Subprocess.hpp"

namespace TimestampDateKit::conformance
{

// environment variable read by fuzz entry points
constexpr const char *FUZZ_OPTIONS_VARIABLE = "TDK_FUZZ_OPTIONS";

/**
 * External command handed to a fuzz entry point out-of-band, as base64 of
 * {"cmd": "...", "args": ["..."], "dir": "..."}.
 */
struct Options {
	std::string cmd;
	std::vector<std::string> args;
	std::string dir;

	[[nodiscard]] bridge::Command command() const;

	friend bool operator==(const Options &, const Options &) = default;
};

// throw ConfigurationError, e.g. for an empty cmd
std::string encode_options(const Options &options);
Options decode_options(const std::string &encoded);

// nullopt if TDK_FUZZ_OPTIONS is unset or empty
std::optional<Options> options_from_environment();

} // namespace TimestampDateKit::conformance

#endif // TDK_CONFORMANCE_OPTIONS_HPP
