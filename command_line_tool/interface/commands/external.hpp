// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_CMD_EXTERNAL_HPP
#define TDK_CMD_EXTERNAL_HPP

#include "TimestampDateKit/bridge/Subprocess.hpp"
#include "TimestampDateKit/conformance/Common.hpp"
#include "commands/interface.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace TimestampDateKit::cmd::interface
{

// The external command under test, given after "--".
struct ExternalCommand {
	std::vector<std::string> command; // executable followed by its arguments
	std::string directory;			  // empty: current working directory
	std::string timeout;			  // empty: no timeout

	[[nodiscard]] bridge::Command to_command() const;
	[[nodiscard]] std::optional<std::chrono::nanoseconds> timeout_duration() const;
};

// -C/--directory and the trailing command; --timeout if with_timeout
void add_external_command_options(CLI::App &command, ExternalCommand &external, bool with_timeout);

// forwards library reports to log_info, log_verbose and log_error
conformance::Reporter make_reporter(void);

// Runs a command body. Exceptions are reported as "ERROR: ..." and turned
// into exit code 1.
void run_guarded(const std::function<void()> &body);

} // namespace TimestampDateKit::cmd::interface

#endif // TDK_CMD_EXTERNAL_HPP
