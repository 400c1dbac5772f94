// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/external.hpp"
#include "commands/duration.hpp"

#include <exception>

namespace TimestampDateKit::cmd::interface
{

bridge::Command ExternalCommand::to_command() const
{
	bridge::Command result;
	if (!command.empty()) {
		result.executable = command.front();
		result.args.assign(command.begin() + 1, command.end());
	}
	result.directory = directory;
	return result;
}

std::optional<std::chrono::nanoseconds> ExternalCommand::timeout_duration() const
{
	if (timeout.empty())
		return std::nullopt;
	const auto duration = parse_duration(timeout);
	if (duration.count() <= 0)
		return std::nullopt;
	return duration;
}

void add_external_command_options(CLI::App &command, ExternalCommand &external, bool with_timeout)
{
	command.add_option("-C,--directory", external.directory, "Working directory of the external command")
		->check(CLI::ExistingDirectory)
		->type_name("DIR");

	if (with_timeout) {
		command
			.add_option("--timeout", external.timeout,
						 "Abort the run after this duration (0: no timeout).\n"
						 "Duration suffixes: ns, us, ms, s, m, h")
			->envname("TDK_TIMEOUT")
			->check(validator::Duration())
			->type_name("DURATION");
	}

	command
		.add_option("command", external.command,
					"External converter and its arguments, after \"--\".\n"
					"It reads \"<start>\\t<end>\" lines of RFC 3339 timestamps from stdin\n"
					"and writes \"<start date>\\t<end date>\" lines to stdout.")
		->required()
		->expected(1, -1)
		->type_name("COMMAND...");
}

conformance::Reporter make_reporter(void)
{
	return [](conformance::Level level, const std::string &message) {
		switch (level) {
		case conformance::Level::info:
			log_info(message);
			break;
		case conformance::Level::verbose:
			log_verbose(message);
			break;
		case conformance::Level::error:
			log_error(message);
			break;
		}
	};
}

void run_guarded(const std::function<void()> &body)
{
	try {
		body();
	} catch (const CLI::Error &) {
		throw;
	} catch (const std::exception &e) {
		log_error("ERROR: ", e.what());
		throw CLI::RuntimeError(1);
	}
}

} // namespace TimestampDateKit::cmd::interface
