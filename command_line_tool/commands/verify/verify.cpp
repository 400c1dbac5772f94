// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/bridge/Cancellation.hpp"
#include "TimestampDateKit/bridge/ProcessBridge.hpp"
#include "TimestampDateKit/conformance/ConformanceRunner.hpp"
#include "TimestampDateKit/conformance/WireCodec.hpp"
#include "TimestampDateKit/oracle/Fixtures.hpp"
#include "commands/external.hpp"
#include "commands/interface.hpp"
#include <optional>
#include <string>

using namespace TimestampDateKit;
using namespace TimestampDateKit::cmd::interface;

static void verify(const ExternalCommand &external)
{
	const bridge::Command command = external.to_command();
	log_verbose("verifying ", command.to_string());

	bridge::CancellationSource cancel;
	std::optional<bridge::Deadline> deadline;
	if (const auto timeout = external.timeout_duration())
		deadline.emplace(cancel, *timeout);

	conformance::RunReport report;
	{
		bridge::ProcessBridge<oracle::InstantRange, oracle::DateRange> bridge(
			command, conformance::make_timestamp_to_date_codec(), cancel);
		report = conformance::run_timestamp_to_date(
			oracle::timestamp_range_values(), oracle::date_values(), oracle::example_matches(),
			[&bridge](const oracle::InstantRange &range) { return bridge.call(range); },
			make_reporter());
	}

	log_verbose("actual matches:\n", conformance::format_match_table(report.actual));

	if (!report.passed()) {
		log_error("ERROR: ", report.failures.size(), " of ", report.cases,
				  " cases do not conform, first: ", report.failures.front().message);
		throw CLI::RuntimeError(1);
	}
	log_info("all ", report.cases, " cases conform");
}

static void add_verify_command(CLI::App &app)
{
	CLI::App *const command =
		app.add_subcommand("verify", "Check an external converter against the fixture tables");
	command->description(
		"Start the external converter once and send it every fixture timestamp range,\n"
		"including the variants with one bound unset. Each returned date range is\n"
		"matched against the fixture dates and compared with the reference match table.\n"
		"Exits non-zero on the first run-level failure or if any case does not conform.");

	static ExternalCommand external;
	add_external_command_options(*command, external, true);

	command->callback([&]() { run_guarded([&]() { verify(external); }); });
}

static void init_function() noexcept
{
	auto [app, lock] = TimestampDateKit::cmd::interface::acquireMainApp();
	add_verify_command(app);
}
COMMAND_INIT(init_function);
