// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/bridge/Cancellation.hpp"
#include "TimestampDateKit/bridge/ProcessBridge.hpp"
#include "TimestampDateKit/conformance/FuzzDriver.hpp"
#include "TimestampDateKit/conformance/WireCodec.hpp"
#include "TimestampDateKit/oracle/Fixtures.hpp"
#include "commands/external.hpp"
#include "commands/interface.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>

using namespace TimestampDateKit;
using namespace TimestampDateKit::cmd::interface;

static void run_fuzz(const ExternalCommand &external, size_t iterations, std::optional<uint64_t> seed)
{
	const bridge::Command command = external.to_command();
	if (!seed)
		seed = std::random_device{}();
	log_info("fuzzing ", command.to_string(), " with seed ", *seed);

	bridge::CancellationSource cancel;
	std::optional<bridge::Deadline> deadline;
	if (const auto timeout = external.timeout_duration())
		deadline.emplace(cancel, *timeout);

	const auto seeds = conformance::seed_corpus(oracle::timestamp_range_values(), oracle::date_values());

	bridge::ProcessBridge<oracle::InstantRange, oracle::DateRange> bridge(
		command, conformance::make_timestamp_to_date_codec(), cancel);
	const conformance::FuzzReport report = conformance::fuzz(
		seeds, [&bridge](const oracle::InstantRange &range) { return bridge.call(range); }, iterations,
		*seed, make_reporter());
	log_info("no failure in ", report.checked, " checked cases (", report.skipped, " skipped, seed ", *seed,
			 ")");
}

static void add_fuzz_command(CLI::App &app)
{
	CLI::App *const command =
		app.add_subcommand("fuzz", "Fuzz an external converter against the conversion properties");
	command->description(
		"Check the seed corpus derived from the fixtures, with every combination of\n"
		"representative UTC offsets, then random mutations of it. Stops at the first\n"
		"case violating a property and prints it.");

	static size_t iterations = 100000;
	command->add_option("--iterations,-n", iterations, "Number of random cases after the seed corpus")
		->capture_default_str()
		->type_name("N");

	static std::optional<uint64_t> seed;
	command->add_option("--seed", seed, "Random seed (default: random, printed at start)")
		->type_name("SEED");

	static ExternalCommand external;
	add_external_command_options(*command, external, true);

	command->callback([&]() { run_guarded([&]() { run_fuzz(external, iterations, seed); }); });
}

static void init_function() noexcept
{
	auto [app, lock] = TimestampDateKit::cmd::interface::acquireMainApp();
	add_fuzz_command(app);
}
COMMAND_INIT(init_function);
