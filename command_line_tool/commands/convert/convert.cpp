// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/oracle/Oracle.hpp"
#include "commands/external.hpp"
#include "commands/interface.hpp"
#include <iostream>
#include <optional>
#include <string>

using namespace TimestampDateKit;
using namespace TimestampDateKit::cmd::interface;

static std::string format_bound(const std::optional<oracle::Instant> &bound)
{
	return bound ? bound->format() : std::string{};
}

static void convert(const std::string &start, const std::string &end, bool to_timestamps, bool widen)
{
	if (to_timestamps) {
		const oracle::InstantRange range = oracle::date_range_to_timestamp_range(oracle::DateRange{start, end});
		std::cout << format_bound(range.start) << '\t' << format_bound(range.end) << std::endl;
		return;
	}

	oracle::InstantRange range;
	if (!start.empty())
		range.start = oracle::Instant::parse(start);
	if (!end.empty())
		range.end = oracle::Instant::parse(end);
	if (widen) {
		range = oracle::widen_range(range);
		log_verbose("widened to [", format_bound(range.start), ", ", format_bound(range.end), ")");
	}

	const oracle::DateRange dates = oracle::timestamp_range_to_date_range(range);
	std::cout << dates.start << '\t' << dates.end << std::endl;
	if (range.start && range.end && !dates.start.empty() && dates.start > dates.end)
		log_verbose("the range covers no whole UTC day, the date range is empty");
}

static void add_convert_command(CLI::App &app)
{
	CLI::App *const command =
		app.add_subcommand("convert", "Convert a range with the reference model");
	command->description(
		"Print the reference conversion of [START, END) to a UTC date range [START, END],\n"
		"or with --to-timestamps of a date range to a timestamp range.\n"
		"An empty argument (\"\") is an unset bound.");

	static std::string start;
	static std::string end;
	static bool to_timestamps = false;
	static bool widen = false;

	command->add_flag("--to-timestamps,-t", to_timestamps, "Convert a date range to a timestamp range");
	command->add_flag("--widen,-w", widen, "Widen the timestamp range to whole UTC days first");
	command->add_option("start", start, "Range start, RFC 3339 timestamp or YYYY-MM-DD date")
		->required()
		->type_name("START");
	command->add_option("end", end, "Range end, RFC 3339 timestamp or YYYY-MM-DD date")
		->required()
		->type_name("END");

	command->callback([&]() {
		const std::string error = to_timestamps ? validator::Date()(start) + validator::Date()(end)
												: validator::Timestamp()(start) + validator::Timestamp()(end);
		if (!error.empty()) {
			log_error("ERROR: ", error);
			throw CLI::RuntimeError(1);
		}
		run_guarded([&]() { convert(start, end, to_timestamps, widen); });
	});
}

static void init_function() noexcept
{
	auto [app, lock] = TimestampDateKit::cmd::interface::acquireMainApp();
	add_convert_command(app);
}
COMMAND_INIT(init_function);
