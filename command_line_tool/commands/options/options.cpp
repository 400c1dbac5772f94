// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/conformance/Options.hpp"
#include "commands/external.hpp"
#include "commands/interface.hpp"
#include <filesystem>
#include <iostream>
#include <string>

using namespace TimestampDateKit;
using namespace TimestampDateKit::cmd::interface;

static void print_options(const ExternalCommand &external)
{
	conformance::Options options;
	options.cmd = external.command.front();
	options.args.assign(external.command.begin() + 1, external.command.end());
	options.dir = external.directory.empty() ? std::filesystem::current_path().string()
											 : std::filesystem::absolute(external.directory).string();
	std::cout << conformance::encode_options(options) << std::endl;
}

static void add_options_command(CLI::App &app)
{
	CLI::App *const command =
		app.add_subcommand("options", "Print the fuzz configuration for an external converter");
	command->description(
		"Encode the external converter as the value of TDK_FUZZ_OPTIONS, which configures\n"
		"the fuzz entry points that take no command line arguments, e.g.\n"
		"  TDK_FUZZ_OPTIONS=$(tdk options -- ./converter) ./tdk_fuzz_timestamp_to_date");

	static ExternalCommand external;
	add_external_command_options(*command, external, false);

	command->callback([&]() { run_guarded([&]() { print_options(external); }); });
}

static void init_function() noexcept
{
	auto [app, lock] = TimestampDateKit::cmd::interface::acquireMainApp();
	add_options_command(app);
}
COMMAND_INIT(init_function);
