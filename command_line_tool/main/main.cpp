// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/version.gen.h"
#include "commands/interface.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

using namespace TimestampDateKit::cmd::interface;

static void set_quiet(void)
{
	set_verbosity(Verbosity::quiet);
}

static void set_verbose(void)
{
	set_verbosity(Verbosity::verbose);
}

static void print_version(void)
{
	std::cout << "Timestamp Date Kit " TDK_VERSION_STR << std::endl;
}

static std::unique_ptr<CLI::App> createMainApp(void)
{
	auto app = std::make_unique<CLI::App>();
	app->name("tdk");
	app->description("Timestamp Date Kit - verifies external timestamp range to date range "
					 "converters against a reference model");

	auto *const quiet = app->add_flag_callback(
		"--quiet,-q", set_quiet, "Quiet mode: only show error messages, hide info and progress");

	auto *const verbose = app->add_flag_callback(
		"--verbose,-v", set_verbose, "Verbose mode: show every case and the actual match table");

	quiet->excludes(verbose);

	auto *const version =
		app->add_flag_callback("-V,--version", print_version, "Print version information and exit");

	version->excludes(quiet);
	version->excludes(verbose);

	app->require_subcommand(0, 1);

	return app;
}

TimestampDateKit::cmd::interface::MainAppHandle TimestampDateKit::cmd::interface::acquireMainApp(void)
{
	static auto mainApp = createMainApp();
	static std::mutex mainAppLock{};
	return {*mainApp, std::unique_lock{mainAppLock}};
}

void call_all_init_functions(void)
{
	extern init_fn __start_tdk_cmdinit;
	extern init_fn __stop_tdk_cmdinit;
	for (init_fn *p = &__start_tdk_cmdinit; p < &__stop_tdk_cmdinit; p++) {
		(*p)();
	}
}

int main(int argc, const char **argv)
{
	call_all_init_functions();
	auto [app, lock] = acquireMainApp();
	if (argc == 1) {
		std::cout << app.help() << std::endl;
		return 0;
	}
	CLI11_PARSE(app, argc, argv)
}
