// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef _tdk_cmd_interface_HEADER__
#define _tdk_cmd_interface_HEADER__

#include "CLI/App.hpp"		  // IWYU pragma: export
#include "CLI/Config.hpp"	  // IWYU pragma: export
#include "CLI/Formatter.hpp"  // IWYU pragma: export
#include "CLI/Validators.hpp" // IWYU pragma: export
#include <CLI/Error.hpp>	  // IWYU pragma: export
#include <CLI/Option.hpp>	  // IWYU pragma: export

#include <iostream>
#include <mutex>
#include <string>
#include <utility>

typedef void (*init_fn)(void);
#define COMMAND_INIT(func) \
	__attribute__((retain, used, section("tdk_cmdinit"))) static init_fn _init_##func##_ptr = func

namespace TimestampDateKit::cmd::interface
{
using MainAppHandle = std::pair<CLI::App &, std::unique_lock<std::mutex>>;
MainAppHandle acquireMainApp(void);

enum class Verbosity { quiet, normal, verbose };

Verbosity get_verbosity(void);
void set_verbosity(Verbosity level);

inline bool is_verbose(void)
{
	return get_verbosity() == Verbosity::verbose;
}

inline bool is_quiet(void)
{
	return get_verbosity() == Verbosity::quiet;
}

template <typename... Args> void log_info(Args &&...args) // hidden in quiet mode
{
	if (!is_quiet()) {
		(std::cout << ... << std::forward<Args>(args)) << std::endl;
	}
}

template <typename... Args> void log_verbose(Args &&...args) // only in verbose mode
{
	if (is_verbose()) {
		(std::cout << ... << std::forward<Args>(args)) << std::endl;
	}
}

template <typename... Args> void log_error(Args &&...args) // always shown
{
	(std::cerr << ... << std::forward<Args>(args)) << std::endl;
}

namespace validator
{
// duration with ns, us, ms, s, m or h suffix
struct Duration : public CLI::Validator {
	Duration(void);
};

// RFC 3339 timestamp, or empty for an unset bound
struct Timestamp : public CLI::Validator {
	Timestamp(void);
};

// YYYY-MM-DD, or empty for an unset bound
struct Date : public CLI::Validator {
	Date(void);
};

} // namespace validator

} // namespace TimestampDateKit::cmd::interface

#endif
