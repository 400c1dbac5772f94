// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

// An external converter speaking the line protocol, backed by the oracle.
// --naive truncates the start bound instead of rounding it up.

#include "CLI/App.hpp"
#include "CLI/Config.hpp"
#include "CLI/Formatter.hpp"
#include "TimestampDateKit/conformance/WireCodec.hpp"
#include "TimestampDateKit/oracle/Oracle.hpp"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace TimestampDateKit;

static oracle::DateRange naive_timestamp_range_to_date_range(const oracle::InstantRange &range)
{
	oracle::DateRange result = oracle::timestamp_range_to_date_range(range);
	if (range.start)
		result.start = oracle::Date::containing(range.start->utc()).format();
	return result;
}

int main(int argc, char **argv)
{
	CLI::App app{"Reference timestamp range to date range converter"};
	bool naive = false;
	app.add_flag("--naive", naive, "Truncate the start bound instead of rounding it up");
	uint64_t exit_after = 0;
	app.add_option("--exit-after", exit_after, "Exit cleanly after this many requests (0: never)");
	CLI11_PARSE(app, argc, argv);

	std::ios::sync_with_stdio(false);
	const oracle::TimestampToDate convert =
		naive ? naive_timestamp_range_to_date_range : oracle::timestamp_range_to_date_range;

	std::string line;
	std::string response;
	uint64_t handled = 0;
	while (std::getline(std::cin, line)) {
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		try {
			response.clear();
			conformance::append_response(response, convert(conformance::parse_request(line)));
		} catch (const std::exception &e) {
			std::cerr << "ERROR: " << e.what() << std::endl;
			return 1;
		}
		std::cout << response << std::flush;
		if (exit_after != 0 && ++handled == exit_after)
			break;
	}
	return 0;
}
