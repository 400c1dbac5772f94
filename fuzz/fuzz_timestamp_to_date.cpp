// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

// libFuzzer entry point checking an external converter. The converter is
// configured through TDK_FUZZ_OPTIONS (see "tdk options"); without it the
// fuzzer exits immediately.

#include "TimestampDateKit/bridge/ProcessBridge.hpp"
#include "TimestampDateKit/conformance/FuzzDriver.hpp"
#include "TimestampDateKit/conformance/Options.hpp"
#include "TimestampDateKit/conformance/WireCodec.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>

using namespace TimestampDateKit;

using Bridge = bridge::ProcessBridge<oracle::InstantRange, oracle::DateRange>;

static std::unique_ptr<Bridge> g_bridge;

extern "C" int LLVMFuzzerInitialize(int * /*argc*/, char *** /*argv*/)
{
	try {
		const auto options = conformance::options_from_environment();
		if (!options) {
			std::cerr << conformance::FUZZ_OPTIONS_VARIABLE << " is not set, skipping" << std::endl;
			std::exit(0);
		}
		g_bridge = std::make_unique<Bridge>(options->command(), conformance::make_timestamp_to_date_codec());
	} catch (const std::exception &e) {
		std::cerr << "ERROR: " << e.what() << std::endl;
		std::exit(1);
	}
	return 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
	const conformance::FuzzCase fuzz_case = conformance::decode_fuzz_case(data, size);
	try {
		conformance::check_case(fuzz_case, [](const oracle::InstantRange &range) { return g_bridge->call(range); });
	} catch (const conformance::exception::AssertionFailure &e) {
		std::cerr << e.what() << std::endl;
		std::abort(); // reported as a crash, the input is saved
	} catch (const bridge::exception::Exception &e) {
		std::cerr << "ERROR: " << e.what() << std::endl;
		std::exit(1);
	}
	return 0;
}
