// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/bridge/Cancellation.hpp"
#include "TimestampDateKit/bridge/Common.hpp"
#include "TimestampDateKit/bridge/ProcessBridge.hpp"
#include "TimestampDateKit/conformance/ConformanceRunner.hpp"
#include "TimestampDateKit/conformance/FuzzDriver.hpp"
#include "TimestampDateKit/conformance/Options.hpp"
#include "TimestampDateKit/conformance/WireCodec.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace TimestampDateKit;
using namespace TimestampDateKit::conformance;

using ConverterBridge = bridge::ProcessBridge<oracle::InstantRange, oracle::DateRange>;

static bridge::Command reference_converter(std::vector<std::string> args = {})
{
	return bridge::Command{TDK_REFERENCE_CONVERTER_PATH, std::move(args), {}};
}

static oracle::TimestampToDate through(ConverterBridge &bridge)
{
	return [&bridge](const oracle::InstantRange &range) { return bridge.call(range); };
}

// ============================================================================
// conformance run against the reference converter
// ============================================================================

TEST(EndToEnd, ReferenceConverterPasses)
{
	ConverterBridge bridge(reference_converter(), make_timestamp_to_date_codec());
	const auto report = run_timestamp_to_date(oracle::timestamp_range_values(), oracle::date_values(),
											  oracle::example_matches(), through(bridge));
	EXPECT_TRUE(report.passed()) << report.failures.front().message;
	EXPECT_EQ(bridge.state(), bridge::BridgeState::Running);
}

TEST(EndToEnd, NaiveConverterFails)
{
	ConverterBridge bridge(reference_converter({"--naive"}), make_timestamp_to_date_codec());
	const auto report = run_timestamp_to_date(oracle::timestamp_range_values(), oracle::date_values(),
											  oracle::example_matches(), through(bridge));
	EXPECT_FALSE(report.passed());
	EXPECT_EQ(bridge.state(), bridge::BridgeState::Running);
}

TEST(EndToEnd, ConverterExitingEarlyAbortsTheRun)
{
	ConverterBridge bridge(reference_converter({"--exit-after", "3"}), make_timestamp_to_date_codec());
	EXPECT_THROW(run_timestamp_to_date(oracle::timestamp_range_values(), oracle::date_values(),
									   oracle::example_matches(), through(bridge)),
				 bridge::exception::ProcessError);
	// a request written after the exit breaks the pipe before the exit is seen
	const auto state = bridge.state();
	EXPECT_TRUE(state == bridge::BridgeState::Completed || state == bridge::BridgeState::Failed)
		<< bridge::to_string(state);
}

TEST(EndToEnd, DeadlineCancelsTheRun)
{
	bridge::CancellationSource source;
	bridge::Deadline deadline(source, std::chrono::milliseconds(1));
	ConverterBridge bridge(reference_converter(), make_timestamp_to_date_codec(), source);
	const auto seeds = seed_corpus(oracle::timestamp_range_values(), oracle::date_values());
	EXPECT_THROW(fuzz(seeds, through(bridge), 1000000, 1), bridge::exception::CancellationError);
	EXPECT_EQ(bridge.state(), bridge::BridgeState::Cancelled);
}

// ============================================================================
// fuzzing through the bridge
// ============================================================================

TEST(EndToEnd, FuzzReferenceConverter)
{
	ConverterBridge bridge(reference_converter(), make_timestamp_to_date_codec());
	const auto report = fuzz({}, through(bridge), 2000, 99);
	EXPECT_GT(report.checked, 0u);
}

TEST(EndToEnd, FuzzNaiveConverter)
{
	ConverterBridge bridge(reference_converter({"--naive"}), make_timestamp_to_date_codec());
	const auto seeds = seed_corpus(oracle::timestamp_range_values(), oracle::date_values());
	EXPECT_THROW(fuzz(seeds, through(bridge), 1000, 1), exception::AssertionFailure);
}

// Runs the command named by TDK_FUZZ_OPTIONS, like the fuzz entry point does.
TEST(EndToEnd, FuzzCommandFromEnvironment)
{
	const auto options = options_from_environment();
	if (!options)
		GTEST_SKIP() << FUZZ_OPTIONS_VARIABLE << " is not set";
	ConverterBridge bridge(options->command(), make_timestamp_to_date_codec());
	const auto seeds = seed_corpus(oracle::timestamp_range_values(), oracle::date_values());
	const auto report = fuzz(seeds, through(bridge), 10000, 7);
	EXPECT_GT(report.checked, 0u);
}
