// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/bridge/Cancellation.hpp"
#include "TimestampDateKit/bridge/Common.hpp"
#include "TimestampDateKit/bridge/ProcessBridge.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace TimestampDateKit::bridge;
using namespace std::chrono_literals;

using LineBridge = ProcessBridge<std::string, std::string>;

static Codec<std::string, std::string> line_codec()
{
	Codec<std::string, std::string> codec;
	codec.append_input = [](std::string &buffer, const std::string &input) {
		buffer += input;
		buffer += '\n';
	};
	codec.parse_output = [](std::string_view record) {
		if (record == "bad")
			throw std::runtime_error("bad record");
		return std::string(record);
	};
	return codec;
}

static const Command cat{"cat", {}, {}};
static const Command sleeper{"sleep", {"30"}, {}};

template <typename Error> static std::string expect_call_throws(LineBridge &bridge, const std::string &input)
{
	try {
		bridge.call(input);
	} catch (const Error &e) {
		return e.what();
	} catch (const std::exception &e) {
		ADD_FAILURE() << "unexpected exception: " << e.what();
		return {};
	}
	ADD_FAILURE() << "call returned";
	return {};
}

TEST(BridgeState, ToString)
{
	EXPECT_STREQ(to_string(BridgeState::Starting), "starting");
	EXPECT_STREQ(to_string(BridgeState::Running), "running");
	EXPECT_STREQ(to_string(BridgeState::Completed), "completed");
	EXPECT_STREQ(to_string(BridgeState::Failed), "failed");
	EXPECT_STREQ(to_string(BridgeState::Cancelled), "cancelled");
}

// ============================================================================
// request/response
// ============================================================================

TEST(ProcessBridge, EchoesThroughCat)
{
	LineBridge bridge(cat, line_codec());
	EXPECT_EQ(bridge.state(), BridgeState::Running);
	EXPECT_EQ(bridge.call("hello"), "hello");
	EXPECT_EQ(bridge.call(""), "");
	EXPECT_EQ(bridge.call("world"), "world");
	EXPECT_EQ(bridge.state(), BridgeState::Running);
	EXPECT_EQ(bridge.cause(), nullptr);
}

TEST(ProcessBridge, ManySequentialCalls)
{
	LineBridge bridge(cat, line_codec());
	for (int i = 0; i < 2000; ++i)
		ASSERT_EQ(bridge.call(std::to_string(i)), std::to_string(i));
}

TEST(ProcessBridge, CallsFromSeveralThreadsAreSerialized)
{
	LineBridge bridge(cat, line_codec());
	std::vector<std::thread> threads;
	for (int t = 0; t < 4; ++t) {
		threads.emplace_back([&bridge, t] {
			for (int i = 0; i < 200; ++i) {
				const std::string request = std::to_string(t) + ":" + std::to_string(i);
				EXPECT_EQ(bridge.call(request), request);
			}
		});
	}
	for (auto &thread : threads)
		thread.join();
}

TEST(ProcessBridge, LargeRecords)
{
	LineBridge bridge(cat, line_codec());
	const std::string request(50000, 'q');
	EXPECT_EQ(bridge.call(request), request);
}

TEST(ProcessBridge, CommandAnsweringTwicePerRequest)
{
	// every second response is already queued, so call returns before the input pump took the request
	LineBridge bridge({"sh", {"-c", "while read l; do printf '%s\\n%s\\n' \"$l\" \"$l\"; done"}, {}},
					  line_codec());
	std::vector<std::string> requests;
	for (int i = 0; i < 3000; ++i)
		requests.push_back(std::string(i % 3 == 0 ? 20 : i % 3 == 1 ? 200 : 2000, static_cast<char>('a' + i % 26)));
	for (size_t i = 0; i < requests.size(); ++i)
		ASSERT_EQ(bridge.call(requests[i]), requests[i / 2]) << "call " << i;
	EXPECT_EQ(bridge.state(), BridgeState::Running);
}

TEST(ProcessBridge, CustomSplitFunction)
{
	auto codec = line_codec();
	codec.append_input = [](std::string &buffer, const std::string &input) {
		buffer += input;
		buffer += ';';
	};
	codec.split_output = [](std::string_view data, bool) -> SplitResult {
		if (const auto pos = data.find(';'); pos != std::string_view::npos)
			return {pos + 1, data.substr(0, pos)};
		return {};
	};
	LineBridge bridge(cat, std::move(codec));
	EXPECT_EQ(bridge.call("a"), "a");
	EXPECT_EQ(bridge.call("bc"), "bc");
}

// ============================================================================
// failures
// ============================================================================

TEST(ProcessBridge, MissingExecutableFails)
{
	LineBridge bridge({"tdk-no-such-command", {}, {}}, line_codec());
	EXPECT_EQ(bridge.state(), BridgeState::Failed);
	const auto message = expect_call_throws<exception::ProcessError>(bridge, "x");
	EXPECT_NE(message.find("cannot execute"), std::string::npos) << message;
}

TEST(ProcessBridge, UnparseableOutputFails)
{
	LineBridge bridge(cat, line_codec());
	const auto message = expect_call_throws<exception::ProtocolError>(bridge, "bad");
	EXPECT_NE(message.find("bad record"), std::string::npos) << message;
	EXPECT_EQ(bridge.state(), BridgeState::Failed);
	// terminal, the same cause is rethrown
	expect_call_throws<exception::ProtocolError>(bridge, "good");
}

TEST(ProcessBridge, OversizedRecordFails)
{
	LineBridge bridge(cat, line_codec());
	expect_call_throws<exception::ProtocolError>(bridge, std::string(RecordScanner::MAX_RECORD_SIZE + 10, 'x'));
	EXPECT_EQ(bridge.state(), BridgeState::Failed);
}

TEST(ProcessBridge, FailingCommand)
{
	LineBridge bridge({"false", {}, {}}, line_codec());
	expect_call_throws<exception::ProcessError>(bridge, "x");
	EXPECT_EQ(bridge.state(), BridgeState::Failed);
}

TEST(ProcessBridge, CommandExitingNormallyCompletes)
{
	LineBridge bridge({"sh", {"-c", "read line; exit 0"}, {}}, line_codec());
	const auto message = expect_call_throws<exception::ProcessError>(bridge, "x");
	EXPECT_NE(message.find("external command exited"), std::string::npos) << message;
	EXPECT_EQ(bridge.state(), BridgeState::Completed);
}

TEST(ProcessBridge, CommandKilledBySignal)
{
	LineBridge bridge({"sh", {"-c", "read line; kill -9 $$"}, {}}, line_codec());
	const auto message = expect_call_throws<exception::ProcessError>(bridge, "x");
	EXPECT_NE(message.find("killed by signal 9"), std::string::npos) << message;
	EXPECT_EQ(bridge.state(), BridgeState::Failed);
}

TEST(ProcessBridge, EncoderExceptionPropagates)
{
	auto codec = line_codec();
	codec.append_input = [](std::string &, const std::string &) { throw std::invalid_argument("cannot encode"); };
	LineBridge bridge(cat, std::move(codec));
	EXPECT_THROW(bridge.call("x"), std::invalid_argument);
	EXPECT_EQ(bridge.state(), BridgeState::Running);
}

// ============================================================================
// cancellation
// ============================================================================

TEST(ProcessBridge, CancelUnblocksPendingCall)
{
	LineBridge bridge(sleeper, line_codec());
	std::thread canceller([&bridge] {
		std::this_thread::sleep_for(50ms);
		bridge.cancel();
	});
	const auto begin = std::chrono::steady_clock::now();
	expect_call_throws<exception::CancellationError>(bridge, "x");
	EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);
	canceller.join();
	EXPECT_EQ(bridge.state(), BridgeState::Cancelled);
}

TEST(ProcessBridge, CancelWithCause)
{
	LineBridge bridge(cat, line_codec());
	bridge.cancel(std::make_exception_ptr(std::runtime_error("stop here")));
	EXPECT_THROW(bridge.call("x"), std::runtime_error);
	EXPECT_EQ(bridge.state(), BridgeState::Cancelled);
	EXPECT_TRUE(bridge.token().stop_requested());
}

TEST(ProcessBridge, FirstTerminalCauseWins)
{
	LineBridge bridge(cat, line_codec());
	bridge.cancel();
	bridge.cancel(std::make_exception_ptr(std::runtime_error("later")));
	expect_call_throws<exception::CancellationError>(bridge, "x");
	EXPECT_EQ(bridge.state(), BridgeState::Cancelled);
}

TEST(ProcessBridge, DeadlineOnParentSource)
{
	CancellationSource parent;
	Deadline deadline(parent, 100ms);
	LineBridge bridge(sleeper, line_codec(), parent);
	const auto message = expect_call_throws<exception::CancellationError>(bridge, "x");
	EXPECT_NE(message.find("timeout after 100ms"), std::string::npos) << message;
	EXPECT_EQ(bridge.state(), BridgeState::Cancelled);
}

TEST(ProcessBridge, ParentStopToken)
{
	std::stop_source parent;
	LineBridge bridge(sleeper, line_codec(), parent.get_token());
	std::thread stopper([&parent] {
		std::this_thread::sleep_for(50ms);
		parent.request_stop();
	});
	expect_call_throws<exception::CancellationError>(bridge, "x");
	stopper.join();
	EXPECT_EQ(bridge.state(), BridgeState::Cancelled);
}

TEST(ProcessBridge, ParentAlreadyStopped)
{
	std::stop_source parent;
	parent.request_stop();
	LineBridge bridge(cat, line_codec(), parent.get_token());
	EXPECT_EQ(bridge.state(), BridgeState::Cancelled);
	expect_call_throws<exception::CancellationError>(bridge, "x");
}

TEST(ProcessBridge, BridgeFailureDoesNotCancelParent)
{
	CancellationSource parent;
	{
		LineBridge bridge({"false", {}, {}}, line_codec(), parent);
		expect_call_throws<exception::ProcessError>(bridge, "x");
	}
	EXPECT_FALSE(parent.cancelled());
}

TEST(ProcessBridge, DestructorStopsRunningCommand)
{
	const auto begin = std::chrono::steady_clock::now();
	{
		LineBridge bridge(sleeper, line_codec());
		EXPECT_EQ(bridge.state(), BridgeState::Running);
	}
	EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);
}

TEST(ProcessBridge, CancelWhileInputPumpIsBlocked)
{
	const auto begin = std::chrono::steady_clock::now();
	{
		LineBridge bridge(sleeper, line_codec());
		std::thread caller([&bridge] {
			// larger than the pipe buffer, sleep never reads it
			expect_call_throws<exception::CancellationError>(bridge, std::string(1024 * 1024, 'x'));
		});
		std::this_thread::sleep_for(50ms);
		bridge.cancel();
		caller.join();
	}
	EXPECT_LT(std::chrono::steady_clock::now() - begin, 10s);
}

// ============================================================================
// run
// ============================================================================

TEST(run, ScopesBridgeToFunction)
{
	const auto result = run(cat, line_codec(), {}, [](std::stop_token token, auto call) {
		EXPECT_FALSE(token.stop_requested());
		return call("a") + call("b");
	});
	EXPECT_EQ(result, "ab");
}

TEST(run, PropagatesBridgeErrors)
{
	EXPECT_THROW(run(Command{"false", {}, {}}, line_codec(), {},
					 [](std::stop_token, auto call) { return call("x"); }),
				 exception::ProcessError);
}
