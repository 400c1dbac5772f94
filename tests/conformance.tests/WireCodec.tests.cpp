// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/bridge/Common.hpp"
#include "TimestampDateKit/conformance/WireCodec.hpp"
#include "TimestampDateKit/oracle/Common.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace TimestampDateKit;
using namespace TimestampDateKit::conformance;
using oracle::Instant;

TEST(WireCodec, AppendRequest)
{
	std::string buffer;
	append_request(buffer, {Instant::parse("2024-07-15T00:00:00+10:00"), Instant::parse("2024-07-16T00:00:00Z")});
	EXPECT_EQ(buffer, "2024-07-15T00:00:00+10:00\t2024-07-16T00:00:00Z\n");
}

TEST(WireCodec, AppendRequestWithUnsetBounds)
{
	std::string buffer;
	append_request(buffer, {std::nullopt, Instant::parse("2024-07-16T12:00:00.5-03:00")});
	append_request(buffer, {Instant::parse("2024-07-16T12:00:00Z"), std::nullopt});
	append_request(buffer, {});
	EXPECT_EQ(buffer, "\t2024-07-16T12:00:00.5-03:00\n"
					  "2024-07-16T12:00:00Z\t\n"
					  "\t\n");
}

TEST(WireCodec, AppendRequestKeepsNanoseconds)
{
	std::string buffer;
	append_request(buffer, {Instant{1, 0}, std::nullopt});
	EXPECT_EQ(buffer, "1970-01-01T00:00:00.000000001Z\t\n");
}

TEST(WireCodec, ParseResponse)
{
	EXPECT_EQ(parse_response("2024-07-15\t2024-07-16"), (oracle::DateRange{"2024-07-15", "2024-07-16"}));
	EXPECT_EQ(parse_response("\t2024-07-16"), (oracle::DateRange{"", "2024-07-16"}));
	EXPECT_EQ(parse_response("2024-07-15\t"), (oracle::DateRange{"2024-07-15", ""}));
	EXPECT_EQ(parse_response("\t"), (oracle::DateRange{"", ""}));
}

TEST(WireCodec, ParseResponseKeepsFieldsVerbatim)
{
	// validation is up to the caller
	EXPECT_EQ(parse_response("2024-7-5\tx\ty"), (oracle::DateRange{"2024-7-5", "x\ty"}));
}

TEST(WireCodec, ParseResponseWithoutTab)
{
	EXPECT_THROW(parse_response("2024-07-15 2024-07-16"), bridge::exception::ProtocolError);
	EXPECT_THROW(parse_response(""), bridge::exception::ProtocolError);
}

TEST(WireCodec, ParseRequest)
{
	const auto range = parse_request("2024-07-15T00:00:00+10:00\t");
	ASSERT_TRUE(range.start.has_value());
	EXPECT_EQ(range.start->offset_s, 36000);
	EXPECT_EQ(range.start->format(), "2024-07-15T00:00:00+10:00");
	EXPECT_FALSE(range.end.has_value());

	EXPECT_EQ(parse_request("\t"), oracle::InstantRange{});
}

TEST(WireCodec, ParseRequestRejectsMalformed)
{
	EXPECT_THROW(parse_request("2024-07-15T00:00:00Z"), bridge::exception::ProtocolError);
	EXPECT_THROW(parse_request("yesterday\t"), oracle::exception::InvalidTimestamp);
	EXPECT_THROW(parse_request("\t2024-07-15"), oracle::exception::InvalidTimestamp);
}

TEST(WireCodec, AppendResponse)
{
	std::string buffer = "x";
	append_response(buffer, {"2024-07-15", ""});
	EXPECT_EQ(buffer, "x2024-07-15\t\n");
}

TEST(WireCodec, CodecSpeaksTheLineProtocol)
{
	const TimestampToDateCodec codec = make_timestamp_to_date_codec();
	ASSERT_TRUE(codec.append_input);
	ASSERT_TRUE(codec.split_output);
	ASSERT_TRUE(codec.parse_output);

	std::string buffer;
	codec.append_input(buffer, {Instant::parse("2024-07-15T00:00:00Z"), std::nullopt});
	EXPECT_EQ(buffer, "2024-07-15T00:00:00Z\t\n");

	const auto split = codec.split_output("2024-07-15\t\r\nrest", false);
	ASSERT_TRUE(split.record.has_value());
	EXPECT_EQ(codec.parse_output(*split.record), (oracle::DateRange{"2024-07-15", ""}));
}
