// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/conformance/Common.hpp"
#include "TimestampDateKit/conformance/Options.hpp"
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace TimestampDateKit::conformance;

TEST(Options, Encode)
{
	EXPECT_EQ(encode_options({"cat", {}, ""}), "eyJjbWQiOiJjYXQiLCJhcmdzIjpbXSwiZGlyIjoiIn0=");
	EXPECT_EQ(encode_options({"a", {"-v"}, "/tmp"}), "eyJjbWQiOiJhIiwiYXJncyI6WyItdiJdLCJkaXIiOiIvdG1wIn0=");
}

TEST(Options, EncodeRejectsEmptyCommand)
{
	EXPECT_THROW(encode_options({"", {"x"}, "/tmp"}), exception::ConfigurationError);
}

TEST(Options, Decode)
{
	EXPECT_EQ(decode_options("eyJjbWQiOiJhIiwiYXJncyI6WyItdiJdLCJkaXIiOiIvdG1wIn0="),
			  (Options{"a", {"-v"}, "/tmp"}));
	// dir is optional
	EXPECT_EQ(decode_options("eyJjbWQiOiJnbyIsImFyZ3MiOlsicnVuIiwiLiJdfQ=="), (Options{"go", {"run", "."}, ""}));
}

TEST(Options, RoundTripKeepsSpecialCharacters)
{
	const Options options{"/usr/bin/env", {"sh", "-c", "printf '%s\\t\\n' \"quoted\"", "\xc3\xa9"}, "/tmp/with space"};
	EXPECT_EQ(decode_options(encode_options(options)), options);
	for (const size_t n : {1, 2, 3}) {
		const Options padded{std::string(n, 'x'), {}, ""};
		EXPECT_EQ(decode_options(encode_options(padded)), padded);
	}
}

TEST(Options, Command)
{
	const auto command = Options{"go", {"run", "."}, "/src"}.command();
	EXPECT_EQ(command.executable, "go");
	EXPECT_EQ(command.args, (std::vector<std::string>{"run", "."}));
	EXPECT_EQ(command.directory.string(), "/src");
}

TEST(Options, DecodeRejectsMalformedInput)
{
	EXPECT_THROW(decode_options(""), exception::ConfigurationError);
	EXPECT_THROW(decode_options("eyJ"), exception::ConfigurationError);
	EXPECT_THROW(decode_options("eyJ!"), exception::ConfigurationError);
	EXPECT_THROW(decode_options("bm90IGpzb24="), exception::ConfigurationError);			 // not json
	EXPECT_THROW(decode_options("WzEsMl0="), exception::ConfigurationError);				 // [1,2]
	EXPECT_THROW(decode_options("eyJjbWQiOiIifQ=="), exception::ConfigurationError);		 // {"cmd":""}
	EXPECT_THROW(decode_options("eyJjbWQiOiJ4IiwiYXJncyI6WzFdfQ=="), exception::ConfigurationError); // args [1]
}

// ============================================================================
// environment
// ============================================================================

TEST(Options, FromEnvironment)
{
	::unsetenv(FUZZ_OPTIONS_VARIABLE);
	EXPECT_EQ(options_from_environment(), std::nullopt);

	::setenv(FUZZ_OPTIONS_VARIABLE, "", 1);
	EXPECT_EQ(options_from_environment(), std::nullopt);

	const Options options{"cat", {}, "/"};
	::setenv(FUZZ_OPTIONS_VARIABLE, encode_options(options).c_str(), 1);
	EXPECT_EQ(options_from_environment(), options);

	::setenv(FUZZ_OPTIONS_VARIABLE, "garbage", 1);
	EXPECT_THROW(options_from_environment(), exception::ConfigurationError);
	::unsetenv(FUZZ_OPTIONS_VARIABLE);
}
