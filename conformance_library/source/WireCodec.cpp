// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/conformance/WireCodec.hpp"
#include "TimestampDateKit/bridge/Common.hpp"

namespace TimestampDateKit::conformance
{

static std::pair<std::string_view, std::string_view> split_tab(std::string_view record)
{
	const auto tab = record.find('\t');
	if (tab == std::string_view::npos)
		TDK_BRIDGE_THROW(bridge::exception::ProtocolError,
						 "malformed output, expected two TAB separated fields: \"" +
							 std::string(record) + "\"");
	return {record.substr(0, tab), record.substr(tab + 1)};
}

void append_request(std::string &buffer, const oracle::InstantRange &range)
{
	if (range.start)
		range.start->append_to(buffer);
	buffer += '\t';
	if (range.end)
		range.end->append_to(buffer);
	buffer += '\n';
}

oracle::DateRange parse_response(std::string_view record)
{
	const auto [start, end] = split_tab(record);
	return oracle::DateRange{std::string(start), std::string(end)};
}

oracle::InstantRange parse_request(std::string_view record)
{
	const auto [start, end] = split_tab(record);
	oracle::InstantRange range;
	if (!start.empty())
		range.start = oracle::Instant::parse(start);
	if (!end.empty())
		range.end = oracle::Instant::parse(end);
	return range;
}

void append_response(std::string &buffer, const oracle::DateRange &range)
{
	buffer += range.start;
	buffer += '\t';
	buffer += range.end;
	buffer += '\n';
}

TimestampToDateCodec make_timestamp_to_date_codec()
{
	TimestampToDateCodec codec;
	codec.append_input = append_request;
	codec.split_output = bridge::split_lines;
	codec.parse_output = parse_response;
	return codec;
}

} // namespace TimestampDateKit::conformance
