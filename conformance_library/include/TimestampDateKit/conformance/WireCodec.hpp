// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_CONFORMANCE_WIRECODEC_HPP
#define TDK_CONFORMANCE_WIRECODEC_HPP

#include <string>
#include <string_view>

#include "TimestampDateKit/bridge/ProcessBridge.hpp"
#include "TimestampDateKit/oracle/Oracle.hpp"

namespace TimestampDateKit::conformance
{

/*
 * Line protocol spoken with an external converter, one record per line:
 *
 *   request:  <start RFC 3339 or empty> TAB <end RFC 3339 or empty> LF
 *   response: <start date or empty> TAB <end date or empty> LF
 *
 * Timestamps are written with nanosecond precision in their own offset.
 */

void append_request(std::string &buffer, const oracle::InstantRange &range);

// splits on the first TAB; throws bridge::exception::ProtocolError without one
oracle::DateRange parse_response(std::string_view record);

// Converter side of the protocol. parse_request throws ProtocolError for a
// missing TAB and InvalidTimestamp for malformed bounds.
oracle::InstantRange parse_request(std::string_view record);
void append_response(std::string &buffer, const oracle::DateRange &range);

using TimestampToDateCodec = bridge::Codec<oracle::InstantRange, oracle::DateRange>;
TimestampToDateCodec make_timestamp_to_date_codec();

} // namespace TimestampDateKit::conformance

#endif // TDK_CONFORMANCE_WIRECODEC_HPP
