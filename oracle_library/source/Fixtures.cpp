// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/oracle/Fixtures.hpp"

namespace TimestampDateKit::oracle
{

const std::vector<std::string> &date_values()
{
	static const std::vector<std::string> values{
		"2024-01-01",
		"2024-12-25",
		"2024-02-29",
		"2024-07-04",
		"2024-11-05",
		"2024-06-15",
		"2024-08-30",
		"2024-10-31",
		"2024-09-21",
		"2024-03-10",
		"2022-01-01",
		"2023-02-28",
		"2024-02-29",
		"2023-12-31",
		"2023-07-19",
		"2016-12-31",
		"2023-03-12",
		"2023-11-05",
	};
	return values;
}

const std::vector<StringRange> &date_range_values()
{
	static const std::vector<StringRange> values{
		{"2024-01-01", "2024-01-31"},
		{"2024-02-01", "2024-02-29"},
		{"2024-07-01", "2024-07-04"},
		{"2024-12-24", "2024-12-26"},
		{"2024-06-01", "2024-06-15"},
		{"2024-08-15", "2024-08-30"},
		{"2024-10-01", "2024-10-31"},
		{"2024-09-20", "2024-09-22"},
		{"2024-03-09", "2024-03-11"},
		{"2024-11-01", "2024-11-05"},
		{"2022-01-01", "2022-01-31"},
		{"2023-02-01", "2023-02-28"},
		{"2024-02-01", "2024-02-29"},
		{"2023-12-01", "2023-12-31"},
		{"2023-07-01", "2023-07-31"},
		{"2016-12-31", "2017-01-01"},
		{"2023-03-10", "2023-03-12"},
		{"2023-11-04", "2023-11-06"},
	};
	return values;
}

const std::vector<std::string> &timestamp_values()
{
	static const std::vector<std::string> values{
		"2024-01-01T00:00:00Z",
		"2024-12-25T00:00:00-05:00",
		"2024-02-29T12:00:00+05:30",
		"2024-07-04T23:59:59-07:00",
		"2024-11-05T08:00:00+01:00",
		"2024-06-15T13:45:30+09:00",
		"2024-08-30T18:30:00-04:00",
		"2024-10-31T17:00:00+00:00",
		"2024-09-21T00:00:00-03:00",
		"2024-03-10T02:00:00-08:00",
		"2022-01-01T00:00:00Z",
		"2023-02-28T23:59:59Z",
		"2024-02-29T12:00:00Z",
		"2023-12-31T23:59:59Z",
		"2023-07-19T14:30:00Z",
		"2023-07-19T14:30:00-07:00",
		"2023-07-19T14:30:00+09:00",
		"2023-03-12T02:00:00-07:00",
		"2023-11-05T01:00:00-08:00",
	};
	return values;
}

const std::vector<StringRange> &timestamp_range_values()
{
	static const std::vector<StringRange> values{
		{"2024-01-01T00:00:00Z", "2024-01-31T23:59:59Z"},
		{"2024-02-01T00:00:00-08:00", "2024-02-29T23:59:59-08:00"},
		{"2024-07-01T00:00:00-07:00", "2024-07-04T23:59:59-07:00"},
		{"2024-12-24T00:00:00+01:00", "2024-12-26T23:59:59+01:00"},
		{"2024-06-01T00:00:00+09:00", "2024-06-15T23:59:59+09:00"},
		{"2024-08-15T00:00:00-04:00", "2024-08-30T23:59:59-04:00"},
		{"2024-10-01T00:00:00+00:00", "2024-10-31T23:59:59+00:00"},
		{"2024-09-20T00:00:00-03:00", "2024-09-22T23:59:59-03:00"},
		{"2024-03-09T00:00:00-08:00", "2024-03-11T23:59:59-07:00"},
		{"2024-11-01T00:00:00+01:00", "2024-11-05T23:59:59+01:00"},
		{"2022-01-01T00:00:00Z", "2022-01-31T23:59:59Z"},
		{"2023-02-01T00:00:00Z", "2023-02-28T23:59:59Z"},
		{"2024-02-01T00:00:00Z", "2024-02-29T23:59:59Z"},
		{"2023-12-01T00:00:00Z", "2023-12-31T23:59:59Z"},
		{"2023-07-01T00:00:00Z", "2023-07-31T23:59:59Z"},
		{"2023-07-01T00:00:00-07:00", "2023-07-31T23:59:59-07:00"},
		{"2023-07-01T00:00:00+09:00", "2023-07-31T23:59:59+09:00"},
		{"2016-12-31T23:59:59Z", "2017-01-01T00:00:00Z"},
		{"2023-03-12T01:59:59-07:00", "2023-03-12T03:00:00-07:00"},
		{"2023-11-05T00:59:59-07:00", "2023-11-05T02:00:00-08:00"},
	};
	return values;
}

const MatchTable &example_matches()
{
	static const MatchTable matches{
		// timestamp ranges matching dates
		{"", "2017-01-01T00:00:00Z", "2016-12-31"},
		{"", "2022-01-31T23:59:59Z", "2016-12-31"},
		{"", "2022-01-31T23:59:59Z", "2022-01-01"},
		{"", "2023-02-28T23:59:59Z", "2016-12-31"},
		{"", "2023-02-28T23:59:59Z", "2022-01-01"},
		{"", "2023-03-12T03:00:00-07:00", "2016-12-31"},
		{"", "2023-03-12T03:00:00-07:00", "2022-01-01"},
		{"", "2023-03-12T03:00:00-07:00", "2023-02-28"},
		{"", "2023-07-31T23:59:59+09:00", "2016-12-31"},
		{"", "2023-07-31T23:59:59+09:00", "2022-01-01"},
		{"", "2023-07-31T23:59:59+09:00", "2023-02-28"},
		{"", "2023-07-31T23:59:59+09:00", "2023-03-12"},
		{"", "2023-07-31T23:59:59+09:00", "2023-07-19"},
		{"", "2023-07-31T23:59:59-07:00", "2016-12-31"},
		{"", "2023-07-31T23:59:59-07:00", "2022-01-01"},
		{"", "2023-07-31T23:59:59-07:00", "2023-02-28"},
		{"", "2023-07-31T23:59:59-07:00", "2023-03-12"},
		{"", "2023-07-31T23:59:59-07:00", "2023-07-19"},
		{"", "2023-07-31T23:59:59Z", "2016-12-31"},
		{"", "2023-07-31T23:59:59Z", "2022-01-01"},
		{"", "2023-07-31T23:59:59Z", "2023-02-28"},
		{"", "2023-07-31T23:59:59Z", "2023-03-12"},
		{"", "2023-07-31T23:59:59Z", "2023-07-19"},
		{"", "2023-11-05T02:00:00-08:00", "2016-12-31"},
		{"", "2023-11-05T02:00:00-08:00", "2022-01-01"},
		{"", "2023-11-05T02:00:00-08:00", "2023-02-28"},
		{"", "2023-11-05T02:00:00-08:00", "2023-03-12"},
		{"", "2023-11-05T02:00:00-08:00", "2023-07-19"},
		{"", "2023-12-31T23:59:59Z", "2016-12-31"},
		{"", "2023-12-31T23:59:59Z", "2022-01-01"},
		{"", "2023-12-31T23:59:59Z", "2023-02-28"},
		{"", "2023-12-31T23:59:59Z", "2023-03-12"},
		{"", "2023-12-31T23:59:59Z", "2023-07-19"},
		{"", "2023-12-31T23:59:59Z", "2023-11-05"},
		{"", "2024-01-31T23:59:59Z", "2016-12-31"},
		{"", "2024-01-31T23:59:59Z", "2022-01-01"},
		{"", "2024-01-31T23:59:59Z", "2023-02-28"},
		{"", "2024-01-31T23:59:59Z", "2023-03-12"},
		{"", "2024-01-31T23:59:59Z", "2023-07-19"},
		{"", "2024-01-31T23:59:59Z", "2023-11-05"},
		{"", "2024-01-31T23:59:59Z", "2023-12-31"},
		{"", "2024-01-31T23:59:59Z", "2024-01-01"},
		{"", "2024-02-29T23:59:59-08:00", "2016-12-31"},
		{"", "2024-02-29T23:59:59-08:00", "2022-01-01"},
		{"", "2024-02-29T23:59:59-08:00", "2023-02-28"},
		{"", "2024-02-29T23:59:59-08:00", "2023-03-12"},
		{"", "2024-02-29T23:59:59-08:00", "2023-07-19"},
		{"", "2024-02-29T23:59:59-08:00", "2023-11-05"},
		{"", "2024-02-29T23:59:59-08:00", "2023-12-31"},
		{"", "2024-02-29T23:59:59-08:00", "2024-01-01"},
		{"", "2024-02-29T23:59:59-08:00", "2024-02-29"},
		{"", "2024-02-29T23:59:59Z", "2016-12-31"},
		{"", "2024-02-29T23:59:59Z", "2022-01-01"},
		{"", "2024-02-29T23:59:59Z", "2023-02-28"},
		{"", "2024-02-29T23:59:59Z", "2023-03-12"},
		{"", "2024-02-29T23:59:59Z", "2023-07-19"},
		{"", "2024-02-29T23:59:59Z", "2023-11-05"},
		{"", "2024-02-29T23:59:59Z", "2023-12-31"},
		{"", "2024-02-29T23:59:59Z", "2024-01-01"},
		{"", "2024-03-11T23:59:59-07:00", "2016-12-31"},
		{"", "2024-03-11T23:59:59-07:00", "2022-01-01"},
		{"", "2024-03-11T23:59:59-07:00", "2023-02-28"},
		{"", "2024-03-11T23:59:59-07:00", "2023-03-12"},
		{"", "2024-03-11T23:59:59-07:00", "2023-07-19"},
		{"", "2024-03-11T23:59:59-07:00", "2023-11-05"},
		{"", "2024-03-11T23:59:59-07:00", "2023-12-31"},
		{"", "2024-03-11T23:59:59-07:00", "2024-01-01"},
		{"", "2024-03-11T23:59:59-07:00", "2024-02-29"},
		{"", "2024-03-11T23:59:59-07:00", "2024-03-10"},
		{"", "2024-06-15T23:59:59+09:00", "2016-12-31"},
		{"", "2024-06-15T23:59:59+09:00", "2022-01-01"},
		{"", "2024-06-15T23:59:59+09:00", "2023-02-28"},
		{"", "2024-06-15T23:59:59+09:00", "2023-03-12"},
		{"", "2024-06-15T23:59:59+09:00", "2023-07-19"},
		{"", "2024-06-15T23:59:59+09:00", "2023-11-05"},
		{"", "2024-06-15T23:59:59+09:00", "2023-12-31"},
		{"", "2024-06-15T23:59:59+09:00", "2024-01-01"},
		{"", "2024-06-15T23:59:59+09:00", "2024-02-29"},
		{"", "2024-06-15T23:59:59+09:00", "2024-03-10"},
		{"", "2024-07-04T23:59:59-07:00", "2016-12-31"},
		{"", "2024-07-04T23:59:59-07:00", "2022-01-01"},
		{"", "2024-07-04T23:59:59-07:00", "2023-02-28"},
		{"", "2024-07-04T23:59:59-07:00", "2023-03-12"},
		{"", "2024-07-04T23:59:59-07:00", "2023-07-19"},
		{"", "2024-07-04T23:59:59-07:00", "2023-11-05"},
		{"", "2024-07-04T23:59:59-07:00", "2023-12-31"},
		{"", "2024-07-04T23:59:59-07:00", "2024-01-01"},
		{"", "2024-07-04T23:59:59-07:00", "2024-02-29"},
		{"", "2024-07-04T23:59:59-07:00", "2024-03-10"},
		{"", "2024-07-04T23:59:59-07:00", "2024-06-15"},
		{"", "2024-07-04T23:59:59-07:00", "2024-07-04"},
		{"", "2024-08-30T23:59:59-04:00", "2016-12-31"},
		{"", "2024-08-30T23:59:59-04:00", "2022-01-01"},
		{"", "2024-08-30T23:59:59-04:00", "2023-02-28"},
		{"", "2024-08-30T23:59:59-04:00", "2023-03-12"},
		{"", "2024-08-30T23:59:59-04:00", "2023-07-19"},
		{"", "2024-08-30T23:59:59-04:00", "2023-11-05"},
		{"", "2024-08-30T23:59:59-04:00", "2023-12-31"},
		{"", "2024-08-30T23:59:59-04:00", "2024-01-01"},
		{"", "2024-08-30T23:59:59-04:00", "2024-02-29"},
		{"", "2024-08-30T23:59:59-04:00", "2024-03-10"},
		{"", "2024-08-30T23:59:59-04:00", "2024-06-15"},
		{"", "2024-08-30T23:59:59-04:00", "2024-07-04"},
		{"", "2024-08-30T23:59:59-04:00", "2024-08-30"},
		{"", "2024-09-22T23:59:59-03:00", "2016-12-31"},
		{"", "2024-09-22T23:59:59-03:00", "2022-01-01"},
		{"", "2024-09-22T23:59:59-03:00", "2023-02-28"},
		{"", "2024-09-22T23:59:59-03:00", "2023-03-12"},
		{"", "2024-09-22T23:59:59-03:00", "2023-07-19"},
		{"", "2024-09-22T23:59:59-03:00", "2023-11-05"},
		{"", "2024-09-22T23:59:59-03:00", "2023-12-31"},
		{"", "2024-09-22T23:59:59-03:00", "2024-01-01"},
		{"", "2024-09-22T23:59:59-03:00", "2024-02-29"},
		{"", "2024-09-22T23:59:59-03:00", "2024-03-10"},
		{"", "2024-09-22T23:59:59-03:00", "2024-06-15"},
		{"", "2024-09-22T23:59:59-03:00", "2024-07-04"},
		{"", "2024-09-22T23:59:59-03:00", "2024-08-30"},
		{"", "2024-09-22T23:59:59-03:00", "2024-09-21"},
		{"", "2024-10-31T23:59:59+00:00", "2016-12-31"},
		{"", "2024-10-31T23:59:59+00:00", "2022-01-01"},
		{"", "2024-10-31T23:59:59+00:00", "2023-02-28"},
		{"", "2024-10-31T23:59:59+00:00", "2023-03-12"},
		{"", "2024-10-31T23:59:59+00:00", "2023-07-19"},
		{"", "2024-10-31T23:59:59+00:00", "2023-11-05"},
		{"", "2024-10-31T23:59:59+00:00", "2023-12-31"},
		{"", "2024-10-31T23:59:59+00:00", "2024-01-01"},
		{"", "2024-10-31T23:59:59+00:00", "2024-02-29"},
		{"", "2024-10-31T23:59:59+00:00", "2024-03-10"},
		{"", "2024-10-31T23:59:59+00:00", "2024-06-15"},
		{"", "2024-10-31T23:59:59+00:00", "2024-07-04"},
		{"", "2024-10-31T23:59:59+00:00", "2024-08-30"},
		{"", "2024-10-31T23:59:59+00:00", "2024-09-21"},
		{"", "2024-11-05T23:59:59+01:00", "2016-12-31"},
		{"", "2024-11-05T23:59:59+01:00", "2022-01-01"},
		{"", "2024-11-05T23:59:59+01:00", "2023-02-28"},
		{"", "2024-11-05T23:59:59+01:00", "2023-03-12"},
		{"", "2024-11-05T23:59:59+01:00", "2023-07-19"},
		{"", "2024-11-05T23:59:59+01:00", "2023-11-05"},
		{"", "2024-11-05T23:59:59+01:00", "2023-12-31"},
		{"", "2024-11-05T23:59:59+01:00", "2024-01-01"},
		{"", "2024-11-05T23:59:59+01:00", "2024-02-29"},
		{"", "2024-11-05T23:59:59+01:00", "2024-03-10"},
		{"", "2024-11-05T23:59:59+01:00", "2024-06-15"},
		{"", "2024-11-05T23:59:59+01:00", "2024-07-04"},
		{"", "2024-11-05T23:59:59+01:00", "2024-08-30"},
		{"", "2024-11-05T23:59:59+01:00", "2024-09-21"},
		{"", "2024-11-05T23:59:59+01:00", "2024-10-31"},
		{"", "2024-12-26T23:59:59+01:00", "2016-12-31"},
		{"", "2024-12-26T23:59:59+01:00", "2022-01-01"},
		{"", "2024-12-26T23:59:59+01:00", "2023-02-28"},
		{"", "2024-12-26T23:59:59+01:00", "2023-03-12"},
		{"", "2024-12-26T23:59:59+01:00", "2023-07-19"},
		{"", "2024-12-26T23:59:59+01:00", "2023-11-05"},
		{"", "2024-12-26T23:59:59+01:00", "2023-12-31"},
		{"", "2024-12-26T23:59:59+01:00", "2024-01-01"},
		{"", "2024-12-26T23:59:59+01:00", "2024-02-29"},
		{"", "2024-12-26T23:59:59+01:00", "2024-03-10"},
		{"", "2024-12-26T23:59:59+01:00", "2024-06-15"},
		{"", "2024-12-26T23:59:59+01:00", "2024-07-04"},
		{"", "2024-12-26T23:59:59+01:00", "2024-08-30"},
		{"", "2024-12-26T23:59:59+01:00", "2024-09-21"},
		{"", "2024-12-26T23:59:59+01:00", "2024-10-31"},
		{"", "2024-12-26T23:59:59+01:00", "2024-11-05"},
		{"", "2024-12-26T23:59:59+01:00", "2024-12-25"},
		{"2016-12-31T23:59:59Z", "", "2022-01-01"},
		{"2016-12-31T23:59:59Z", "", "2023-02-28"},
		{"2016-12-31T23:59:59Z", "", "2023-03-12"},
		{"2016-12-31T23:59:59Z", "", "2023-07-19"},
		{"2016-12-31T23:59:59Z", "", "2023-11-05"},
		{"2016-12-31T23:59:59Z", "", "2023-12-31"},
		{"2016-12-31T23:59:59Z", "", "2024-01-01"},
		{"2016-12-31T23:59:59Z", "", "2024-02-29"},
		{"2016-12-31T23:59:59Z", "", "2024-03-10"},
		{"2016-12-31T23:59:59Z", "", "2024-06-15"},
		{"2016-12-31T23:59:59Z", "", "2024-07-04"},
		{"2016-12-31T23:59:59Z", "", "2024-08-30"},
		{"2016-12-31T23:59:59Z", "", "2024-09-21"},
		{"2016-12-31T23:59:59Z", "", "2024-10-31"},
		{"2016-12-31T23:59:59Z", "", "2024-11-05"},
		{"2016-12-31T23:59:59Z", "", "2024-12-25"},
		{"2022-01-01T00:00:00Z", "", "2022-01-01"},
		{"2022-01-01T00:00:00Z", "", "2023-02-28"},
		{"2022-01-01T00:00:00Z", "", "2023-03-12"},
		{"2022-01-01T00:00:00Z", "", "2023-07-19"},
		{"2022-01-01T00:00:00Z", "", "2023-11-05"},
		{"2022-01-01T00:00:00Z", "", "2023-12-31"},
		{"2022-01-01T00:00:00Z", "", "2024-01-01"},
		{"2022-01-01T00:00:00Z", "", "2024-02-29"},
		{"2022-01-01T00:00:00Z", "", "2024-03-10"},
		{"2022-01-01T00:00:00Z", "", "2024-06-15"},
		{"2022-01-01T00:00:00Z", "", "2024-07-04"},
		{"2022-01-01T00:00:00Z", "", "2024-08-30"},
		{"2022-01-01T00:00:00Z", "", "2024-09-21"},
		{"2022-01-01T00:00:00Z", "", "2024-10-31"},
		{"2022-01-01T00:00:00Z", "", "2024-11-05"},
		{"2022-01-01T00:00:00Z", "", "2024-12-25"},
		{"2022-01-01T00:00:00Z", "2022-01-31T23:59:59Z", "2022-01-01"},
		{"2023-02-01T00:00:00Z", "", "2023-02-28"},
		{"2023-02-01T00:00:00Z", "", "2023-03-12"},
		{"2023-02-01T00:00:00Z", "", "2023-07-19"},
		{"2023-02-01T00:00:00Z", "", "2023-11-05"},
		{"2023-02-01T00:00:00Z", "", "2023-12-31"},
		{"2023-02-01T00:00:00Z", "", "2024-01-01"},
		{"2023-02-01T00:00:00Z", "", "2024-02-29"},
		{"2023-02-01T00:00:00Z", "", "2024-03-10"},
		{"2023-02-01T00:00:00Z", "", "2024-06-15"},
		{"2023-02-01T00:00:00Z", "", "2024-07-04"},
		{"2023-02-01T00:00:00Z", "", "2024-08-30"},
		{"2023-02-01T00:00:00Z", "", "2024-09-21"},
		{"2023-02-01T00:00:00Z", "", "2024-10-31"},
		{"2023-02-01T00:00:00Z", "", "2024-11-05"},
		{"2023-02-01T00:00:00Z", "", "2024-12-25"},
		{"2023-03-12T01:59:59-07:00", "", "2023-07-19"},
		{"2023-03-12T01:59:59-07:00", "", "2023-11-05"},
		{"2023-03-12T01:59:59-07:00", "", "2023-12-31"},
		{"2023-03-12T01:59:59-07:00", "", "2024-01-01"},
		{"2023-03-12T01:59:59-07:00", "", "2024-02-29"},
		{"2023-03-12T01:59:59-07:00", "", "2024-03-10"},
		{"2023-03-12T01:59:59-07:00", "", "2024-06-15"},
		{"2023-03-12T01:59:59-07:00", "", "2024-07-04"},
		{"2023-03-12T01:59:59-07:00", "", "2024-08-30"},
		{"2023-03-12T01:59:59-07:00", "", "2024-09-21"},
		{"2023-03-12T01:59:59-07:00", "", "2024-10-31"},
		{"2023-03-12T01:59:59-07:00", "", "2024-11-05"},
		{"2023-03-12T01:59:59-07:00", "", "2024-12-25"},
		{"2023-07-01T00:00:00+09:00", "", "2023-07-19"},
		{"2023-07-01T00:00:00+09:00", "", "2023-11-05"},
		{"2023-07-01T00:00:00+09:00", "", "2023-12-31"},
		{"2023-07-01T00:00:00+09:00", "", "2024-01-01"},
		{"2023-07-01T00:00:00+09:00", "", "2024-02-29"},
		{"2023-07-01T00:00:00+09:00", "", "2024-03-10"},
		{"2023-07-01T00:00:00+09:00", "", "2024-06-15"},
		{"2023-07-01T00:00:00+09:00", "", "2024-07-04"},
		{"2023-07-01T00:00:00+09:00", "", "2024-08-30"},
		{"2023-07-01T00:00:00+09:00", "", "2024-09-21"},
		{"2023-07-01T00:00:00+09:00", "", "2024-10-31"},
		{"2023-07-01T00:00:00+09:00", "", "2024-11-05"},
		{"2023-07-01T00:00:00+09:00", "", "2024-12-25"},
		{"2023-07-01T00:00:00+09:00", "2023-07-31T23:59:59+09:00", "2023-07-19"},
		{"2023-07-01T00:00:00-07:00", "", "2023-07-19"},
		{"2023-07-01T00:00:00-07:00", "", "2023-11-05"},
		{"2023-07-01T00:00:00-07:00", "", "2023-12-31"},
		{"2023-07-01T00:00:00-07:00", "", "2024-01-01"},
		{"2023-07-01T00:00:00-07:00", "", "2024-02-29"},
		{"2023-07-01T00:00:00-07:00", "", "2024-03-10"},
		{"2023-07-01T00:00:00-07:00", "", "2024-06-15"},
		{"2023-07-01T00:00:00-07:00", "", "2024-07-04"},
		{"2023-07-01T00:00:00-07:00", "", "2024-08-30"},
		{"2023-07-01T00:00:00-07:00", "", "2024-09-21"},
		{"2023-07-01T00:00:00-07:00", "", "2024-10-31"},
		{"2023-07-01T00:00:00-07:00", "", "2024-11-05"},
		{"2023-07-01T00:00:00-07:00", "", "2024-12-25"},
		{"2023-07-01T00:00:00-07:00", "2023-07-31T23:59:59-07:00", "2023-07-19"},
		{"2023-07-01T00:00:00Z", "", "2023-07-19"},
		{"2023-07-01T00:00:00Z", "", "2023-11-05"},
		{"2023-07-01T00:00:00Z", "", "2023-12-31"},
		{"2023-07-01T00:00:00Z", "", "2024-01-01"},
		{"2023-07-01T00:00:00Z", "", "2024-02-29"},
		{"2023-07-01T00:00:00Z", "", "2024-03-10"},
		{"2023-07-01T00:00:00Z", "", "2024-06-15"},
		{"2023-07-01T00:00:00Z", "", "2024-07-04"},
		{"2023-07-01T00:00:00Z", "", "2024-08-30"},
		{"2023-07-01T00:00:00Z", "", "2024-09-21"},
		{"2023-07-01T00:00:00Z", "", "2024-10-31"},
		{"2023-07-01T00:00:00Z", "", "2024-11-05"},
		{"2023-07-01T00:00:00Z", "", "2024-12-25"},
		{"2023-07-01T00:00:00Z", "2023-07-31T23:59:59Z", "2023-07-19"},
		{"2023-11-05T00:59:59-07:00", "", "2023-12-31"},
		{"2023-11-05T00:59:59-07:00", "", "2024-01-01"},
		{"2023-11-05T00:59:59-07:00", "", "2024-02-29"},
		{"2023-11-05T00:59:59-07:00", "", "2024-03-10"},
		{"2023-11-05T00:59:59-07:00", "", "2024-06-15"},
		{"2023-11-05T00:59:59-07:00", "", "2024-07-04"},
		{"2023-11-05T00:59:59-07:00", "", "2024-08-30"},
		{"2023-11-05T00:59:59-07:00", "", "2024-09-21"},
		{"2023-11-05T00:59:59-07:00", "", "2024-10-31"},
		{"2023-11-05T00:59:59-07:00", "", "2024-11-05"},
		{"2023-11-05T00:59:59-07:00", "", "2024-12-25"},
		{"2023-12-01T00:00:00Z", "", "2023-12-31"},
		{"2023-12-01T00:00:00Z", "", "2024-01-01"},
		{"2023-12-01T00:00:00Z", "", "2024-02-29"},
		{"2023-12-01T00:00:00Z", "", "2024-03-10"},
		{"2023-12-01T00:00:00Z", "", "2024-06-15"},
		{"2023-12-01T00:00:00Z", "", "2024-07-04"},
		{"2023-12-01T00:00:00Z", "", "2024-08-30"},
		{"2023-12-01T00:00:00Z", "", "2024-09-21"},
		{"2023-12-01T00:00:00Z", "", "2024-10-31"},
		{"2023-12-01T00:00:00Z", "", "2024-11-05"},
		{"2023-12-01T00:00:00Z", "", "2024-12-25"},
		{"2024-01-01T00:00:00Z", "", "2024-01-01"},
		{"2024-01-01T00:00:00Z", "", "2024-02-29"},
		{"2024-01-01T00:00:00Z", "", "2024-03-10"},
		{"2024-01-01T00:00:00Z", "", "2024-06-15"},
		{"2024-01-01T00:00:00Z", "", "2024-07-04"},
		{"2024-01-01T00:00:00Z", "", "2024-08-30"},
		{"2024-01-01T00:00:00Z", "", "2024-09-21"},
		{"2024-01-01T00:00:00Z", "", "2024-10-31"},
		{"2024-01-01T00:00:00Z", "", "2024-11-05"},
		{"2024-01-01T00:00:00Z", "", "2024-12-25"},
		{"2024-01-01T00:00:00Z", "2024-01-31T23:59:59Z", "2024-01-01"},
		{"2024-02-01T00:00:00-08:00", "", "2024-02-29"},
		{"2024-02-01T00:00:00-08:00", "", "2024-03-10"},
		{"2024-02-01T00:00:00-08:00", "", "2024-06-15"},
		{"2024-02-01T00:00:00-08:00", "", "2024-07-04"},
		{"2024-02-01T00:00:00-08:00", "", "2024-08-30"},
		{"2024-02-01T00:00:00-08:00", "", "2024-09-21"},
		{"2024-02-01T00:00:00-08:00", "", "2024-10-31"},
		{"2024-02-01T00:00:00-08:00", "", "2024-11-05"},
		{"2024-02-01T00:00:00-08:00", "", "2024-12-25"},
		{"2024-02-01T00:00:00-08:00", "2024-02-29T23:59:59-08:00", "2024-02-29"},
		{"2024-02-01T00:00:00Z", "", "2024-02-29"},
		{"2024-02-01T00:00:00Z", "", "2024-03-10"},
		{"2024-02-01T00:00:00Z", "", "2024-06-15"},
		{"2024-02-01T00:00:00Z", "", "2024-07-04"},
		{"2024-02-01T00:00:00Z", "", "2024-08-30"},
		{"2024-02-01T00:00:00Z", "", "2024-09-21"},
		{"2024-02-01T00:00:00Z", "", "2024-10-31"},
		{"2024-02-01T00:00:00Z", "", "2024-11-05"},
		{"2024-02-01T00:00:00Z", "", "2024-12-25"},
		{"2024-03-09T00:00:00-08:00", "", "2024-03-10"},
		{"2024-03-09T00:00:00-08:00", "", "2024-06-15"},
		{"2024-03-09T00:00:00-08:00", "", "2024-07-04"},
		{"2024-03-09T00:00:00-08:00", "", "2024-08-30"},
		{"2024-03-09T00:00:00-08:00", "", "2024-09-21"},
		{"2024-03-09T00:00:00-08:00", "", "2024-10-31"},
		{"2024-03-09T00:00:00-08:00", "", "2024-11-05"},
		{"2024-03-09T00:00:00-08:00", "", "2024-12-25"},
		{"2024-03-09T00:00:00-08:00", "2024-03-11T23:59:59-07:00", "2024-03-10"},
		{"2024-06-01T00:00:00+09:00", "", "2024-06-15"},
		{"2024-06-01T00:00:00+09:00", "", "2024-07-04"},
		{"2024-06-01T00:00:00+09:00", "", "2024-08-30"},
		{"2024-06-01T00:00:00+09:00", "", "2024-09-21"},
		{"2024-06-01T00:00:00+09:00", "", "2024-10-31"},
		{"2024-06-01T00:00:00+09:00", "", "2024-11-05"},
		{"2024-06-01T00:00:00+09:00", "", "2024-12-25"},
		{"2024-07-01T00:00:00-07:00", "", "2024-07-04"},
		{"2024-07-01T00:00:00-07:00", "", "2024-08-30"},
		{"2024-07-01T00:00:00-07:00", "", "2024-09-21"},
		{"2024-07-01T00:00:00-07:00", "", "2024-10-31"},
		{"2024-07-01T00:00:00-07:00", "", "2024-11-05"},
		{"2024-07-01T00:00:00-07:00", "", "2024-12-25"},
		{"2024-07-01T00:00:00-07:00", "2024-07-04T23:59:59-07:00", "2024-07-04"},
		{"2024-08-15T00:00:00-04:00", "", "2024-08-30"},
		{"2024-08-15T00:00:00-04:00", "", "2024-09-21"},
		{"2024-08-15T00:00:00-04:00", "", "2024-10-31"},
		{"2024-08-15T00:00:00-04:00", "", "2024-11-05"},
		{"2024-08-15T00:00:00-04:00", "", "2024-12-25"},
		{"2024-08-15T00:00:00-04:00", "2024-08-30T23:59:59-04:00", "2024-08-30"},
		{"2024-09-20T00:00:00-03:00", "", "2024-09-21"},
		{"2024-09-20T00:00:00-03:00", "", "2024-10-31"},
		{"2024-09-20T00:00:00-03:00", "", "2024-11-05"},
		{"2024-09-20T00:00:00-03:00", "", "2024-12-25"},
		{"2024-09-20T00:00:00-03:00", "2024-09-22T23:59:59-03:00", "2024-09-21"},
		{"2024-10-01T00:00:00+00:00", "", "2024-10-31"},
		{"2024-10-01T00:00:00+00:00", "", "2024-11-05"},
		{"2024-10-01T00:00:00+00:00", "", "2024-12-25"},
		{"2024-11-01T00:00:00+01:00", "", "2024-11-05"},
		{"2024-11-01T00:00:00+01:00", "", "2024-12-25"},
		{"2024-12-24T00:00:00+01:00", "", "2024-12-25"},
		{"2024-12-24T00:00:00+01:00", "2024-12-26T23:59:59+01:00", "2024-12-25"},

		// date ranges matching timestamps
		{"", "2022-01-31", "2022-01-01T00:00:00Z"},
		{"", "2023-02-28", "2022-01-01T00:00:00Z"},
		{"", "2023-02-28", "2023-02-28T23:59:59Z"},
		{"", "2023-03-12", "2022-01-01T00:00:00Z"},
		{"", "2023-03-12", "2023-02-28T23:59:59Z"},
		{"", "2023-03-12", "2023-03-12T02:00:00-07:00"},
		{"", "2023-07-31", "2022-01-01T00:00:00Z"},
		{"", "2023-07-31", "2023-02-28T23:59:59Z"},
		{"", "2023-07-31", "2023-03-12T02:00:00-07:00"},
		{"", "2023-07-31", "2023-07-19T14:30:00+09:00"},
		{"", "2023-07-31", "2023-07-19T14:30:00-07:00"},
		{"", "2023-07-31", "2023-07-19T14:30:00Z"},
		{"", "2023-11-06", "2022-01-01T00:00:00Z"},
		{"", "2023-11-06", "2023-02-28T23:59:59Z"},
		{"", "2023-11-06", "2023-03-12T02:00:00-07:00"},
		{"", "2023-11-06", "2023-07-19T14:30:00+09:00"},
		{"", "2023-11-06", "2023-07-19T14:30:00-07:00"},
		{"", "2023-11-06", "2023-07-19T14:30:00Z"},
		{"", "2023-11-06", "2023-11-05T01:00:00-08:00"},
		{"", "2023-12-31", "2022-01-01T00:00:00Z"},
		{"", "2023-12-31", "2023-02-28T23:59:59Z"},
		{"", "2023-12-31", "2023-03-12T02:00:00-07:00"},
		{"", "2023-12-31", "2023-07-19T14:30:00+09:00"},
		{"", "2023-12-31", "2023-07-19T14:30:00-07:00"},
		{"", "2023-12-31", "2023-07-19T14:30:00Z"},
		{"", "2023-12-31", "2023-11-05T01:00:00-08:00"},
		{"", "2023-12-31", "2023-12-31T23:59:59Z"},
		{"", "2024-01-31", "2022-01-01T00:00:00Z"},
		{"", "2024-01-31", "2023-02-28T23:59:59Z"},
		{"", "2024-01-31", "2023-03-12T02:00:00-07:00"},
		{"", "2024-01-31", "2023-07-19T14:30:00+09:00"},
		{"", "2024-01-31", "2023-07-19T14:30:00-07:00"},
		{"", "2024-01-31", "2023-07-19T14:30:00Z"},
		{"", "2024-01-31", "2023-11-05T01:00:00-08:00"},
		{"", "2024-01-31", "2023-12-31T23:59:59Z"},
		{"", "2024-01-31", "2024-01-01T00:00:00Z"},
		{"", "2024-02-29", "2022-01-01T00:00:00Z"},
		{"", "2024-02-29", "2023-02-28T23:59:59Z"},
		{"", "2024-02-29", "2023-03-12T02:00:00-07:00"},
		{"", "2024-02-29", "2023-07-19T14:30:00+09:00"},
		{"", "2024-02-29", "2023-07-19T14:30:00-07:00"},
		{"", "2024-02-29", "2023-07-19T14:30:00Z"},
		{"", "2024-02-29", "2023-11-05T01:00:00-08:00"},
		{"", "2024-02-29", "2023-12-31T23:59:59Z"},
		{"", "2024-02-29", "2024-01-01T00:00:00Z"},
		{"", "2024-02-29", "2024-02-29T12:00:00+05:30"},
		{"", "2024-02-29", "2024-02-29T12:00:00Z"},
		{"", "2024-03-11", "2022-01-01T00:00:00Z"},
		{"", "2024-03-11", "2023-02-28T23:59:59Z"},
		{"", "2024-03-11", "2023-03-12T02:00:00-07:00"},
		{"", "2024-03-11", "2023-07-19T14:30:00+09:00"},
		{"", "2024-03-11", "2023-07-19T14:30:00-07:00"},
		{"", "2024-03-11", "2023-07-19T14:30:00Z"},
		{"", "2024-03-11", "2023-11-05T01:00:00-08:00"},
		{"", "2024-03-11", "2023-12-31T23:59:59Z"},
		{"", "2024-03-11", "2024-01-01T00:00:00Z"},
		{"", "2024-03-11", "2024-02-29T12:00:00+05:30"},
		{"", "2024-03-11", "2024-02-29T12:00:00Z"},
		{"", "2024-03-11", "2024-03-10T02:00:00-08:00"},
		{"", "2024-06-15", "2022-01-01T00:00:00Z"},
		{"", "2024-06-15", "2023-02-28T23:59:59Z"},
		{"", "2024-06-15", "2023-03-12T02:00:00-07:00"},
		{"", "2024-06-15", "2023-07-19T14:30:00+09:00"},
		{"", "2024-06-15", "2023-07-19T14:30:00-07:00"},
		{"", "2024-06-15", "2023-07-19T14:30:00Z"},
		{"", "2024-06-15", "2023-11-05T01:00:00-08:00"},
		{"", "2024-06-15", "2023-12-31T23:59:59Z"},
		{"", "2024-06-15", "2024-01-01T00:00:00Z"},
		{"", "2024-06-15", "2024-02-29T12:00:00+05:30"},
		{"", "2024-06-15", "2024-02-29T12:00:00Z"},
		{"", "2024-06-15", "2024-03-10T02:00:00-08:00"},
		{"", "2024-06-15", "2024-06-15T13:45:30+09:00"},
		{"", "2024-07-04", "2022-01-01T00:00:00Z"},
		{"", "2024-07-04", "2023-02-28T23:59:59Z"},
		{"", "2024-07-04", "2023-03-12T02:00:00-07:00"},
		{"", "2024-07-04", "2023-07-19T14:30:00+09:00"},
		{"", "2024-07-04", "2023-07-19T14:30:00-07:00"},
		{"", "2024-07-04", "2023-07-19T14:30:00Z"},
		{"", "2024-07-04", "2023-11-05T01:00:00-08:00"},
		{"", "2024-07-04", "2023-12-31T23:59:59Z"},
		{"", "2024-07-04", "2024-01-01T00:00:00Z"},
		{"", "2024-07-04", "2024-02-29T12:00:00+05:30"},
		{"", "2024-07-04", "2024-02-29T12:00:00Z"},
		{"", "2024-07-04", "2024-03-10T02:00:00-08:00"},
		{"", "2024-07-04", "2024-06-15T13:45:30+09:00"},
		{"", "2024-08-30", "2022-01-01T00:00:00Z"},
		{"", "2024-08-30", "2023-02-28T23:59:59Z"},
		{"", "2024-08-30", "2023-03-12T02:00:00-07:00"},
		{"", "2024-08-30", "2023-07-19T14:30:00+09:00"},
		{"", "2024-08-30", "2023-07-19T14:30:00-07:00"},
		{"", "2024-08-30", "2023-07-19T14:30:00Z"},
		{"", "2024-08-30", "2023-11-05T01:00:00-08:00"},
		{"", "2024-08-30", "2023-12-31T23:59:59Z"},
		{"", "2024-08-30", "2024-01-01T00:00:00Z"},
		{"", "2024-08-30", "2024-02-29T12:00:00+05:30"},
		{"", "2024-08-30", "2024-02-29T12:00:00Z"},
		{"", "2024-08-30", "2024-03-10T02:00:00-08:00"},
		{"", "2024-08-30", "2024-06-15T13:45:30+09:00"},
		{"", "2024-08-30", "2024-07-04T23:59:59-07:00"},
		{"", "2024-08-30", "2024-08-30T18:30:00-04:00"},
		{"", "2024-09-22", "2022-01-01T00:00:00Z"},
		{"", "2024-09-22", "2023-02-28T23:59:59Z"},
		{"", "2024-09-22", "2023-03-12T02:00:00-07:00"},
		{"", "2024-09-22", "2023-07-19T14:30:00+09:00"},
		{"", "2024-09-22", "2023-07-19T14:30:00-07:00"},
		{"", "2024-09-22", "2023-07-19T14:30:00Z"},
		{"", "2024-09-22", "2023-11-05T01:00:00-08:00"},
		{"", "2024-09-22", "2023-12-31T23:59:59Z"},
		{"", "2024-09-22", "2024-01-01T00:00:00Z"},
		{"", "2024-09-22", "2024-02-29T12:00:00+05:30"},
		{"", "2024-09-22", "2024-02-29T12:00:00Z"},
		{"", "2024-09-22", "2024-03-10T02:00:00-08:00"},
		{"", "2024-09-22", "2024-06-15T13:45:30+09:00"},
		{"", "2024-09-22", "2024-07-04T23:59:59-07:00"},
		{"", "2024-09-22", "2024-08-30T18:30:00-04:00"},
		{"", "2024-09-22", "2024-09-21T00:00:00-03:00"},
		{"", "2024-10-31", "2022-01-01T00:00:00Z"},
		{"", "2024-10-31", "2023-02-28T23:59:59Z"},
		{"", "2024-10-31", "2023-03-12T02:00:00-07:00"},
		{"", "2024-10-31", "2023-07-19T14:30:00+09:00"},
		{"", "2024-10-31", "2023-07-19T14:30:00-07:00"},
		{"", "2024-10-31", "2023-07-19T14:30:00Z"},
		{"", "2024-10-31", "2023-11-05T01:00:00-08:00"},
		{"", "2024-10-31", "2023-12-31T23:59:59Z"},
		{"", "2024-10-31", "2024-01-01T00:00:00Z"},
		{"", "2024-10-31", "2024-02-29T12:00:00+05:30"},
		{"", "2024-10-31", "2024-02-29T12:00:00Z"},
		{"", "2024-10-31", "2024-03-10T02:00:00-08:00"},
		{"", "2024-10-31", "2024-06-15T13:45:30+09:00"},
		{"", "2024-10-31", "2024-07-04T23:59:59-07:00"},
		{"", "2024-10-31", "2024-08-30T18:30:00-04:00"},
		{"", "2024-10-31", "2024-09-21T00:00:00-03:00"},
		{"", "2024-10-31", "2024-10-31T17:00:00+00:00"},
		{"", "2024-11-05", "2022-01-01T00:00:00Z"},
		{"", "2024-11-05", "2023-02-28T23:59:59Z"},
		{"", "2024-11-05", "2023-03-12T02:00:00-07:00"},
		{"", "2024-11-05", "2023-07-19T14:30:00+09:00"},
		{"", "2024-11-05", "2023-07-19T14:30:00-07:00"},
		{"", "2024-11-05", "2023-07-19T14:30:00Z"},
		{"", "2024-11-05", "2023-11-05T01:00:00-08:00"},
		{"", "2024-11-05", "2023-12-31T23:59:59Z"},
		{"", "2024-11-05", "2024-01-01T00:00:00Z"},
		{"", "2024-11-05", "2024-02-29T12:00:00+05:30"},
		{"", "2024-11-05", "2024-02-29T12:00:00Z"},
		{"", "2024-11-05", "2024-03-10T02:00:00-08:00"},
		{"", "2024-11-05", "2024-06-15T13:45:30+09:00"},
		{"", "2024-11-05", "2024-07-04T23:59:59-07:00"},
		{"", "2024-11-05", "2024-08-30T18:30:00-04:00"},
		{"", "2024-11-05", "2024-09-21T00:00:00-03:00"},
		{"", "2024-11-05", "2024-10-31T17:00:00+00:00"},
		{"", "2024-11-05", "2024-11-05T08:00:00+01:00"},
		{"", "2024-12-26", "2022-01-01T00:00:00Z"},
		{"", "2024-12-26", "2023-02-28T23:59:59Z"},
		{"", "2024-12-26", "2023-03-12T02:00:00-07:00"},
		{"", "2024-12-26", "2023-07-19T14:30:00+09:00"},
		{"", "2024-12-26", "2023-07-19T14:30:00-07:00"},
		{"", "2024-12-26", "2023-07-19T14:30:00Z"},
		{"", "2024-12-26", "2023-11-05T01:00:00-08:00"},
		{"", "2024-12-26", "2023-12-31T23:59:59Z"},
		{"", "2024-12-26", "2024-01-01T00:00:00Z"},
		{"", "2024-12-26", "2024-02-29T12:00:00+05:30"},
		{"", "2024-12-26", "2024-02-29T12:00:00Z"},
		{"", "2024-12-26", "2024-03-10T02:00:00-08:00"},
		{"", "2024-12-26", "2024-06-15T13:45:30+09:00"},
		{"", "2024-12-26", "2024-07-04T23:59:59-07:00"},
		{"", "2024-12-26", "2024-08-30T18:30:00-04:00"},
		{"", "2024-12-26", "2024-09-21T00:00:00-03:00"},
		{"", "2024-12-26", "2024-10-31T17:00:00+00:00"},
		{"", "2024-12-26", "2024-11-05T08:00:00+01:00"},
		{"", "2024-12-26", "2024-12-25T00:00:00-05:00"},
		{"2016-12-31", "", "2022-01-01T00:00:00Z"},
		{"2016-12-31", "", "2023-02-28T23:59:59Z"},
		{"2016-12-31", "", "2023-03-12T02:00:00-07:00"},
		{"2016-12-31", "", "2023-07-19T14:30:00+09:00"},
		{"2016-12-31", "", "2023-07-19T14:30:00-07:00"},
		{"2016-12-31", "", "2023-07-19T14:30:00Z"},
		{"2016-12-31", "", "2023-11-05T01:00:00-08:00"},
		{"2016-12-31", "", "2023-12-31T23:59:59Z"},
		{"2016-12-31", "", "2024-01-01T00:00:00Z"},
		{"2016-12-31", "", "2024-02-29T12:00:00+05:30"},
		{"2016-12-31", "", "2024-02-29T12:00:00Z"},
		{"2016-12-31", "", "2024-03-10T02:00:00-08:00"},
		{"2016-12-31", "", "2024-06-15T13:45:30+09:00"},
		{"2016-12-31", "", "2024-07-04T23:59:59-07:00"},
		{"2016-12-31", "", "2024-08-30T18:30:00-04:00"},
		{"2016-12-31", "", "2024-09-21T00:00:00-03:00"},
		{"2016-12-31", "", "2024-10-31T17:00:00+00:00"},
		{"2016-12-31", "", "2024-11-05T08:00:00+01:00"},
		{"2016-12-31", "", "2024-12-25T00:00:00-05:00"},
		{"2022-01-01", "", "2022-01-01T00:00:00Z"},
		{"2022-01-01", "", "2023-02-28T23:59:59Z"},
		{"2022-01-01", "", "2023-03-12T02:00:00-07:00"},
		{"2022-01-01", "", "2023-07-19T14:30:00+09:00"},
		{"2022-01-01", "", "2023-07-19T14:30:00-07:00"},
		{"2022-01-01", "", "2023-07-19T14:30:00Z"},
		{"2022-01-01", "", "2023-11-05T01:00:00-08:00"},
		{"2022-01-01", "", "2023-12-31T23:59:59Z"},
		{"2022-01-01", "", "2024-01-01T00:00:00Z"},
		{"2022-01-01", "", "2024-02-29T12:00:00+05:30"},
		{"2022-01-01", "", "2024-02-29T12:00:00Z"},
		{"2022-01-01", "", "2024-03-10T02:00:00-08:00"},
		{"2022-01-01", "", "2024-06-15T13:45:30+09:00"},
		{"2022-01-01", "", "2024-07-04T23:59:59-07:00"},
		{"2022-01-01", "", "2024-08-30T18:30:00-04:00"},
		{"2022-01-01", "", "2024-09-21T00:00:00-03:00"},
		{"2022-01-01", "", "2024-10-31T17:00:00+00:00"},
		{"2022-01-01", "", "2024-11-05T08:00:00+01:00"},
		{"2022-01-01", "", "2024-12-25T00:00:00-05:00"},
		{"2022-01-01", "2022-01-31", "2022-01-01T00:00:00Z"},
		{"2023-02-01", "", "2023-02-28T23:59:59Z"},
		{"2023-02-01", "", "2023-03-12T02:00:00-07:00"},
		{"2023-02-01", "", "2023-07-19T14:30:00+09:00"},
		{"2023-02-01", "", "2023-07-19T14:30:00-07:00"},
		{"2023-02-01", "", "2023-07-19T14:30:00Z"},
		{"2023-02-01", "", "2023-11-05T01:00:00-08:00"},
		{"2023-02-01", "", "2023-12-31T23:59:59Z"},
		{"2023-02-01", "", "2024-01-01T00:00:00Z"},
		{"2023-02-01", "", "2024-02-29T12:00:00+05:30"},
		{"2023-02-01", "", "2024-02-29T12:00:00Z"},
		{"2023-02-01", "", "2024-03-10T02:00:00-08:00"},
		{"2023-02-01", "", "2024-06-15T13:45:30+09:00"},
		{"2023-02-01", "", "2024-07-04T23:59:59-07:00"},
		{"2023-02-01", "", "2024-08-30T18:30:00-04:00"},
		{"2023-02-01", "", "2024-09-21T00:00:00-03:00"},
		{"2023-02-01", "", "2024-10-31T17:00:00+00:00"},
		{"2023-02-01", "", "2024-11-05T08:00:00+01:00"},
		{"2023-02-01", "", "2024-12-25T00:00:00-05:00"},
		{"2023-02-01", "2023-02-28", "2023-02-28T23:59:59Z"},
		{"2023-03-10", "", "2023-03-12T02:00:00-07:00"},
		{"2023-03-10", "", "2023-07-19T14:30:00+09:00"},
		{"2023-03-10", "", "2023-07-19T14:30:00-07:00"},
		{"2023-03-10", "", "2023-07-19T14:30:00Z"},
		{"2023-03-10", "", "2023-11-05T01:00:00-08:00"},
		{"2023-03-10", "", "2023-12-31T23:59:59Z"},
		{"2023-03-10", "", "2024-01-01T00:00:00Z"},
		{"2023-03-10", "", "2024-02-29T12:00:00+05:30"},
		{"2023-03-10", "", "2024-02-29T12:00:00Z"},
		{"2023-03-10", "", "2024-03-10T02:00:00-08:00"},
		{"2023-03-10", "", "2024-06-15T13:45:30+09:00"},
		{"2023-03-10", "", "2024-07-04T23:59:59-07:00"},
		{"2023-03-10", "", "2024-08-30T18:30:00-04:00"},
		{"2023-03-10", "", "2024-09-21T00:00:00-03:00"},
		{"2023-03-10", "", "2024-10-31T17:00:00+00:00"},
		{"2023-03-10", "", "2024-11-05T08:00:00+01:00"},
		{"2023-03-10", "", "2024-12-25T00:00:00-05:00"},
		{"2023-03-10", "2023-03-12", "2023-03-12T02:00:00-07:00"},
		{"2023-07-01", "", "2023-07-19T14:30:00+09:00"},
		{"2023-07-01", "", "2023-07-19T14:30:00-07:00"},
		{"2023-07-01", "", "2023-07-19T14:30:00Z"},
		{"2023-07-01", "", "2023-11-05T01:00:00-08:00"},
		{"2023-07-01", "", "2023-12-31T23:59:59Z"},
		{"2023-07-01", "", "2024-01-01T00:00:00Z"},
		{"2023-07-01", "", "2024-02-29T12:00:00+05:30"},
		{"2023-07-01", "", "2024-02-29T12:00:00Z"},
		{"2023-07-01", "", "2024-03-10T02:00:00-08:00"},
		{"2023-07-01", "", "2024-06-15T13:45:30+09:00"},
		{"2023-07-01", "", "2024-07-04T23:59:59-07:00"},
		{"2023-07-01", "", "2024-08-30T18:30:00-04:00"},
		{"2023-07-01", "", "2024-09-21T00:00:00-03:00"},
		{"2023-07-01", "", "2024-10-31T17:00:00+00:00"},
		{"2023-07-01", "", "2024-11-05T08:00:00+01:00"},
		{"2023-07-01", "", "2024-12-25T00:00:00-05:00"},
		{"2023-07-01", "2023-07-31", "2023-07-19T14:30:00+09:00"},
		{"2023-07-01", "2023-07-31", "2023-07-19T14:30:00-07:00"},
		{"2023-07-01", "2023-07-31", "2023-07-19T14:30:00Z"},
		{"2023-11-04", "", "2023-11-05T01:00:00-08:00"},
		{"2023-11-04", "", "2023-12-31T23:59:59Z"},
		{"2023-11-04", "", "2024-01-01T00:00:00Z"},
		{"2023-11-04", "", "2024-02-29T12:00:00+05:30"},
		{"2023-11-04", "", "2024-02-29T12:00:00Z"},
		{"2023-11-04", "", "2024-03-10T02:00:00-08:00"},
		{"2023-11-04", "", "2024-06-15T13:45:30+09:00"},
		{"2023-11-04", "", "2024-07-04T23:59:59-07:00"},
		{"2023-11-04", "", "2024-08-30T18:30:00-04:00"},
		{"2023-11-04", "", "2024-09-21T00:00:00-03:00"},
		{"2023-11-04", "", "2024-10-31T17:00:00+00:00"},
		{"2023-11-04", "", "2024-11-05T08:00:00+01:00"},
		{"2023-11-04", "", "2024-12-25T00:00:00-05:00"},
		{"2023-11-04", "2023-11-06", "2023-11-05T01:00:00-08:00"},
		{"2023-12-01", "", "2023-12-31T23:59:59Z"},
		{"2023-12-01", "", "2024-01-01T00:00:00Z"},
		{"2023-12-01", "", "2024-02-29T12:00:00+05:30"},
		{"2023-12-01", "", "2024-02-29T12:00:00Z"},
		{"2023-12-01", "", "2024-03-10T02:00:00-08:00"},
		{"2023-12-01", "", "2024-06-15T13:45:30+09:00"},
		{"2023-12-01", "", "2024-07-04T23:59:59-07:00"},
		{"2023-12-01", "", "2024-08-30T18:30:00-04:00"},
		{"2023-12-01", "", "2024-09-21T00:00:00-03:00"},
		{"2023-12-01", "", "2024-10-31T17:00:00+00:00"},
		{"2023-12-01", "", "2024-11-05T08:00:00+01:00"},
		{"2023-12-01", "", "2024-12-25T00:00:00-05:00"},
		{"2023-12-01", "2023-12-31", "2023-12-31T23:59:59Z"},
		{"2024-01-01", "", "2024-01-01T00:00:00Z"},
		{"2024-01-01", "", "2024-02-29T12:00:00+05:30"},
		{"2024-01-01", "", "2024-02-29T12:00:00Z"},
		{"2024-01-01", "", "2024-03-10T02:00:00-08:00"},
		{"2024-01-01", "", "2024-06-15T13:45:30+09:00"},
		{"2024-01-01", "", "2024-07-04T23:59:59-07:00"},
		{"2024-01-01", "", "2024-08-30T18:30:00-04:00"},
		{"2024-01-01", "", "2024-09-21T00:00:00-03:00"},
		{"2024-01-01", "", "2024-10-31T17:00:00+00:00"},
		{"2024-01-01", "", "2024-11-05T08:00:00+01:00"},
		{"2024-01-01", "", "2024-12-25T00:00:00-05:00"},
		{"2024-01-01", "2024-01-31", "2024-01-01T00:00:00Z"},
		{"2024-02-01", "", "2024-02-29T12:00:00+05:30"},
		{"2024-02-01", "", "2024-02-29T12:00:00Z"},
		{"2024-02-01", "", "2024-03-10T02:00:00-08:00"},
		{"2024-02-01", "", "2024-06-15T13:45:30+09:00"},
		{"2024-02-01", "", "2024-07-04T23:59:59-07:00"},
		{"2024-02-01", "", "2024-08-30T18:30:00-04:00"},
		{"2024-02-01", "", "2024-09-21T00:00:00-03:00"},
		{"2024-02-01", "", "2024-10-31T17:00:00+00:00"},
		{"2024-02-01", "", "2024-11-05T08:00:00+01:00"},
		{"2024-02-01", "", "2024-12-25T00:00:00-05:00"},
		{"2024-02-01", "2024-02-29", "2024-02-29T12:00:00+05:30"},
		{"2024-02-01", "2024-02-29", "2024-02-29T12:00:00Z"},
		{"2024-03-09", "", "2024-03-10T02:00:00-08:00"},
		{"2024-03-09", "", "2024-06-15T13:45:30+09:00"},
		{"2024-03-09", "", "2024-07-04T23:59:59-07:00"},
		{"2024-03-09", "", "2024-08-30T18:30:00-04:00"},
		{"2024-03-09", "", "2024-09-21T00:00:00-03:00"},
		{"2024-03-09", "", "2024-10-31T17:00:00+00:00"},
		{"2024-03-09", "", "2024-11-05T08:00:00+01:00"},
		{"2024-03-09", "", "2024-12-25T00:00:00-05:00"},
		{"2024-03-09", "2024-03-11", "2024-03-10T02:00:00-08:00"},
		{"2024-06-01", "", "2024-06-15T13:45:30+09:00"},
		{"2024-06-01", "", "2024-07-04T23:59:59-07:00"},
		{"2024-06-01", "", "2024-08-30T18:30:00-04:00"},
		{"2024-06-01", "", "2024-09-21T00:00:00-03:00"},
		{"2024-06-01", "", "2024-10-31T17:00:00+00:00"},
		{"2024-06-01", "", "2024-11-05T08:00:00+01:00"},
		{"2024-06-01", "", "2024-12-25T00:00:00-05:00"},
		{"2024-06-01", "2024-06-15", "2024-06-15T13:45:30+09:00"},
		{"2024-07-01", "", "2024-07-04T23:59:59-07:00"},
		{"2024-07-01", "", "2024-08-30T18:30:00-04:00"},
		{"2024-07-01", "", "2024-09-21T00:00:00-03:00"},
		{"2024-07-01", "", "2024-10-31T17:00:00+00:00"},
		{"2024-07-01", "", "2024-11-05T08:00:00+01:00"},
		{"2024-07-01", "", "2024-12-25T00:00:00-05:00"},
		{"2024-08-15", "", "2024-08-30T18:30:00-04:00"},
		{"2024-08-15", "", "2024-09-21T00:00:00-03:00"},
		{"2024-08-15", "", "2024-10-31T17:00:00+00:00"},
		{"2024-08-15", "", "2024-11-05T08:00:00+01:00"},
		{"2024-08-15", "", "2024-12-25T00:00:00-05:00"},
		{"2024-08-15", "2024-08-30", "2024-08-30T18:30:00-04:00"},
		{"2024-09-20", "", "2024-09-21T00:00:00-03:00"},
		{"2024-09-20", "", "2024-10-31T17:00:00+00:00"},
		{"2024-09-20", "", "2024-11-05T08:00:00+01:00"},
		{"2024-09-20", "", "2024-12-25T00:00:00-05:00"},
		{"2024-09-20", "2024-09-22", "2024-09-21T00:00:00-03:00"},
		{"2024-10-01", "", "2024-10-31T17:00:00+00:00"},
		{"2024-10-01", "", "2024-11-05T08:00:00+01:00"},
		{"2024-10-01", "", "2024-12-25T00:00:00-05:00"},
		{"2024-10-01", "2024-10-31", "2024-10-31T17:00:00+00:00"},
		{"2024-11-01", "", "2024-11-05T08:00:00+01:00"},
		{"2024-11-01", "", "2024-12-25T00:00:00-05:00"},
		{"2024-11-01", "2024-11-05", "2024-11-05T08:00:00+01:00"},
		{"2024-12-24", "", "2024-12-25T00:00:00-05:00"},
		{"2024-12-24", "2024-12-26", "2024-12-25T00:00:00-05:00"},
	};
	return matches;
}

void range_test_cases(const std::vector<StringRange> &ranges, const std::vector<std::string> &values,
					  const std::function<bool(const StringRange &, const std::string &)> &f)
{
	std::set<MatchKey> seen;
	for (const auto &range : ranges) {
		// as given, then without start, then without end
		for (size_t i = 0; i < 3; ++i) {
			StringRange r = range;
			if (i != 0)
				r[i - 1].clear();
			for (const auto &value : values) {
				if (!seen.insert(MatchKey{r[0], r[1], value}).second)
					continue;
				if (!f(r, value))
					return;
			}
		}
	}
}

} // namespace TimestampDateKit::oracle
