// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/conformance/FuzzDriver.hpp"

#include <cstdlib>
#include <cstring>
#include <optional>
#include <type_traits>

namespace TimestampDateKit::conformance
{

using oracle::Date;
using oracle::Instant;
using oracle::NS_PER_DAY;
using oracle::NS_PER_SEC;

namespace
{

// random epochs are drawn from +-200 years around 1970
constexpr int64_t RANDOM_EPOCH_SPAN_NS = 200LL * 365 * NS_PER_DAY;
// decoded and generated bounds lie within this distance of each other
constexpr int64_t MAX_DELTA_DAYS = 2000;
constexpr int32_t MAX_OFFSET_S = 18 * 3600;

bool outside_window(int64_t ns)
{
	return ns > MAX_FUZZ_EPOCH_NS || ns < -MAX_FUZZ_EPOCH_NS;
}

std::string describe_bound(bool ignore, int64_t epoch_ns, int32_t offset_s)
{
	if (ignore)
		return "(unset)";
	if (outside_window(epoch_ns))
		return std::to_string(epoch_ns) + "ns";
	return Instant{epoch_ns, offset_s}.format();
}

template <typename T> T read_le(const uint8_t *&data, size_t &size)
{
	std::make_unsigned_t<T> value = 0;
	for (size_t i = 0; i < sizeof(T); ++i) {
		const uint8_t byte = size > 0 ? *data : 0;
		if (size > 0) {
			++data;
			--size;
		}
		value |= static_cast<std::make_unsigned_t<T>>(byte) << (8 * i);
	}
	return static_cast<T>(value);
}

// maps a raw value onto [-limit, limit]
int64_t fold(int64_t raw, int64_t limit)
{
	const uint64_t width = static_cast<uint64_t>(limit) * 2 + 1;
	return static_cast<int64_t>(static_cast<uint64_t>(raw) % width) - limit;
}

} // namespace

oracle::InstantRange FuzzCase::range() const
{
	oracle::InstantRange range;
	if (!ignore_start)
		range.start = Instant{start_epoch_ns, start_offset_s};
	if (!ignore_end)
		range.end = Instant{end_epoch_ns, end_offset_s};
	return range;
}

std::string FuzzCase::describe() const
{
	std::string value = outside_window(value_epoch_ns)
							? std::to_string(value_epoch_ns) + "ns"
							: Date::containing(Instant{value_epoch_ns, 0}).format();
	return "[" + describe_bound(ignore_start, start_epoch_ns, start_offset_s) + ", " +
		   describe_bound(ignore_end, end_epoch_ns, end_offset_s) + ") value " + value;
}

std::vector<FuzzCase> seed_corpus(const std::vector<oracle::StringRange> &ranges,
								  const std::vector<std::string> &values)
{
	std::vector<FuzzCase> corpus;
	oracle::range_test_cases(ranges, values, [&](const oracle::StringRange &range, const std::string &v) {
		std::optional<Instant> start, end;
		if (!range[0].empty())
			start = Instant::parse(range[0]);
		if (!range[1].empty())
			end = Instant::parse(range[1]);
		const int64_t value = Date::parse(v).midnight().unix_ns;

		// index 0 keeps the offset the bound was written with
		for (size_t i = 0; i <= FUZZ_OFFSETS.size(); ++i) {
			const int32_t start_offset = i == 0 ? (start ? start->offset_s : 0) : FUZZ_OFFSETS[i - 1];
			for (size_t j = 0; j <= FUZZ_OFFSETS.size(); ++j) {
				const int32_t end_offset = j == 0 ? (end ? end->offset_s : 0) : FUZZ_OFFSETS[j - 1];
				corpus.push_back(FuzzCase{start ? start->unix_ns : 0, start_offset,
										  end ? end->unix_ns : 0, end_offset, value, !start, !end});
			}
		}
		return true;
	});
	return corpus;
}

FuzzOutcome check_case(const FuzzCase &c, const oracle::TimestampToDate &convert)
{
	if (c.ignore_start && c.ignore_end)
		return FuzzOutcome::Skipped;
	if (!c.ignore_start && !c.ignore_end &&
		(c.end_epoch_ns <= c.start_epoch_ns ||
		 static_cast<uint64_t>(c.end_epoch_ns) - static_cast<uint64_t>(c.start_epoch_ns) <
			 static_cast<uint64_t>(NS_PER_DAY)))
		return FuzzOutcome::Skipped;
	if ((!c.ignore_start && (outside_window(c.start_epoch_ns) || std::abs(c.start_offset_s) > MAX_OFFSET_S)) ||
		(!c.ignore_end && (outside_window(c.end_epoch_ns) || std::abs(c.end_offset_s) > MAX_OFFSET_S)) ||
		outside_window(c.value_epoch_ns))
		return FuzzOutcome::Skipped;
	// a range covering no whole UTC day narrows to an inverted date range, which matches nothing
	const bool covers_whole_day =
		c.ignore_start || c.ignore_end ||
		oracle::widen_end(Instant{c.start_epoch_ns, 0}).unix_ns + NS_PER_DAY <= c.end_epoch_ns;

	const oracle::InstantRange range = c.range();
	const Date value_date = Date::containing(Instant{c.value_epoch_ns, 0});
	const std::string value = value_date.format();

	const oracle::DateRange output = convert(range);

	const auto fail = [&](const std::string &what) {
		TDK_CONFORMANCE_THROW(exception::AssertionFailure,
							  what + "\n\ttimestamp range " + c.describe() + "\n\t-> date range [" +
								  output.start + ", " + output.end + "]");
	};

	if (c.ignore_start != output.start.empty())
		fail(std::string("start bound ") + (c.ignore_start ? "unset" : "set") + " but start date is \"" +
			 output.start + "\"");
	if (c.ignore_end != output.end.empty())
		fail(std::string("end bound ") + (c.ignore_end ? "unset" : "set") + " but end date is \"" +
			 output.end + "\"");
	if (!c.ignore_start && !oracle::is_canonical_date(output.start))
		fail("start date \"" + output.start + "\" is not a canonical date");
	if (!c.ignore_end && !oracle::is_canonical_date(output.end))
		fail("end date \"" + output.end + "\" is not a canonical date");
	if (!c.ignore_start && !c.ignore_end && covers_whole_day && Date::parse(output.start) > Date::parse(output.end))
		fail("start date is after end date");

	const bool matches = oracle::matches_date(output, value);

	// the first and the last representable instant of the value's day
	const Instant lower = value_date.midnight();
	const Instant upper = lower.add(NS_PER_DAY - 1);
	const bool lower_matches = oracle::matches_instant(range, lower);
	const bool upper_matches = oracle::matches_instant(range, upper);

	// a date matches only if its whole day is inside the range
	if (matches != (lower_matches && upper_matches))
		fail(std::string("expected ") + (lower_matches && upper_matches ? "true" : "false") + " (" +
			 (lower_matches ? "true" : "false") + " && " + (upper_matches ? "true" : "false") +
			 "), got " + (matches ? "true" : "false") + " matching date " + value + " between " +
			 lower.format() + " and " + upper.format() + " (inclusive)");

	return FuzzOutcome::Checked;
}

FuzzCase random_case(std::mt19937_64 &engine, const std::vector<FuzzCase> &seeds)
{
	std::uniform_int_distribution<size_t> offset_index(0, FUZZ_OFFSETS.size() - 1);
	std::uniform_int_distribution<int> coin(0, 1);
	const auto random_offset = [&] { return FUZZ_OFFSETS[offset_index(engine)]; };

	std::uniform_int_distribution<int> choice(0, 9);
	if (seeds.empty() || choice(engine) == 0) {
		std::uniform_int_distribution<int64_t> epoch(-RANDOM_EPOCH_SPAN_NS, RANDOM_EPOCH_SPAN_NS);
		std::uniform_int_distribution<int64_t> delta(0, MAX_DELTA_DAYS * NS_PER_DAY);
		FuzzCase c;
		c.start_epoch_ns = epoch(engine);
		c.end_epoch_ns = coin(engine) ? epoch(engine) : c.start_epoch_ns + delta(engine);
		c.value_epoch_ns = coin(engine) ? epoch(engine) : c.start_epoch_ns + delta(engine) - NS_PER_DAY;
		c.start_offset_s = random_offset();
		c.end_offset_s = random_offset();
		c.ignore_start = choice(engine) == 0;
		c.ignore_end = choice(engine) == 0;
		return c;
	}

	std::uniform_int_distribution<size_t> pick(0, seeds.size() - 1);
	FuzzCase c = seeds[pick(engine)];

	static constexpr std::array<int64_t, 4> scales{1, NS_PER_SEC, 3600 * NS_PER_SEC, NS_PER_DAY};
	std::uniform_int_distribution<size_t> scale_index(0, scales.size() - 1);
	std::uniform_int_distribution<int64_t> amount(-1000, 1000);
	const auto jitter = [&](int64_t &epoch) { epoch += amount(engine) * scales[scale_index(engine)]; };

	std::uniform_int_distribution<int> mutations(1, 3);
	std::uniform_int_distribution<int> mutation(0, 6);
	for (int i = mutations(engine); i > 0; --i) {
		switch (mutation(engine)) {
		case 0:
			jitter(c.start_epoch_ns);
			break;
		case 1:
			jitter(c.end_epoch_ns);
			break;
		case 2:
			jitter(c.value_epoch_ns);
			break;
		case 3:
			c.start_offset_s = random_offset();
			break;
		case 4:
			c.end_offset_s = random_offset();
			break;
		case 5:
			c.ignore_start = !c.ignore_start;
			break;
		default:
			c.ignore_end = !c.ignore_end;
			break;
		}
	}
	return c;
}

FuzzCase decode_fuzz_case(const uint8_t *data, size_t size)
{
	// start epoch, start offset, end delta, end offset, value delta, flags
	const int64_t start_raw = read_le<int64_t>(data, size);
	const uint8_t start_offset = read_le<uint8_t>(data, size);
	const int64_t end_raw = read_le<int64_t>(data, size);
	const uint8_t end_offset = read_le<uint8_t>(data, size);
	const int64_t value_raw = read_le<int64_t>(data, size);
	const uint8_t flags = read_le<uint8_t>(data, size);

	FuzzCase c;
	c.start_epoch_ns = fold(start_raw, RANDOM_EPOCH_SPAN_NS);
	c.start_offset_s = FUZZ_OFFSETS[start_offset % FUZZ_OFFSETS.size()];
	c.end_epoch_ns = c.start_epoch_ns + fold(end_raw, MAX_DELTA_DAYS * NS_PER_DAY);
	c.end_offset_s = FUZZ_OFFSETS[end_offset % FUZZ_OFFSETS.size()];
	c.value_epoch_ns = c.start_epoch_ns + fold(value_raw, MAX_DELTA_DAYS * NS_PER_DAY);
	c.ignore_start = (flags & 0x1) != 0;
	c.ignore_end = (flags & 0x2) != 0;
	return c;
}

FuzzReport fuzz(const std::vector<FuzzCase> &seeds, const oracle::TimestampToDate &convert,
				size_t iterations, uint64_t seed, const Reporter &reporter)
{
	const auto report = [&reporter](Level level, const std::string &message) {
		if (reporter)
			reporter(level, message);
	};

	FuzzReport result;
	const auto run = [&](const FuzzCase &c) {
		if (check_case(c, convert) == FuzzOutcome::Checked)
			++result.checked;
		else
			++result.skipped;
	};

	report(Level::info, "checking " + std::to_string(seeds.size()) + " seed cases");
	for (const auto &c : seeds)
		run(c);

	report(Level::info, "checking " + std::to_string(iterations) + " random cases with seed " +
							std::to_string(seed));
	std::mt19937_64 engine(seed);
	for (size_t i = 0; i < iterations; ++i) {
		run(random_case(engine, seeds));
		if ((i + 1) % 10000 == 0)
			report(Level::verbose, std::to_string(i + 1) + " random cases checked");
	}

	report(Level::info, std::to_string(result.checked) + " cases checked, " +
							std::to_string(result.skipped) + " skipped");
	return result;
}

} // namespace TimestampDateKit::conformance
