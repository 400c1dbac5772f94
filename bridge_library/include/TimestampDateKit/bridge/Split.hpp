// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_BRIDGE_SPLIT_HPP
#define TDK_BRIDGE_SPLIT_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace TimestampDateKit::bridge
{

struct SplitResult {
	size_t advance = 0;						// bytes consumed from the input
	std::optional<std::string_view> record; // view into the input, if one is complete
};

// Called with the buffered, not yet consumed bytes. at_eof is set once no more
// data will arrive. Returning no record and advance 0 asks for more data.
using SplitFunction = std::function<SplitResult(std::string_view data, bool at_eof)>;

// newline terminated records, a trailing CR is dropped, an unterminated last
// record is delivered at end of input
SplitResult split_lines(std::string_view data, bool at_eof);

/**
 * Cuts a byte stream into records with a SplitFunction.
 *
 * scan() pulls data through a reader until a record is complete. The record
 * view stays valid until the next scan().
 */
class RecordScanner
{
  public:
	static constexpr size_t MAX_RECORD_SIZE = 64 * 1024;

	enum class Status { record, end_of_input, interrupted };

	// bytes read into buffer, 0 at end of input, nullopt if interrupted
	using Reader = std::function<std::optional<size_t>(char *buffer, size_t size)>;

	explicit RecordScanner(SplitFunction split, size_t max_record_size = MAX_RECORD_SIZE);

	// throws ProtocolError for oversized records or a misbehaving split function
	Status scan(const Reader &read);
	[[nodiscard]] std::string_view record() const noexcept { return m_record; }

  private:
	SplitFunction m_split;
	const size_t m_max_record_size;
	std::string m_buffer;
	size_t m_start{0};
	size_t m_end{0};
	bool m_eof{false};
	bool m_done{false};
	std::string_view m_record;
};

} // namespace TimestampDateKit::bridge

#endif // TDK_BRIDGE_SPLIT_HPP
