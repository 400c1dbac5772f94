// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/bridge/Split.hpp"
#include "TimestampDateKit/bridge/Common.hpp"

#include <algorithm>
#include <cstring>

namespace TimestampDateKit::bridge
{

static std::string_view drop_cr(std::string_view line)
{
	if (!line.empty() && line.back() == '\r')
		line.remove_suffix(1);
	return line;
}

SplitResult split_lines(std::string_view data, bool at_eof)
{
	if (at_eof && data.empty())
		return {};
	if (const auto pos = data.find('\n'); pos != std::string_view::npos)
		return {pos + 1, drop_cr(data.substr(0, pos))};
	if (at_eof)
		return {data.size(), drop_cr(data)};
	return {};
}

RecordScanner::RecordScanner(SplitFunction split, size_t max_record_size)
	: m_split(std::move(split)), m_max_record_size(max_record_size)
{
}

RecordScanner::Status RecordScanner::scan(const Reader &read)
{
	m_record = {};
	for (;;) {
		if (m_done)
			return Status::end_of_input;

		const std::string_view pending(m_buffer.data() + m_start, m_end - m_start);
		if (!pending.empty() || m_eof) {
			const SplitResult result = m_split(pending, m_eof);
			if (result.advance > pending.size())
				TDK_BRIDGE_THROW(exception::ProtocolError, "split function advanced past the input");
			m_start += result.advance;
			if (result.record) {
				m_record = *result.record;
				return Status::record;
			}
			if (m_eof && result.advance == 0) {
				m_done = true;
				return Status::end_of_input;
			}
			if (result.advance > 0)
				continue;
		}

		if (m_start > 0) {
			std::memmove(m_buffer.data(), m_buffer.data() + m_start, m_end - m_start);
			m_end -= m_start;
			m_start = 0;
		}
		if (m_end == m_buffer.size()) {
			if (m_buffer.size() >= m_max_record_size)
				TDK_BRIDGE_THROW(exception::ProtocolError,
								 "record exceeds " + std::to_string(m_max_record_size) + " bytes");
			m_buffer.resize(std::min(std::max<size_t>(m_buffer.size() * 2, 4096), m_max_record_size));
		}
		const auto got = read(m_buffer.data() + m_end, m_buffer.size() - m_end);
		if (!got)
			return Status::interrupted;
		if (*got == 0)
			m_eof = true;
		else
			m_end += *got;
	}
}

} // namespace TimestampDateKit::bridge
