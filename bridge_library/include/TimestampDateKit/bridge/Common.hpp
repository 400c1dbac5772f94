// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_BRIDGE_COMMON_HPP
#define TDK_BRIDGE_COMMON_HPP

#include <exception>
#include <string>

namespace TimestampDateKit::bridge::exception
{
struct Exception : public std::exception {
	Exception(const std::string &msg, const char *file, unsigned long line)
		: message(msg + " at " + file + ":" + std::to_string(line))
	{
	}
	const char *what() const noexcept override { return message.c_str(); }

  private:
	std::string message;
};
// malformed or unparseable output from the external command
struct ProtocolError : public Exception {
	ProtocolError(const std::string &msg, const char *file, unsigned long line)
		: Exception("ProtocolError: " + msg, file, line)
	{
	}
};
// the external command failed to start, exited, or its pipes broke
struct ProcessError : public Exception {
	ProcessError(const std::string &msg, const char *file, unsigned long line)
		: Exception("ProcessError: " + msg, file, line)
	{
	}
};
// the caller cancelled, or a deadline expired
struct CancellationError : public Exception {
	CancellationError(const std::string &msg, const char *file, unsigned long line)
		: Exception("CancellationError: " + msg, file, line)
	{
	}
};
#define TDK_BRIDGE_THROW(TYPE, MSG) throw TYPE(MSG, __FILE__, __LINE__)
#define TDK_BRIDGE_ERROR(TYPE, MSG) std::make_exception_ptr(TYPE(MSG, __FILE__, __LINE__))

} // namespace TimestampDateKit::bridge::exception

#endif // TDK_BRIDGE_COMMON_HPP
