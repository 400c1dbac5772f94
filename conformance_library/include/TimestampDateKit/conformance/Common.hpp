// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_CONFORMANCE_COMMON_HPP
#define TDK_CONFORMANCE_COMMON_HPP

#include <exception>
#include <functional>
#include <string>

namespace TimestampDateKit::conformance
{

enum class Level { info, verbose, error };

// Sink for progress and diagnostics; the library itself never prints.
using Reporter = std::function<void(Level level, const std::string &message)>;

namespace exception
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
// the implementation under test disagrees with the reference
struct AssertionFailure : public Exception {
	AssertionFailure(const std::string &msg, const char *file, unsigned long line)
		: Exception("AssertionFailure: " + msg, file, line)
	{
	}
};
struct ConfigurationError : public Exception {
	ConfigurationError(const std::string &msg, const char *file, unsigned long line)
		: Exception("ConfigurationError: " + msg, file, line)
	{
	}
};
#define TDK_CONFORMANCE_THROW(TYPE, MSG) throw TYPE(MSG, __FILE__, __LINE__)

} // namespace exception

} // namespace TimestampDateKit::conformance

#endif // TDK_CONFORMANCE_COMMON_HPP
