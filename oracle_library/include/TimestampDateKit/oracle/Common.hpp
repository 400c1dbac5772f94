// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_ORACLE_COMMON_HPP
#define TDK_ORACLE_COMMON_HPP

#include <cstdint>
#include <exception>
#include <string>

namespace TimestampDateKit::oracle
{

constexpr int64_t NS_PER_SEC = 1'000'000'000LL;
constexpr int64_t SEC_PER_DAY = 86'400LL;
constexpr int64_t NS_PER_DAY = SEC_PER_DAY * NS_PER_SEC;

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
struct InvalidTimestamp : public Exception {
	InvalidTimestamp(const std::string &msg, const char *file, unsigned long line)
		: Exception("InvalidTimestamp: " + msg, file, line)
	{
	}
};
struct InvalidDate : public Exception {
	InvalidDate(const std::string &msg, const char *file, unsigned long line)
		: Exception("InvalidDate: " + msg, file, line)
	{
	}
};
#define TDK_ORACLE_THROW(TYPE, MSG) throw TYPE(MSG, __FILE__, __LINE__)

} // namespace exception

} // namespace TimestampDateKit::oracle

#endif // TDK_ORACLE_COMMON_HPP
