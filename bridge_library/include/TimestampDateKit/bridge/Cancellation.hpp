// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_BRIDGE_CANCELLATION_HPP
#define TDK_BRIDGE_CANCELLATION_HPP

#include <chrono>
#include <exception>
#include <mutex>
#include <stop_token>
#include <thread>

namespace TimestampDateKit::bridge
{

/**
 * One-shot cancellation signal carrying a cause.
 *
 * The first recorded cause wins, later cancel() calls are ignored. The cause
 * is stored before the stop is requested, so anything woken through token()
 * can read it.
 */
class CancellationSource
{
  public:
	CancellationSource() = default;
	~CancellationSource() = default;

	CancellationSource(const CancellationSource &) = delete;
	CancellationSource &operator=(const CancellationSource &) = delete;
	CancellationSource(CancellationSource &&) = delete;
	CancellationSource &operator=(CancellationSource &&) = delete;

	// true if this call recorded the cause; nullptr means plain cancellation
	bool cancel(std::exception_ptr cause = nullptr);

	[[nodiscard]] bool cancelled() const noexcept { return m_source.stop_requested(); }
	[[nodiscard]] std::stop_token token() const noexcept { return m_source.get_token(); }
	[[nodiscard]] std::exception_ptr cause() const;

	[[noreturn]] void rethrow_cause() const; // requires cancelled()

  private:
	std::stop_source m_source;
	mutable std::mutex m_mutex;
	std::exception_ptr m_cause;
};

/**
 * Cancels a source with a CancellationError once the timeout elapses,
 * unless the Deadline is destroyed first.
 */
class Deadline
{
  public:
	Deadline(CancellationSource &source, std::chrono::nanoseconds timeout);
	~Deadline() = default; // jthread requests stop and joins

	Deadline(const Deadline &) = delete;
	Deadline &operator=(const Deadline &) = delete;

  private:
	std::jthread m_timer;
};

} // namespace TimestampDateKit::bridge

#endif // TDK_BRIDGE_CANCELLATION_HPP
