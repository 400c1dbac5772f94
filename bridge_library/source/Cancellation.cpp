// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/bridge/Cancellation.hpp"
#include "TimestampDateKit/bridge/Common.hpp"

#include <condition_variable>
#include <string>

namespace TimestampDateKit::bridge
{

bool CancellationSource::cancel(std::exception_ptr cause)
{
	{
		std::lock_guard lock(m_mutex);
		if (m_cause)
			return false;
		m_cause = cause ? cause : TDK_BRIDGE_ERROR(exception::CancellationError, "cancelled");
	}
	m_source.request_stop();
	return true;
}

std::exception_ptr CancellationSource::cause() const
{
	std::lock_guard lock(m_mutex);
	return m_cause;
}

void CancellationSource::rethrow_cause() const
{
	auto cause = this->cause();
	if (!cause)
		TDK_BRIDGE_THROW(exception::CancellationError, "not cancelled");
	std::rethrow_exception(cause);
}

Deadline::Deadline(CancellationSource &source, std::chrono::nanoseconds timeout)
	: m_timer([&source, timeout](std::stop_token stop) {
		  std::mutex mutex;
		  std::condition_variable_any cv;
		  std::unique_lock lock(mutex);
		  cv.wait_for(lock, stop, timeout, [] { return false; });
		  if (stop.stop_requested())
			  return;
		  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
		  source.cancel(TDK_BRIDGE_ERROR(exception::CancellationError,
										 "timeout after " + std::to_string(ms) + "ms"));
	  })
{
}

} // namespace TimestampDateKit::bridge
