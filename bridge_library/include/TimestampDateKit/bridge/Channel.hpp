// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_BRIDGE_CHANNEL_HPP
#define TDK_BRIDGE_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace TimestampDateKit::bridge
{

/**
 * Bounded FIFO hand-off between threads.
 *
 * Both directions block until they can proceed or until the given stop token
 * is signalled, so no waiter outlives a cancellation.
 */
template <typename T> class Channel
{
  public:
	explicit Channel(size_t capacity = 1) : m_capacity(capacity == 0 ? 1 : capacity) {}

	Channel(const Channel &) = delete;
	Channel &operator=(const Channel &) = delete;

	// false if stopped before the value was accepted
	bool send(T value, std::stop_token stop)
	{
		std::unique_lock lock(m_mutex);
		if (!m_cv.wait(lock, stop, [this] { return m_queue.size() < m_capacity; }))
			return false;
		m_queue.push_back(std::move(value));
		m_cv.notify_all();
		return true;
	}

	// nullopt if stopped while empty
	std::optional<T> receive(std::stop_token stop)
	{
		std::unique_lock lock(m_mutex);
		if (!m_cv.wait(lock, stop, [this] { return !m_queue.empty(); }))
			return std::nullopt;
		std::optional<T> value{std::move(m_queue.front())};
		m_queue.pop_front();
		m_cv.notify_all();
		return value;
	}

	[[nodiscard]] size_t size() const
	{
		std::lock_guard lock(m_mutex);
		return m_queue.size();
	}

	[[nodiscard]] size_t capacity() const noexcept { return m_capacity; }

  private:
	const size_t m_capacity;
	mutable std::mutex m_mutex;
	std::condition_variable_any m_cv;
	std::deque<T> m_queue;
};

} // namespace TimestampDateKit::bridge

#endif // TDK_BRIDGE_CHANNEL_HPP
