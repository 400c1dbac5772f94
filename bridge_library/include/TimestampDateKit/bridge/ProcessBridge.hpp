// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_BRIDGE_PROCESSBRIDGE_HPP
#define TDK_BRIDGE_PROCESSBRIDGE_HPP

#include "TimestampDateKit/bridge/Cancellation.hpp"
#include "TimestampDateKit/bridge/Channel.hpp"
#include "TimestampDateKit/bridge/Common.hpp"
#include "TimestampDateKit/bridge/Split.hpp"
#include "TimestampDateKit/bridge/Subprocess.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace TimestampDateKit::bridge
{

template <typename Input, typename Output> struct Codec {
	std::function<void(std::string &buffer, const Input &input)> append_input;
	SplitFunction split_output = split_lines;
	std::function<Output(std::string_view record)> parse_output;
};

enum class BridgeState { Starting, Running, Completed, Failed, Cancelled };

inline const char *to_string(BridgeState state) noexcept
{
	switch (state) {
	case BridgeState::Starting:
		return "starting";
	case BridgeState::Running:
		return "running";
	case BridgeState::Completed:
		return "completed";
	case BridgeState::Failed:
		return "failed";
	case BridgeState::Cancelled:
		return "cancelled";
	}
	return "unknown";
}

/**
 * Turns an external process into a synchronous call(Input) -> Output.
 *
 * Each request is encoded with the codec and written to the child's stdin,
 * the child's stdout is split into records and each record is parsed into
 * one response. One call is in flight at a time.
 *
 * Three threads serve a bridge: an input pump, an output pump and a
 * supervisor waiting for the child to exit. They share one cancellation;
 * the first failure, exit or cancellation is recorded as the cause, moves
 * the bridge into a terminal state and is rethrown by every later call.
 *
 * The destructor cancels, kills a still running child and joins all threads.
 */
template <typename Input, typename Output> class ProcessBridge
{
  public:
	using CauseGetter = std::function<std::exception_ptr()>;

	ProcessBridge(const Command &command, Codec<Input, Output> codec,
				  std::stop_token parent = {}, CauseGetter parent_cause = {})
		: m_codec(std::move(codec))
	{
		try {
			Pipe input = Pipe::create();
			Pipe output = Pipe::create();
			m_process =
				Subprocess::start(command, std::move(input.read_end), std::move(output.write_end));
			m_stdin = std::move(input.write_end);
			m_stdout = std::move(output.read_end);
			set_nonblocking(m_stdin);
			set_nonblocking(m_stdout);
		} catch (const exception::ProcessError &) {
			terminate(BridgeState::Failed, std::current_exception());
			return;
		}

		m_on_cancel.emplace(m_cancel.token(), [this] {
			m_wake.notify();
			m_process->kill();
		});
		m_input_thread = std::thread(&ProcessBridge::input_pump, this);
		m_output_thread = std::thread(&ProcessBridge::output_pump, this);
		m_supervisor_thread = std::thread(&ProcessBridge::supervise, this);
		{
			std::lock_guard lock(m_state_mutex);
			if (m_state == BridgeState::Starting)
				m_state = BridgeState::Running;
		}

		m_on_parent_stop.emplace(std::move(parent),
								 [this, parent_cause = std::move(parent_cause)] {
									 std::exception_ptr cause = parent_cause ? parent_cause() : nullptr;
									 if (!cause)
										 cause = TDK_BRIDGE_ERROR(exception::CancellationError, "cancelled");
									 terminate(BridgeState::Cancelled, cause);
								 });
	}

	// cancellation of the parent source carries its cause into the bridge
	ProcessBridge(const Command &command, Codec<Input, Output> codec, const CancellationSource &parent)
		: ProcessBridge(command, std::move(codec), parent.token(), [&parent] { return parent.cause(); })
	{
	}

	~ProcessBridge()
	{
		m_on_parent_stop.reset();
		terminate(BridgeState::Cancelled, TDK_BRIDGE_ERROR(exception::CancellationError, "bridge closed"));
		for (auto *thread : {&m_input_thread, &m_output_thread, &m_supervisor_thread})
			if (thread->joinable())
				thread->join();
		m_on_cancel.reset();
	}

	ProcessBridge(const ProcessBridge &) = delete;
	ProcessBridge &operator=(const ProcessBridge &) = delete;

	// throws the terminal cause, or whatever append_input throws
	Output call(const Input &input)
	{
		std::lock_guard lock(m_call_mutex);
		if (m_cancel.cancelled())
			m_cancel.rethrow_cause();

		const auto stop = m_cancel.token();
		m_buffer.clear();
		m_codec.append_input(m_buffer, input);
		// the pump may still hold the previous request when the child answers early
		if (!m_requests.send(std::string(m_buffer), stop))
			m_cancel.rethrow_cause();
		auto response = m_responses.receive(stop);
		if (!response)
			m_cancel.rethrow_cause();
		return std::move(*response);
	}

	// from any thread; nullptr means plain cancellation
	void cancel(std::exception_ptr cause = nullptr)
	{
		terminate(BridgeState::Cancelled,
				  cause ? cause : TDK_BRIDGE_ERROR(exception::CancellationError, "cancelled"));
	}

	[[nodiscard]] BridgeState state() const
	{
		std::lock_guard lock(m_state_mutex);
		return m_state;
	}
	[[nodiscard]] std::exception_ptr cause() const { return m_cancel.cause(); }
	[[nodiscard]] std::stop_token token() const noexcept { return m_cancel.token(); }

  private:
	void terminate(BridgeState state, std::exception_ptr cause)
	{
		std::lock_guard lock(m_state_mutex);
		if (m_cancel.cancel(std::move(cause)))
			m_state = state;
	}

	void input_pump()
	{
		try {
			block_sigpipe_in_this_thread();
			const auto stop = m_cancel.token();
			while (auto request = m_requests.receive(stop)) {
				if (!write_all(m_stdin, *request, m_wake))
					return;
			}
		} catch (const exception::Exception &) {
			terminate(BridgeState::Failed, std::current_exception());
		} catch (const std::exception &e) {
			terminate(BridgeState::Failed, TDK_BRIDGE_ERROR(exception::ProcessError, e.what()));
		}
	}

	void output_pump()
	{
		try {
			RecordScanner scanner(m_codec.split_output);
			const RecordScanner::Reader read = [this](char *buffer, size_t size) {
				return read_some(m_stdout, buffer, size, m_wake);
			};
			const auto stop = m_cancel.token();
			while (scanner.scan(read) == RecordScanner::Status::record) {
				if (!m_responses.send(parse(scanner.record()), stop))
					return;
			}
		} catch (const exception::Exception &) {
			terminate(BridgeState::Failed, std::current_exception());
		} catch (const std::exception &e) {
			terminate(BridgeState::Failed, TDK_BRIDGE_ERROR(exception::ProcessError, e.what()));
		}
	}

	Output parse(std::string_view record)
	{
		try {
			return m_codec.parse_output(record);
		} catch (const exception::Exception &) {
			throw;
		} catch (const std::exception &e) {
			TDK_BRIDGE_THROW(exception::ProtocolError, std::string("cannot parse output: ") + e.what());
		}
	}

	void supervise()
	{
		try {
			const ExitStatus status = m_process->wait();
			if (status.success())
				terminate(BridgeState::Completed,
						  TDK_BRIDGE_ERROR(exception::ProcessError, "external command exited"));
			else
				terminate(BridgeState::Failed,
						  TDK_BRIDGE_ERROR(exception::ProcessError, "external command " + status.to_string()));
		} catch (const exception::Exception &) {
			terminate(BridgeState::Failed, std::current_exception());
		} catch (const std::exception &e) {
			terminate(BridgeState::Failed, TDK_BRIDGE_ERROR(exception::ProcessError, e.what()));
		}
	}

	Codec<Input, Output> m_codec;
	CancellationSource m_cancel;
	mutable std::mutex m_state_mutex;
	BridgeState m_state{BridgeState::Starting};

	WakeEvent m_wake;
	FileDescriptor m_stdin;
	FileDescriptor m_stdout;
	std::unique_ptr<Subprocess> m_process;

	Channel<std::string> m_requests{1};
	Channel<Output> m_responses{1};
	std::mutex m_call_mutex;
	std::string m_buffer;

	std::thread m_input_thread;
	std::thread m_output_thread;
	std::thread m_supervisor_thread;
	std::optional<std::stop_callback<std::function<void()>>> m_on_cancel;
	std::optional<std::stop_callback<std::function<void()>>> m_on_parent_stop;
};

/**
 * Runs f(token, call) against a bridge that lives for the duration of f.
 * call is a callable Input -> Output, token reports the bridge's cancellation.
 */
template <typename Input, typename Output, typename Function>
decltype(auto) run(const Command &command, Codec<Input, Output> codec, std::stop_token parent,
				   Function &&f)
{
	ProcessBridge<Input, Output> bridge(command, std::move(codec), std::move(parent));
	return std::forward<Function>(f)(bridge.token(),
									 [&bridge](const Input &input) { return bridge.call(input); });
}

} // namespace TimestampDateKit::bridge

#endif // TDK_BRIDGE_PROCESSBRIDGE_HPP
