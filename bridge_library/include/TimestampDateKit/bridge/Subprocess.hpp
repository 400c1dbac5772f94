// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TDK_BRIDGE_SUBPROCESS_HPP
#define TDK_BRIDGE_SUBPROCESS_HPP

#include <csignal>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace TimestampDateKit::bridge
{

struct Command {
	std::string executable; // resolved through PATH
	std::vector<std::string> args;
	std::filesystem::path directory; // empty: inherit the working directory

	[[nodiscard]] std::string to_string() const;
};

// Owns a file descriptor, closes it on destruction.
class FileDescriptor
{
  public:
	explicit FileDescriptor(int fd = -1) noexcept : m_fd(fd) {}
	~FileDescriptor() { reset(); }

	FileDescriptor(const FileDescriptor &) = delete;
	FileDescriptor &operator=(const FileDescriptor &) = delete;
	FileDescriptor(FileDescriptor &&other) noexcept : m_fd(other.release()) {}
	FileDescriptor &operator=(FileDescriptor &&other) noexcept
	{
		if (this != &other)
			reset(other.release());
		return *this;
	}

	[[nodiscard]] int get() const noexcept { return m_fd; }
	[[nodiscard]] explicit operator bool() const noexcept { return m_fd >= 0; }
	int release() noexcept
	{
		const int fd = m_fd;
		m_fd = -1;
		return fd;
	}
	void reset(int fd = -1) noexcept;

  private:
	int m_fd;
};

struct Pipe {
	FileDescriptor read_end;
	FileDescriptor write_end;

	static Pipe create(); // close-on-exec, throws ProcessError
};

void set_nonblocking(const FileDescriptor &fd);

// SIGPIPE is delivered to the writing thread; blocked there, a broken pipe
// surfaces as EPIPE instead of terminating the process.
void block_sigpipe_in_this_thread();

/**
 * Level-triggered wake-up for threads blocked in poll().
 * Once notified it stays readable for good.
 */
class WakeEvent
{
  public:
	WakeEvent(); // throws ProcessError
	void notify() noexcept;
	[[nodiscard]] int fd() const noexcept { return m_fd.get(); }

  private:
	FileDescriptor m_fd;
};

// false if woken before everything was written; throws ProcessError on I/O errors
bool write_all(const FileDescriptor &fd, std::string_view data, const WakeEvent &wake);

// nullopt if woken, 0 at end of file; throws ProcessError on I/O errors
std::optional<size_t> read_some(const FileDescriptor &fd, char *buffer, size_t size,
								const WakeEvent &wake);

struct ExitStatus {
	int code = 0;	// exit code, valid if signal == 0
	int signal = 0; // terminating signal

	[[nodiscard]] bool success() const noexcept { return signal == 0 && code == 0; }
	[[nodiscard]] std::string to_string() const;
};

/**
 * A child process with its stdin and stdout redirected; stderr is inherited.
 *
 * kill() is safe to call from any thread while another thread is blocked in
 * wait(): the child is only reaped once the exit has been observed, so a
 * signal is never sent to a recycled pid.
 */
class Subprocess
{
  public:
	// Takes ownership of the child's ends of the pipes and closes them in the
	// parent. Throws ProcessError if the command cannot be executed.
	static std::unique_ptr<Subprocess> start(const Command &command, FileDescriptor child_stdin,
											 FileDescriptor child_stdout);

	~Subprocess(); // kills and reaps a child nobody waited for

	Subprocess(const Subprocess &) = delete;
	Subprocess &operator=(const Subprocess &) = delete;

	[[nodiscard]] pid_t pid() const noexcept { return m_pid; }

	ExitStatus wait(); // blocks until exit, reaps
	void kill(int signal = SIGKILL) noexcept;

  private:
	explicit Subprocess(pid_t pid) noexcept : m_pid(pid) {}

	const pid_t m_pid;
	std::mutex m_mutex;
	bool m_reaped{false};
	ExitStatus m_status{};
};

} // namespace TimestampDateKit::bridge

#endif // TDK_BRIDGE_SUBPROCESS_HPP
