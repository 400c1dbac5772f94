// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TimestampDateKit/bridge/Subprocess.hpp"
#include "TimestampDateKit/bridge/Common.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/eventfd.h>
#include <sys/wait.h>
#include <unistd.h>

namespace TimestampDateKit::bridge
{

static std::string errno_string(int error)
{
	return std::strerror(error);
}

std::string Command::to_string() const
{
	std::string out = executable;
	for (const auto &arg : args) {
		out += ' ';
		out += arg;
	}
	return out;
}

void FileDescriptor::reset(int fd) noexcept
{
	if (m_fd >= 0)
		::close(m_fd);
	m_fd = fd;
}

Pipe Pipe::create()
{
	std::array<int, 2> fds{};
	if (::pipe2(fds.data(), O_CLOEXEC) != 0)
		TDK_BRIDGE_THROW(exception::ProcessError, "pipe2 failed: " + errno_string(errno));
	return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
}

void set_nonblocking(const FileDescriptor &fd)
{
	const int flags = ::fcntl(fd.get(), F_GETFL);
	if (flags < 0 || ::fcntl(fd.get(), F_SETFL, flags | O_NONBLOCK) < 0)
		TDK_BRIDGE_THROW(exception::ProcessError, "fcntl failed: " + errno_string(errno));
}

void block_sigpipe_in_this_thread()
{
	sigset_t set;
	sigemptyset(&set);
	sigaddset(&set, SIGPIPE);
	const int rc = ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
	if (rc != 0)
		TDK_BRIDGE_THROW(exception::ProcessError, "pthread_sigmask failed: " + errno_string(rc));
}

WakeEvent::WakeEvent() : m_fd(::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK))
{
	if (!m_fd)
		TDK_BRIDGE_THROW(exception::ProcessError, "eventfd failed: " + errno_string(errno));
}

void WakeEvent::notify() noexcept
{
	const uint64_t one = 1;
	// EAGAIN means the counter is saturated, the fd is readable either way
	while (::write(m_fd.get(), &one, sizeof(one)) < 0 && errno == EINTR) {
	}
}

// true when fd is ready (or hung up), false when woken
static bool wait_ready(int fd, short events, const WakeEvent &wake)
{
	std::array<pollfd, 2> fds{{{fd, events, 0}, {wake.fd(), POLLIN, 0}}};
	for (;;) {
		const int rc = ::poll(fds.data(), fds.size(), -1);
		if (rc < 0) {
			if (errno == EINTR)
				continue;
			TDK_BRIDGE_THROW(exception::ProcessError, "poll failed: " + errno_string(errno));
		}
		if (fds[1].revents != 0)
			return false;
		if (fds[0].revents != 0)
			return true;
	}
}

bool write_all(const FileDescriptor &fd, std::string_view data, const WakeEvent &wake)
{
	while (!data.empty()) {
		if (!wait_ready(fd.get(), POLLOUT, wake))
			return false;
		const ssize_t written = ::write(fd.get(), data.data(), data.size());
		if (written < 0) {
			if (errno == EINTR || errno == EAGAIN)
				continue;
			TDK_BRIDGE_THROW(exception::ProcessError,
							 "write to external command failed: " + errno_string(errno));
		}
		data.remove_prefix(static_cast<size_t>(written));
	}
	return true;
}

std::optional<size_t> read_some(const FileDescriptor &fd, char *buffer, size_t size,
								const WakeEvent &wake)
{
	for (;;) {
		if (!wait_ready(fd.get(), POLLIN, wake))
			return std::nullopt;
		const ssize_t got = ::read(fd.get(), buffer, size);
		if (got >= 0)
			return static_cast<size_t>(got);
		if (errno == EINTR || errno == EAGAIN)
			continue;
		TDK_BRIDGE_THROW(exception::ProcessError,
						 "read from external command failed: " + errno_string(errno));
	}
}

std::string ExitStatus::to_string() const
{
	if (signal != 0) {
		const char *name = ::strsignal(signal);
		return "killed by signal " + std::to_string(signal) + (name ? " (" + std::string(name) + ")" : "");
	}
	return "exited with status " + std::to_string(code);
}

// only async-signal-safe calls between fork and exec
[[noreturn]] static void child_fail(int status_fd)
{
	const int error = errno;
	while (::write(status_fd, &error, sizeof(error)) < 0 && errno == EINTR) {
	}
	::_exit(127);
}

static void redirect(int from, int to, int status_fd)
{
	if (from == to) {
		const int flags = ::fcntl(from, F_GETFD);
		if (flags < 0 || ::fcntl(from, F_SETFD, flags & ~FD_CLOEXEC) < 0)
			child_fail(status_fd);
	} else if (::dup2(from, to) < 0) {
		child_fail(status_fd);
	}
}

std::unique_ptr<Subprocess> Subprocess::start(const Command &command, FileDescriptor child_stdin,
											  FileDescriptor child_stdout)
{
	if (command.executable.empty())
		TDK_BRIDGE_THROW(exception::ProcessError, "empty command");

	std::vector<std::string> storage;
	storage.reserve(command.args.size() + 1);
	storage.push_back(command.executable);
	storage.insert(storage.end(), command.args.begin(), command.args.end());
	std::vector<char *> argv;
	for (auto &arg : storage)
		argv.push_back(arg.data());
	argv.push_back(nullptr);
	const std::string directory = command.directory.string();

	// closed by a successful exec, carries errno otherwise
	Pipe status = Pipe::create();

	const pid_t pid = ::fork();
	if (pid < 0)
		TDK_BRIDGE_THROW(exception::ProcessError, "fork failed: " + errno_string(errno));
	if (pid == 0) {
		const int status_fd = status.write_end.get();
		redirect(child_stdin.get(), STDIN_FILENO, status_fd);
		redirect(child_stdout.get(), STDOUT_FILENO, status_fd);
		if (!directory.empty() && ::chdir(directory.c_str()) != 0)
			child_fail(status_fd);
		::execvp(argv[0], argv.data());
		child_fail(status_fd);
	}

	status.write_end.reset();
	child_stdin.reset();
	child_stdout.reset();
	std::unique_ptr<Subprocess> process(new Subprocess(pid));

	int error = 0;
	ssize_t got = 0;
	do {
		got = ::read(status.read_end.get(), &error, sizeof(error));
	} while (got < 0 && errno == EINTR);
	if (got == sizeof(error)) {
		process->wait();
		std::string what = "cannot execute \"" + command.executable + "\"";
		if (!directory.empty())
			what += " in \"" + directory + "\"";
		TDK_BRIDGE_THROW(exception::ProcessError, what + ": " + errno_string(error));
	}
	return process;
}

Subprocess::~Subprocess()
{
	std::lock_guard lock(m_mutex);
	if (m_reaped)
		return;
	::kill(m_pid, SIGKILL);
	while (::waitpid(m_pid, nullptr, 0) < 0 && errno == EINTR) {
	}
}

ExitStatus Subprocess::wait()
{
	{
		std::lock_guard lock(m_mutex);
		if (m_reaped)
			return m_status;
	}
	// observe the exit without reaping, the pid stays valid for kill()
	siginfo_t info{};
	int rc = 0;
	do {
		rc = ::waitid(P_PID, static_cast<id_t>(m_pid), &info, WEXITED | WNOWAIT);
	} while (rc < 0 && errno == EINTR);
	if (rc < 0)
		TDK_BRIDGE_THROW(exception::ProcessError, "waitid failed: " + errno_string(errno));

	std::lock_guard lock(m_mutex);
	if (!m_reaped) {
		while (::waitpid(m_pid, nullptr, 0) < 0 && errno == EINTR) {
		}
		m_reaped = true;
		if (info.si_code == CLD_EXITED)
			m_status = ExitStatus{info.si_status, 0};
		else
			m_status = ExitStatus{0, info.si_status};
	}
	return m_status;
}

void Subprocess::kill(int signal) noexcept
{
	std::lock_guard lock(m_mutex);
	if (!m_reaped)
		::kill(m_pid, signal);
}

} // namespace TimestampDateKit::bridge
