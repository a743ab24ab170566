#include "process.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

// ============================================================================
// Child Processes
// ============================================================================

namespace {

constexpr int ExitExecFailed = 127;

// Keeps Ctrl+C and Ctrl+\ for the child while the parent waits on it, and
// stops a closed stdin pipe from killing the parent.
class ParentSignalGuard {
	struct sigaction old_int_  = {};
	struct sigaction old_quit_ = {};
	struct sigaction old_pipe_ = {};

public:
	ParentSignalGuard()
	{
		struct sigaction ignore = {};
		ignore.sa_handler       = SIG_IGN;
		sigemptyset(&ignore.sa_mask);
		sigaction(SIGINT, &ignore, &old_int_);
		sigaction(SIGQUIT, &ignore, &old_quit_);
		sigaction(SIGPIPE, &ignore, &old_pipe_);
	}

	~ParentSignalGuard() { restore(); }

	// Async-signal-safe, so the child can call it between fork and exec.
	void restore() const
	{
		sigaction(SIGINT, &old_int_, nullptr);
		sigaction(SIGQUIT, &old_quit_, nullptr);
		sigaction(SIGPIPE, &old_pipe_, nullptr);
	}

	ParentSignalGuard(const ParentSignalGuard&)            = delete;
	ParentSignalGuard& operator=(const ParentSignalGuard&) = delete;
};

void close_fd(int& fd)
{
	if (fd >= 0) {
		::close(fd);
		fd = -1;
	}
}

[[nodiscard]] std::vector<char*> make_argv(const std::vector<std::string>& argv)
{
	std::vector<char*> args = {};
	args.reserve(argv.size() + 1);
	for (const auto& arg : argv) {
		args.push_back(const_cast<char*>(arg.c_str()));
	}
	args.push_back(nullptr);
	return args;
}

// Only async-signal-safe calls from here until exec. The child gets the
// dispositions the parent had before the guard, ignored ones included.
[[noreturn]] void exec_child(const std::vector<char*>& args, const ParentSignalGuard& guard)
{
	guard.restore();

	execvp(args[0], args.data());

	const char msg[] = "Error: exec failed\n";
	[[maybe_unused]] const auto n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
	_exit(ExitExecFailed);
}

[[nodiscard]] std::optional<int> wait_child(const pid_t pid)
{
	int status = 0;
	while (waitpid(pid, &status, 0) < 0) {
		if (errno != EINTR) {
			std::cerr << "Error: waitpid() failed: " << std::strerror(errno) << '\n';
			return std::nullopt;
		}
	}

	if (WIFEXITED(status)) {
		return WEXITSTATUS(status);
	}
	if (WIFSIGNALED(status)) {
		return 128 + WTERMSIG(status);
	}
	return ExitExecFailed;
}

// Feeds input to the child while draining its stdout, so a child that
// answers before it has read everything cannot stall on a full pipe. Closes
// both descriptors before returning.
[[nodiscard]] bool communicate(int& in_fd, int& out_fd, std::string_view input,
                               std::string& out)
{
	if (input.empty()) {
		close_fd(in_fd);
	} else {
		fcntl(in_fd, F_SETFL, fcntl(in_fd, F_GETFL) | O_NONBLOCK);
	}

	char chunk[4096];
	bool ok = true;

	while (out_fd >= 0 || in_fd >= 0) {
		pollfd fds[2] = {};
		nfds_t count  = 0;
		int out_slot  = -1;
		int in_slot   = -1;

		if (out_fd >= 0) {
			out_slot     = static_cast<int>(count);
			fds[count++] = {out_fd, POLLIN, 0};
		}
		if (in_fd >= 0) {
			in_slot      = static_cast<int>(count);
			fds[count++] = {in_fd, POLLOUT, 0};
		}

		if (poll(fds, count, -1) < 0) {
			if (errno == EINTR) {
				continue;
			}
			std::cerr << "Error: poll() failed: " << std::strerror(errno) << '\n';
			ok = false;
			break;
		}

		if (in_slot >= 0 && fds[in_slot].revents != 0) {
			const ssize_t written = ::write(in_fd, input.data(), input.size());
			if (written >= 0) {
				input.remove_prefix(static_cast<size_t>(written));
			} else if (errno == EPIPE) {
				// A child that exits without draining stdin is not an error here
				input = {};
			} else if (errno != EINTR && errno != EAGAIN) {
				std::cerr << "Error: write() to child failed: " << std::strerror(errno)
				          << '\n';
				input = {};
			}
			if (input.empty()) {
				close_fd(in_fd);
			}
		}

		if (out_slot >= 0 && fds[out_slot].revents != 0) {
			const ssize_t n = ::read(out_fd, chunk, sizeof(chunk));
			if (n > 0) {
				out.append(chunk, static_cast<size_t>(n));
			} else if (n == 0) {
				close_fd(out_fd);
			} else if (errno != EINTR && errno != EAGAIN) {
				std::cerr << "Error: read() from child failed: " << std::strerror(errno)
				          << '\n';
				ok = false;
				break;
			}
		}
	}

	close_fd(in_fd);
	close_fd(out_fd);
	return ok;
}

} // namespace

namespace Process {

[[nodiscard]] std::optional<ProcessResult> run(const std::vector<std::string>& argv,
                                               const std::string_view input)
{
	if (argv.empty()) {
		return std::nullopt;
	}

	int stdin_pipe[2]  = {-1, -1};
	int stdout_pipe[2] = {-1, -1};

	if (pipe(stdin_pipe) < 0) {
		std::cerr << "Error: pipe() failed: " << std::strerror(errno) << '\n';
		return std::nullopt;
	}
	if (pipe(stdout_pipe) < 0) {
		std::cerr << "Error: pipe() failed: " << std::strerror(errno) << '\n';
		close_fd(stdin_pipe[0]);
		close_fd(stdin_pipe[1]);
		return std::nullopt;
	}

	const auto args = make_argv(argv);
	const ParentSignalGuard guard;

	const pid_t pid = fork();
	if (pid < 0) {
		std::cerr << "Error: fork() failed: " << std::strerror(errno) << '\n';
		close_fd(stdin_pipe[0]);
		close_fd(stdin_pipe[1]);
		close_fd(stdout_pipe[0]);
		close_fd(stdout_pipe[1]);
		return std::nullopt;
	}

	if (pid == 0) {
		dup2(stdin_pipe[0], STDIN_FILENO);
		dup2(stdout_pipe[1], STDOUT_FILENO);
		::close(stdin_pipe[0]);
		::close(stdin_pipe[1]);
		::close(stdout_pipe[0]);
		::close(stdout_pipe[1]);
		exec_child(args, guard);
	}

	close_fd(stdin_pipe[0]);
	close_fd(stdout_pipe[1]);

	ProcessResult result = {};
	const bool drained   = communicate(stdin_pipe[1], stdout_pipe[0], input, result.out);

	const auto code = wait_child(pid);
	if (!code || !drained) {
		return std::nullopt;
	}
	result.exit_code = *code;
	return result;
}

[[nodiscard]] std::optional<int> run_attached(const std::vector<std::string>& argv,
                                              const std::string& cwd)
{
	if (argv.empty()) {
		return std::nullopt;
	}

	const auto args = make_argv(argv);
	const ParentSignalGuard guard;

	const pid_t pid = fork();
	if (pid < 0) {
		std::cerr << "Error: fork() failed: " << std::strerror(errno) << '\n';
		return std::nullopt;
	}

	if (pid == 0) {
		if (!cwd.empty() && chdir(cwd.c_str()) < 0) {
			const char msg[] = "Error: cannot change directory\n";
			[[maybe_unused]] const auto n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
			_exit(ExitExecFailed);
		}
		exec_child(args, guard);
	}

	return wait_child(pid);
}

} // namespace Process
