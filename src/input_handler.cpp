#include "input_handler.h"
#include "timing_t.h"
#include "utilities.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <iostream>

#include <sys/select.h>
#include <termios.h>
#include <unistd.h>

// ============================================================================
// Terminal Mode
// ============================================================================

namespace {

constexpr int KeyInterrupt = 0x03; // Ctrl+C
constexpr int KeyEndOfText = 0x04; // Ctrl+D
constexpr int KeyBackspace = 0x08;
constexpr int KeyEscape    = 0x1B;
constexpr int KeyDelete    = 0x7F;

// Non-canonical, no echo, no signal keys for as long as it lives.
class RawTerminal {
	termios old_term_ = {};
	bool active_      = false;

public:
	RawTerminal()
	{
		if (tcgetattr(STDIN_FILENO, &old_term_) != 0) {
			return;
		}
		termios new_term = old_term_;
		new_term.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG);
		new_term.c_cc[VMIN]  = 1;
		new_term.c_cc[VTIME] = 0;
		active_ = tcsetattr(STDIN_FILENO, TCSANOW, &new_term) == 0;
	}

	~RawTerminal()
	{
		if (active_) {
			tcsetattr(STDIN_FILENO, TCSANOW, &old_term_);
		}
	}

	RawTerminal(const RawTerminal&)            = delete;
	RawTerminal& operator=(const RawTerminal&) = delete;
};

volatile std::sig_atomic_t interrupt_seen = 0;

extern "C" void note_interrupt(int)
{
	interrupt_seen = 1;
}

// Turns Ctrl+C during a blocking stream read into EINTR instead of process
// death. An ignored SIGINT stays ignored.
class InterruptTrap {
	struct sigaction old_int_ = {};
	bool installed_           = false;

public:
	InterruptTrap()
	{
		interrupt_seen = 0;

		struct sigaction trap = {};
		trap.sa_handler       = note_interrupt;
		sigemptyset(&trap.sa_mask);
		trap.sa_flags = 0; // no SA_RESTART

		if (sigaction(SIGINT, &trap, &old_int_) != 0) {
			return;
		}
		installed_ = true;
		if (old_int_.sa_handler == SIG_IGN) {
			sigaction(SIGINT, &old_int_, nullptr);
			installed_ = false;
		}
	}

	~InterruptTrap()
	{
		if (installed_) {
			sigaction(SIGINT, &old_int_, nullptr);
		}
	}

	[[nodiscard]] bool fired() const { return interrupt_seen != 0; }

	InterruptTrap(const InterruptTrap&)            = delete;
	InterruptTrap& operator=(const InterruptTrap&) = delete;
};

} // namespace

// ============================================================================
// Input Handler
// ============================================================================

InputHandler::InputHandler(std::ostream& out) : out_(out) {}

[[nodiscard]] int InputHandler::getch() const
{
	unsigned char c = {};
	while (true) {
		const ssize_t n = ::read(STDIN_FILENO, &c, 1);
		if (n == 1) {
			return c;
		}
		if (n < 0 && errno == EINTR) {
			continue;
		}
		return -1;
	}
}

[[nodiscard]] int InputHandler::read_timeout(const int timeout_ms) const
{
	fd_set fds = {};
	FD_ZERO(&fds);
	FD_SET(STDIN_FILENO, &fds);

	timeval tv{0, timeout_ms * 1000};

	if (select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv) > 0) {
		unsigned char c = {};
		if (::read(STDIN_FILENO, &c, 1) == 1) {
			return c;
		}
	}
	return -1;
}

void InputHandler::skip_escape_sequence() const
{
	const auto timeout = static_cast<int>(Timing::InputTimeout.count());

	// CSI sequences end with a byte in 0x40..0x7E
	for (int c = read_timeout(timeout); c != -1; c = read_timeout(timeout)) {
		if (c != '[' && c >= 0x40 && c <= 0x7E) {
			return;
		}
	}
}

[[nodiscard]] ReadResult InputHandler::read_terminal()
{
	const RawTerminal raw;
	std::string line = {};

	while (true) {
		const int c = getch();

		if (c < 0) {
			out_ << '\n' << std::flush;
			return EndOfInput{};
		}

		if (c == KeyInterrupt) {
			out_ << "^C\n" << std::flush;
			return Interrupted{};
		}

		if (c == KeyEndOfText) {
			if (line.empty()) {
				out_ << '\n' << std::flush;
				return EndOfInput{};
			}
			continue;
		}

		if (c == '\r' || c == '\n') {
			out_ << '\n' << std::flush;
			return Line{std::move(line)};
		}

		if (c == KeyDelete || c == KeyBackspace) {
			if (line.empty()) {
				continue;
			}
			// Drop a whole UTF-8 sequence
			while (line.size() > 1 &&
			       (static_cast<unsigned char>(line.back()) & 0xC0) == 0x80) {
				line.pop_back();
			}
			line.pop_back();
			out_ << "\b \b" << std::flush;
			continue;
		}

		if (c == KeyEscape) {
			const int next = read_timeout(static_cast<int>(Timing::InputTimeout.count()));
			if (next == -1) {
				out_ << '\n' << std::flush;
				return Interrupted{};
			}
			skip_escape_sequence();
			continue;
		}

		if (c >= 0x20) {
			line += static_cast<char>(c);
			out_ << static_cast<char>(c) << std::flush;
		}
	}
}

[[nodiscard]] ReadResult InputHandler::read_stream()
{
	const InterruptTrap trap;
	std::string line = {};

	if (!std::getline(std::cin, line)) {
		if (trap.fired()) {
			// The interrupted read left error flags on the stream
			std::cin.clear();
			std::clearerr(stdin);
			out_ << "^C\n" << std::flush;
			return Interrupted{};
		}
		out_ << '\n' << std::flush;
		return EndOfInput{};
	}
	return Line{std::move(line)};
}

[[nodiscard]] ReadResult InputHandler::read(const std::string_view prompt)
{
	out_ << prompt << std::flush;
	return Util::is_terminal(STDIN_FILENO) ? read_terminal() : read_stream();
}
