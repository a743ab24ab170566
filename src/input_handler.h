#ifndef INPUT_HANDLER_H
#define INPUT_HANDLER_H

#include <ostream>
#include <string>
#include <string_view>
#include <variant>

// ============================================================================
// Line Input
// ============================================================================

struct Line {
	std::string text = {};
};
struct Interrupted {};
struct EndOfInput {};

using ReadResult = std::variant<Line, Interrupted, EndOfInput>;

class LineReader {
public:
	virtual ~LineReader() = default;

	// Blocks until a full line, an interrupt or the end of input.
	[[nodiscard]] virtual ReadResult read(const std::string_view prompt) = 0;
};

// ============================================================================
// Input Handler
// ============================================================================

// Reads from stdin. On a terminal it edits the line itself so that Ctrl+C and
// Esc arrive as keystrokes rather than signals.
class InputHandler : public LineReader {
	std::ostream& out_;

	[[nodiscard]] int getch() const;

	[[nodiscard]] int read_timeout(const int timeout_ms) const;

	void skip_escape_sequence() const;

	[[nodiscard]] ReadResult read_terminal();

	[[nodiscard]] ReadResult read_stream();

public:
	explicit InputHandler(std::ostream& out);

	InputHandler(const InputHandler&)            = delete;
	InputHandler& operator=(const InputHandler&) = delete;

	[[nodiscard]] ReadResult read(const std::string_view prompt) override;
};

#endif
