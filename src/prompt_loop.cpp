#include "prompt_loop.h"
#include "exit_codes_t.h"
#include "utilities.h"

#include <charconv>
#include <system_error>

// ============================================================================
// Prompt Loop
// ============================================================================

PromptLoop::PromptLoop(const SearchEngine& engine, LineReader& reader,
                       const DisplayManager& display)
        : engine_(engine),
          reader_(reader),
          display_(display)
{}

[[nodiscard]] std::optional<Outcome> PromptLoop::handle(const std::string_view input,
                                                        std::vector<MatchResult>& remaining,
                                                        const size_t shown) const
{
	if (input.empty()) {
		if (remaining.size() == 1) {
			return Resolved{remaining.front().entry};
		}
		return std::nullopt;
	}

	if (Util::is_digits(input)) {
		size_t choice   = 0;
		const auto [ptr, ec] = std::from_chars(input.data(), input.data() + input.size(), choice);
		if (ec == std::errc{} && choice >= 1 && choice <= shown) {
			return Resolved{remaining[choice - 1].entry};
		}
		display_.invalid_selection();
		return std::nullopt;
	}

	// An exact identifier wins even when the current filter hides it
	if (const auto* entry = engine_.catalog().find(input)) {
		return Resolved{entry};
	}

	remaining = engine_.filter(input);
	return std::nullopt;
}

[[nodiscard]] Outcome PromptLoop::run(std::vector<MatchResult> remaining) const
{
	while (true) {
		size_t shown = 0;
		if (remaining.empty()) {
			display_.no_matches();
		} else {
			shown = display_.render(remaining);
		}

		const auto read = reader_.read(Prompt);
		const auto* line = std::get_if<Line>(&read);
		if (!line) {
			// End of input can never produce another line
			return Cancelled{ExitInterrupted, true};
		}

		if (auto outcome = handle(Util::trim(line->text), remaining, shown)) {
			return *outcome;
		}
	}
}
