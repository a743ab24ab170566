#ifndef PROMPT_LOOP_H
#define PROMPT_LOOP_H

#include "display_manager.h"
#include "input_handler.h"
#include "outcome_t.h"
#include "search_engine.h"

#include <optional>
#include <string_view>
#include <vector>

// ============================================================================
// Prompt Loop
// ============================================================================

class PromptLoop {
	const SearchEngine& engine_;
	LineReader& reader_;
	const DisplayManager& display_;

	[[nodiscard]] std::optional<Outcome> handle(const std::string_view input,
	                                            std::vector<MatchResult>& remaining,
	                                            const size_t shown) const;

public:
	static constexpr std::string_view Prompt =
	        "Enter number to select, or type search query (Ctrl+C to cancel): ";

	PromptLoop(const SearchEngine& engine, LineReader& reader, const DisplayManager& display);

	// Runs until a candidate is chosen or input is interrupted. Every new
	// query is ranked against the full catalog.
	[[nodiscard]] Outcome run(std::vector<MatchResult> remaining) const;
};

#endif
