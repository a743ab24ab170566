#include "selector.h"
#include "prompt_loop.h"
#include "search_engine.h"
#include "utilities.h"

// ============================================================================
// Selector
// ============================================================================

Selector::Selector(Finder* finder, LineReader& reader, const DisplayManager& display)
        : finder_(finder),
          reader_(reader),
          display_(display)
{}

[[nodiscard]] Outcome Selector::select(const Catalog& catalog, const std::string_view query) const
{
	if (catalog.empty()) {
		return EmptyCatalog{};
	}

	const SearchEngine engine(catalog);
	const auto trimmed = Util::trim(query);

	auto remaining = engine.filter(trimmed);
	if (!trimmed.empty() && remaining.size() == 1) {
		return Resolved{remaining.front().entry};
	}

	if (finder_) {
		if (auto outcome = finder_->try_delegate(catalog, trimmed)) {
			return *outcome;
		}
	}

	const PromptLoop loop(engine, reader_, display_);
	return loop.run(std::move(remaining));
}
