#ifndef SELECTOR_H
#define SELECTOR_H

#include "catalog.h"
#include "display_manager.h"
#include "finder.h"
#include "input_handler.h"
#include "outcome_t.h"

#include <string_view>

// ============================================================================
// Selector
// ============================================================================

// Resolves one catalog entry: a unique match for the initial query wins
// outright, then the external finder is tried, then the built-in prompt.
class Selector {
	Finder* finder_ = nullptr;
	LineReader& reader_;
	const DisplayManager& display_;

public:
	// finder may be null to skip delegation.
	Selector(Finder* finder, LineReader& reader, const DisplayManager& display);

	[[nodiscard]] Outcome select(const Catalog& catalog, const std::string_view query) const;
};

#endif
