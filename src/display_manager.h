#ifndef DISPLAY_MANAGER_H
#define DISPLAY_MANAGER_H

#include "catalog.h"
#include "search_engine.h"

#include <ostream>
#include <sstream>
#include <string_view>
#include <vector>

// ============================================================================
// Display Manager
// ============================================================================

namespace Display {
constexpr size_t MaxShown = 10;
} // namespace Display

class DisplayManager {
	std::ostream& out_;
	std::ostream& err_;
	bool color_ = false;

	void render_entry(std::ostringstream& buf, const CatalogEntry& entry,
	                  const size_t display_index) const;

public:
	DisplayManager(std::ostream& out, std::ostream& err, const bool color);

	// Prints at most Display::MaxShown rows and returns how many were shown.
	[[nodiscard]] size_t render(const std::vector<MatchResult>& results) const;

	void list(const Catalog& catalog) const;

	void no_matches() const;

	void invalid_selection() const;
};

#endif
