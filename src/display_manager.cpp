#include "display_manager.h"

#include <algorithm>

// ============================================================================
// ANSI Color Codes
// ============================================================================

namespace Color {

using namespace std::string_view_literals;

constexpr auto Reset = "\033[0m"sv;
constexpr auto Bold  = "\033[1m"sv;
constexpr auto Dim   = "\033[2m"sv;
constexpr auto Cyan  = "\033[96m"sv;
} // namespace Color

// ============================================================================
// Display Manager
// ============================================================================

DisplayManager::DisplayManager(std::ostream& out, std::ostream& err, const bool color)
        : out_(out),
          err_(err),
          color_(color)
{}

void DisplayManager::render_entry(std::ostringstream& buf, const CatalogEntry& entry,
                                  const size_t display_index) const
{
	using namespace std::string_view_literals;

	if (display_index > 0) {
		if (color_) {
			buf << Color::Bold << Color::Cyan;
		}
		buf << display_index << "."sv;
		if (color_) {
			buf << Color::Reset;
		}
		buf << ' ';
	}

	buf << entry.primary_label;
	if (!entry.secondary_label.empty()) {
		buf << "  "sv;
		if (color_) {
			buf << Color::Dim;
		}
		buf << '(' << entry.secondary_label << ')';
		if (color_) {
			buf << Color::Reset;
		}
	}
	buf << '\n';
}

[[nodiscard]] size_t DisplayManager::render(const std::vector<MatchResult>& results) const
{
	const size_t shown = std::min(results.size(), Display::MaxShown);

	std::ostringstream buf;
	for (size_t i = 0; i < shown; ++i) {
		render_entry(buf, *results[i].entry, i + 1);
	}
	out_ << buf.str() << std::flush;
	return shown;
}

void DisplayManager::list(const Catalog& catalog) const
{
	std::ostringstream buf;
	for (const auto& entry : catalog.entries()) {
		render_entry(buf, entry, 0);
	}
	out_ << buf.str() << std::flush;
}

void DisplayManager::no_matches() const
{
	err_ << "No matches. Try again.\n" << std::flush;
}

void DisplayManager::invalid_selection() const
{
	err_ << "Invalid selection. Try again.\n" << std::flush;
}
