#ifndef SEARCH_ENGINE_H
#define SEARCH_ENGINE_H

#include "catalog.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Search Engine
// ============================================================================

// Shortest window of a field that holds the query as an ordered subsequence.
struct Span {
	size_t length = {};
	size_t offset = {};
};

struct MatchResult {
	size_t score              = {};
	size_t offset             = {};
	const CatalogEntry* entry = nullptr;
};

class SearchEngine {
	const Catalog& catalog_;

	[[nodiscard]] std::optional<Span> best_span(const CatalogEntry& entry,
	                                            const std::string_view normalized_query) const;

public:
	explicit SearchEngine(const Catalog& catalog);

	// Both arguments must already be normalized.
	[[nodiscard]] static std::optional<Span> minimal_span(const std::string_view query,
	                                                      const std::string_view text);

	[[nodiscard]] std::optional<MatchResult> score(const CatalogEntry& entry,
	                                               const std::string_view query) const;

	// Ranks the whole catalog against the query, never a previous result.
	[[nodiscard]] std::vector<MatchResult> filter(const std::string_view query) const;

	[[nodiscard]] const Catalog& catalog() const;
};

#endif
