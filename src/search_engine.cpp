#include "search_engine.h"
#include "utilities.h"

#include <algorithm>
#include <tuple>

// ============================================================================
// Search Engine
// ============================================================================

SearchEngine::SearchEngine(const Catalog& catalog) : catalog_(catalog) {}

[[nodiscard]] std::optional<Span> SearchEngine::minimal_span(const std::string_view query,
                                                             const std::string_view text)
{
	if (query.empty() || query.size() > text.size()) {
		return std::nullopt;
	}

	std::optional<Span> best = std::nullopt;

	for (size_t start = text.find(query.front()); start != std::string_view::npos;
	     start        = text.find(query.front(), start + 1)) {
		size_t q   = 1;
		size_t pos = start + 1;
		while (q < query.size() && pos < text.size()) {
			if (text[pos] == query[q]) {
				++q;
			}
			++pos;
		}
		if (q < query.size()) {
			// Later starts cannot complete either
			break;
		}

		const size_t length = pos - start;
		if (!best || length < best->length) {
			best = Span{length, start};
		}
		if (length == query.size()) {
			break;
		}
	}
	return best;
}

[[nodiscard]] std::optional<Span> SearchEngine::best_span(
        const CatalogEntry& entry, const std::string_view normalized_query) const
{
	std::optional<Span> best = std::nullopt;

	for (const auto* field :
	     {&entry.identifier, &entry.primary_label, &entry.secondary_label}) {
		const auto span = minimal_span(normalized_query, Util::normalize(*field));
		if (!span) {
			continue;
		}
		if (!best || std::tie(span->length, span->offset) <
		                     std::tie(best->length, best->offset)) {
			best = span;
		}
	}
	return best;
}

[[nodiscard]] std::optional<MatchResult> SearchEngine::score(
        const CatalogEntry& entry, const std::string_view query) const
{
	const auto normalized = Util::normalize(query);
	if (normalized.empty()) {
		return MatchResult{0, 0, &entry};
	}

	if (const auto span = best_span(entry, normalized)) {
		return MatchResult{span->length, span->offset, &entry};
	}
	return std::nullopt;
}

[[nodiscard]] std::vector<MatchResult> SearchEngine::filter(const std::string_view query) const
{
	std::vector<MatchResult> results = {};
	results.reserve(catalog_.size());

	const auto normalized = Util::normalize(query);
	if (normalized.empty()) {
		for (const auto& entry : catalog_.entries()) {
			results.emplace_back(0, 0, &entry);
		}
		return results;
	}

	for (const auto& entry : catalog_.entries()) {
		if (const auto span = best_span(entry, normalized)) {
			results.emplace_back(span->length, span->offset, &entry);
		}
	}

	std::ranges::sort(results, [](const auto& a, const auto& b) {
		return std::tie(a.score, a.offset, a.entry->identifier) <
		       std::tie(b.score, b.offset, b.entry->identifier);
	});
	return results;
}

[[nodiscard]] const Catalog& SearchEngine::catalog() const
{
	return catalog_;
}
