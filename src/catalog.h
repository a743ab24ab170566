#ifndef CATALOG_H
#define CATALOG_H

#include "entry_t.h"

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Catalog
// ============================================================================

// Immutable, ordered set of candidates for one selection session.
class Catalog {
	std::vector<CatalogEntry> entries_ = {};

	friend class CatalogBuilder;

	explicit Catalog(std::vector<CatalogEntry> entries);

public:
	Catalog() = default;

	[[nodiscard]] const std::vector<CatalogEntry>& entries() const;

	[[nodiscard]] const CatalogEntry& at(const size_t idx) const;

	[[nodiscard]] const CatalogEntry* find(const std::string_view identifier) const;

	[[nodiscard]] size_t size() const;

	[[nodiscard]] bool empty() const;
};

class CatalogBuilder {
	std::vector<CatalogEntry> entries_ = {};
	std::set<std::string, std::less<>> identifiers_ = {};

public:
	// Throws std::invalid_argument when the identifier is already present.
	CatalogBuilder& add(CatalogEntry entry);

	// Orders by identifier ignoring ASCII case, raw identifier breaking ties.
	CatalogBuilder& sort_case_insensitive();

	[[nodiscard]] size_t size() const;

	[[nodiscard]] Catalog build() const;
};

#endif
