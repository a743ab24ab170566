#include "catalog.h"
#include "utilities.h"

#include <algorithm>
#include <stdexcept>

// ============================================================================
// Catalog
// ============================================================================

Catalog::Catalog(std::vector<CatalogEntry> entries) : entries_(std::move(entries)) {}

[[nodiscard]] const std::vector<CatalogEntry>& Catalog::entries() const
{
	return entries_;
}

[[nodiscard]] const CatalogEntry& Catalog::at(const size_t idx) const
{
	return entries_.at(idx);
}

[[nodiscard]] const CatalogEntry* Catalog::find(const std::string_view identifier) const
{
	const auto it = std::ranges::find(entries_, identifier, &CatalogEntry::identifier);
	return it != entries_.end() ? &*it : nullptr;
}

[[nodiscard]] size_t Catalog::size() const
{
	return entries_.size();
}

[[nodiscard]] bool Catalog::empty() const
{
	return entries_.empty();
}

// ============================================================================
// Catalog Builder
// ============================================================================

CatalogBuilder& CatalogBuilder::add(CatalogEntry entry)
{
	if (identifiers_.contains(entry.identifier)) {
		throw std::invalid_argument("Entry '" + entry.identifier +
		                            "' already registered");
	}
	identifiers_.insert(entry.identifier);
	entries_.emplace_back(std::move(entry));
	return *this;
}

CatalogBuilder& CatalogBuilder::sort_case_insensitive()
{
	std::ranges::sort(entries_, [](const auto& a, const auto& b) {
		const auto la = Util::to_lower(a.identifier);
		const auto lb = Util::to_lower(b.identifier);
		return (la != lb) ? (la < lb) : (a.identifier < b.identifier);
	});
	return *this;
}

[[nodiscard]] size_t CatalogBuilder::size() const
{
	return entries_.size();
}

[[nodiscard]] Catalog CatalogBuilder::build() const
{
	return Catalog(entries_);
}
