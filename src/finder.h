#ifndef FINDER_H
#define FINDER_H

#include "catalog.h"
#include "config_t.h"
#include "outcome_t.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Finder
// ============================================================================

// A selection strategy that may not be applicable. std::nullopt means "not
// available here", never a failure.
class Finder {
public:
	virtual ~Finder() = default;

	[[nodiscard]] virtual std::optional<Outcome> try_delegate(
	        const Catalog& catalog, const std::string_view query) = 0;
};

// Delegates to an interactive fuzzy-finder binary such as fzf.
class ExternalFinder : public Finder {
	FinderConfig config_ = {};

	[[nodiscard]] std::vector<std::string> build_argv(const std::string& executable,
	                                                  const std::string_view query) const;

public:
	explicit ExternalFinder(FinderConfig config);

	// One "identifier<TAB>secondary" line per entry.
	[[nodiscard]] static std::string serialize(const Catalog& catalog);

	[[nodiscard]] static Outcome interpret(const Catalog& catalog, const int exit_code,
	                                       const std::string_view output);

	[[nodiscard]] std::optional<Outcome> try_delegate(const Catalog& catalog,
	                                                  const std::string_view query) override;
};

#endif
