#ifndef FRONTEND_H
#define FRONTEND_H

#include "config_t.h"
#include "finder.h"
#include "outcome_t.h"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Front-end helpers
// ============================================================================

struct FrontendOptions {
	bool list                            = false;
	bool no_finder                       = false;
	bool help                            = false;
	std::string root                     = {};
	std::vector<std::string> positional  = {};
	std::vector<std::string> passthrough = {};
};

namespace Frontend {

// Leading options, then positionals. Everything after "--" is passthrough.
// With stop_at_positional, the first positional ends option parsing.
// Returns std::nullopt (after printing why) on an unknown option.
[[nodiscard]] std::optional<FrontendOptions> parse_options(const std::vector<std::string>& args,
                                                           const bool stop_at_positional,
                                                           const bool accepts_root,
                                                           std::ostream& err);

// Null when delegation is disabled by flag or by FUZZPICK_FINDER=none.
[[nodiscard]] std::unique_ptr<Finder> make_finder(FinderConfig config,
                                                  const std::string_view default_header,
                                                  const bool disabled);

// Exit code and message for every outcome except Resolved.
[[nodiscard]] int report(const Outcome& outcome, const std::string_view noun,
                         std::ostream& err);

} // namespace Frontend

#endif
