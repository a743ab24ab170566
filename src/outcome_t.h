#ifndef OUTCOME_T
#define OUTCOME_T

#include "entry_t.h"

#include <string>
#include <variant>

// ============================================================================
// Selection outcomes
// ============================================================================

struct Resolved {
	const CatalogEntry* entry = nullptr;
};
struct Cancelled {
	int code         = {};
	bool interrupted = {};
};
struct EmptyCatalog {};
struct ProtocolViolation {
	std::string selection = {};
};

using Outcome = std::variant<Resolved, Cancelled, EmptyCatalog, ProtocolViolation>;

#endif
