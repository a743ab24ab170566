#ifndef COMMAND_REGISTRY_H
#define COMMAND_REGISTRY_H

#include "catalog.h"

#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Command Registry
// ============================================================================

using CommandArgs    = std::vector<std::string>;
using CommandHandler = std::function<int(const CommandArgs&)>;

struct CommandSpec {
	std::string name       = {};
	std::string help       = {};
	std::string usage      = {};
	CommandHandler handler = {};
};

class CommandRegistry {
	std::vector<CommandSpec> commands_ = {};

public:
	// Throws std::invalid_argument on a duplicate or empty name.
	void add(CommandSpec spec);

	[[nodiscard]] const CommandSpec* find(const std::string_view name) const;

	[[nodiscard]] const std::vector<CommandSpec>& commands() const;

	// One entry per command, ordered case-insensitively by name.
	[[nodiscard]] Catalog catalog() const;

	[[nodiscard]] int dispatch(const std::string_view name, const CommandArgs& args) const;
};

void register_builtin_commands(CommandRegistry& registry, std::ostream& out,
                               std::ostream& err);

#endif
