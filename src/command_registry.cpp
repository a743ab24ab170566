#include "command_registry.h"
#include "exit_codes_t.h"

#include <algorithm>
#include <stdexcept>

// ============================================================================
// Command Registry
// ============================================================================

void CommandRegistry::add(CommandSpec spec)
{
	if (spec.name.empty()) {
		throw std::invalid_argument("Command name must not be empty");
	}
	if (find(spec.name)) {
		throw std::invalid_argument("Command '" + spec.name + "' already registered");
	}
	if (!spec.handler) {
		throw std::invalid_argument("Command '" + spec.name + "' has no handler");
	}
	commands_.emplace_back(std::move(spec));
}

[[nodiscard]] const CommandSpec* CommandRegistry::find(const std::string_view name) const
{
	const auto it = std::ranges::find(commands_, name, &CommandSpec::name);
	return it != commands_.end() ? &*it : nullptr;
}

[[nodiscard]] const std::vector<CommandSpec>& CommandRegistry::commands() const
{
	return commands_;
}

[[nodiscard]] Catalog CommandRegistry::catalog() const
{
	CatalogBuilder builder;
	for (const auto& spec : commands_) {
		builder.add({.identifier      = spec.name,
		             .primary_label   = spec.name,
		             .secondary_label = spec.help});
	}
	return builder.sort_case_insensitive().build();
}

[[nodiscard]] int CommandRegistry::dispatch(const std::string_view name,
                                            const CommandArgs& args) const
{
	const auto* spec = find(name);
	if (!spec) {
		throw std::out_of_range("Unknown command '" + std::string(name) + "'");
	}
	return spec->handler(args);
}

// ============================================================================
// Built-in Commands
// ============================================================================

void register_builtin_commands(CommandRegistry& registry, std::ostream& out,
                               std::ostream& err)
{
	registry.add({.name    = "hello",
	              .help    = "Say hello to someone.",
	              .usage   = "hello [name]",
	              .handler = [&out, &err](const CommandArgs& args) {
		              if (args.size() > 1) {
			              err << "Usage: flow hello [name]\n";
			              return ExitUsage;
		              }
		              out << "Hello, " << (args.empty() ? "world" : args.front())
		                  << "!\n";
		              return ExitSuccess;
	              }});
}
