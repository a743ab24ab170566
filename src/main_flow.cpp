// Fuzzy pick and run commands and scripts
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "command_registry.h"
#include "config_parser.h"
#include "display_manager.h"
#include "exit_codes_t.h"
#include "frontend.h"
#include "input_handler.h"
#include "selector.h"
#include "utilities.h"

#include <iostream>

#include <unistd.h>

// ============================================================================
// Main
// ============================================================================

namespace {

void print_usage(const char* prog, const CommandRegistry& registry)
{
	std::cout << "Usage: " << prog << " [--list] [--no-finder] [command [args...]]\n"
	          << "       " << prog << " [query words...]\n\n"
	          << "Runs a registered command. Without an exact command name the\n"
	          << "words are used to pick one interactively.\n\nCommands:\n";
	for (const auto& spec : registry.commands()) {
		std::cout << "  " << spec.usage << "\n      " << spec.help << '\n';
	}
}

} // namespace

int main(const int argc, char* const argv[])
{
	try {
		CommandRegistry registry;
		register_builtin_commands(registry, std::cout, std::cerr);

		const std::vector<std::string> args(argv + 1, argv + argc);
		const auto options = Frontend::parse_options(args, true, false, std::cerr);
		if (!options) {
			return ExitUsage;
		}
		if (options->help) {
			print_usage(argv[0], registry);
			return ExitSuccess;
		}

		const auto catalog = registry.catalog();
		const DisplayManager display(std::cout, std::cerr, Util::is_terminal(STDOUT_FILENO));

		if (options->list) {
			display.list(catalog);
			return ExitSuccess;
		}

		const auto& words = options->positional;
		if (!words.empty() && registry.find(words.front())) {
			return registry.dispatch(words.front(), CommandArgs(words.begin() + 1, words.end()));
		}

		const auto config = ConfigParser::load();
		const auto finder = Frontend::make_finder(config.finder,
		                                          "Select a command (Esc to cancel)",
		                                          options->no_finder);
		InputHandler input(std::cout);
		const Selector selector(finder.get(), input, display);

		const auto outcome = selector.select(catalog, Util::join(words, " "));
		if (const auto* resolved = std::get_if<Resolved>(&outcome)) {
			return registry.dispatch(resolved->entry->identifier, {});
		}
		return Frontend::report(outcome, "command", std::cerr);
	} catch (const std::exception& e) {
		std::cerr << "Fatal error in main: " << e.what() << '\n';
		return ExitError;
	}
}
