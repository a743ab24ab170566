// Fuzzy pick and run commands and scripts
// Copyright (C) 2025 dux119-cmd <dux119-cmd@users.noreply.github.com>
// Licensed under GNU GPL v3+

#include "config_parser.h"
#include "display_manager.h"
#include "exit_codes_t.h"
#include "frontend.h"
#include "input_handler.h"
#include "process.h"
#include "script_catalog.h"
#include "selector.h"
#include "utilities.h"

#include <iostream>

#include <unistd.h>

// ============================================================================
// Main
// ============================================================================

namespace {

void print_usage(const char* prog, const ScriptsConfig& scripts)
{
	std::cout << "Usage: " << prog
	          << " [--list] [--no-finder] [--root DIR] [query...] [-- script args...]\n\n"
	          << "Fuzzy pick and run scripts from the " << scripts.directory
	          << "/ directory.\nArguments after '--' are passed to the script.\n";
}

[[nodiscard]] int execute(const CatalogEntry& entry, const ScriptsConfig& scripts,
                          const std::filesystem::path& root,
                          const std::vector<std::string>& script_args)
{
	std::vector<std::string> argv = {scripts.interpreter,
	                                 Scripts::resolve(entry, root).string()};
	argv.insert(argv.end(), script_args.begin(), script_args.end());

	std::vector<std::string> quoted = {};
	for (const auto& arg : script_args) {
		quoted.push_back(Util::shell_quote(arg));
	}

	std::cout << "→ Running " << entry.secondary_label;
	if (!quoted.empty()) {
		std::cout << ' ' << Util::join(quoted, " ");
	}
	std::cout << '\n' << std::flush;

	const auto code = Process::run_attached(argv, root.string());
	return code ? *code : ExitError;
}

} // namespace

int main(const int argc, char* const argv[])
{
	try {
		const std::vector<std::string> args(argv + 1, argv + argc);
		const auto options = Frontend::parse_options(args, false, true, std::cerr);
		if (!options) {
			return ExitUsage;
		}

		auto config = ConfigParser::load();
		if (!options->root.empty()) {
			config.scripts.root = options->root;
		}
		if (options->help) {
			print_usage(argv[0], config.scripts);
			return ExitSuccess;
		}

		const auto root    = Scripts::project_root(config.scripts);
		const auto catalog = Scripts::discover(config.scripts, root);
		if (catalog.empty()) {
			std::cerr << "Error: No scripts found in the " << config.scripts.directory
			          << "/ directory.\n";
			return ExitUsage;
		}

		const DisplayManager display(std::cout, std::cerr, Util::is_terminal(STDOUT_FILENO));
		if (options->list) {
			display.list(catalog);
			return ExitSuccess;
		}

		const auto finder = Frontend::make_finder(config.finder, "Select a script to run",
		                                          options->no_finder);
		InputHandler input(std::cout);
		const Selector selector(finder.get(), input, display);

		const auto outcome = selector.select(catalog, Util::join(options->positional, " "));
		if (const auto* resolved = std::get_if<Resolved>(&outcome)) {
			return execute(*resolved->entry, config.scripts, root, options->passthrough);
		}
		return Frontend::report(outcome, "script", std::cerr);
	} catch (const std::exception& e) {
		std::cerr << "Fatal error in main: " << e.what() << '\n';
		return ExitError;
	}
}
