#include "frontend.h"
#include "exit_codes_t.h"

#include <algorithm>
#include <cstddef>
#include <cstdlib>

// ============================================================================
// Front-end helpers
// ============================================================================

namespace Frontend {

[[nodiscard]] std::optional<FrontendOptions> parse_options(const std::vector<std::string>& args,
                                                           const bool stop_at_positional,
                                                           const bool accepts_root,
                                                           std::ostream& err)
{
	FrontendOptions options = {};
	bool options_done       = false;

	for (size_t i = 0; i < args.size(); ++i) {
		const auto& arg = args[i];

		if (arg == "--") {
			options.passthrough.assign(args.begin() + static_cast<std::ptrdiff_t>(i) + 1,
			                           args.end());
			break;
		}

		if (options_done || arg.size() < 2 || arg.front() != '-') {
			options.positional.push_back(arg);
			options_done = options_done || stop_at_positional;
			continue;
		}

		if (arg == "-h" || arg == "--help") {
			options.help = true;
		} else if (arg == "--list") {
			options.list = true;
		} else if (arg == "--no-finder") {
			options.no_finder = true;
		} else if (accepts_root && arg == "--root") {
			if (i + 1 >= args.size()) {
				err << "Error: --root requires a directory\n";
				return std::nullopt;
			}
			options.root = args[++i];
		} else if (accepts_root && arg.starts_with("--root=")) {
			options.root = arg.substr(7);
		} else {
			err << "Error: Unknown option " << arg << '\n';
			return std::nullopt;
		}
	}
	return options;
}

[[nodiscard]] std::unique_ptr<Finder> make_finder(FinderConfig config,
                                                  const std::string_view default_header,
                                                  const bool disabled)
{
	if (disabled) {
		return nullptr;
	}

	if (const char* env = std::getenv("FUZZPICK_FINDER"); env && *env) {
		if (std::string_view(env) == "none") {
			return nullptr;
		}
		config.executable = env;
	}
	if (config.header.empty()) {
		config.header = default_header;
	}
	return std::make_unique<ExternalFinder>(std::move(config));
}

[[nodiscard]] int report(const Outcome& outcome, const std::string_view noun,
                         std::ostream& err)
{
	if (const auto* cancelled = std::get_if<Cancelled>(&outcome)) {
		err << "No " << noun << " selected.\n";
		return std::min(cancelled->code, MaxExitCode);
	}
	if (std::holds_alternative<EmptyCatalog>(outcome)) {
		err << "Error: No " << noun << "s available.\n";
		return ExitUsage;
	}
	if (const auto* violation = std::get_if<ProtocolViolation>(&outcome)) {
		err << "Error: Finder returned unknown " << noun << " '" << violation->selection
		    << "'\n";
		return ExitError;
	}
	return ExitSuccess;
}

} // namespace Frontend
