#include "finder.h"
#include "process.h"
#include "utilities.h"

// ============================================================================
// External Finder
// ============================================================================

ExternalFinder::ExternalFinder(FinderConfig config) : config_(std::move(config)) {}

[[nodiscard]] std::vector<std::string> ExternalFinder::build_argv(
        const std::string& executable, const std::string_view query) const
{
	std::vector<std::string> argv = {
	        executable,
	        "--height=" + config_.height,
	        "--layout=reverse",
	        "--no-multi",
	        "--delimiter=\\t",
	        "--with-nth=1,2",
	        "--header=" + config_.header,
	        "--prompt=" + config_.prompt,
	};
	if (!query.empty()) {
		argv.emplace_back("--query=" + std::string(query));
	}
	return argv;
}

[[nodiscard]] std::string ExternalFinder::serialize(const Catalog& catalog)
{
	std::string lines = {};
	for (const auto& entry : catalog.entries()) {
		lines += entry.identifier;
		lines += '\t';
		lines += entry.secondary_label;
		lines += '\n';
	}
	return lines;
}

[[nodiscard]] Outcome ExternalFinder::interpret(const Catalog& catalog, const int exit_code,
                                                const std::string_view output)
{
	if (exit_code != 0) {
		return Cancelled{exit_code, false};
	}

	std::string_view line = output.substr(0, output.find('\n'));
	if (!line.empty() && line.back() == '\r') {
		line.remove_suffix(1);
	}
	if (Util::trim(line).empty()) {
		return Cancelled{0, false};
	}

	const auto selection = line.substr(0, line.find('\t'));
	if (const auto* entry = catalog.find(selection)) {
		return Resolved{entry};
	}
	return ProtocolViolation{std::string(selection)};
}

[[nodiscard]] std::optional<Outcome> ExternalFinder::try_delegate(const Catalog& catalog,
                                                                  const std::string_view query)
{
	const auto executable = Util::find_executable(config_.executable);
	if (!executable) {
		return std::nullopt;
	}

	const auto result = Process::run(build_argv(*executable, query), serialize(catalog));
	if (!result) {
		// Could not spawn; the built-in prompt still works
		return std::nullopt;
	}
	return interpret(catalog, result->exit_code, result->out);
}
