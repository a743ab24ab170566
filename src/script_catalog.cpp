#include "script_catalog.h"

#include <algorithm>
#include <iostream>
#include <system_error>
#include <vector>

// ============================================================================
// Script Catalog
// ============================================================================

namespace Scripts {

namespace fs = std::filesystem;

constexpr auto BuildCacheDirectory = "__pycache__";

[[nodiscard]] fs::path project_root(const ScriptsConfig& config)
{
	std::error_code ec = {};
	const fs::path root = config.root.empty() ? fs::current_path(ec) : fs::path(config.root);
	if (ec) {
		std::cerr << "Error: Cannot determine working directory: " << ec.message() << '\n';
		return fs::path(".");
	}

	auto absolute = fs::absolute(root, ec);
	return ec ? root : absolute.lexically_normal();
}

[[nodiscard]] Catalog discover(const ScriptsConfig& config, const fs::path& root)
{
	const fs::path dir = root / config.directory;

	std::error_code ec = {};
	if (!fs::is_directory(dir, ec)) {
		return {};
	}

	std::vector<fs::path> paths = {};
	for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
		const auto& path    = it->path();
		const auto name     = path.filename().string();
		const bool excluded = !config.excluded_prefix.empty() &&
		                      name.starts_with(config.excluded_prefix);
		if (excluded || name == BuildCacheDirectory) {
			continue;
		}

		std::error_code type_ec = {};
		if (!it->is_regular_file(type_ec) || path.extension() != config.extension) {
			continue;
		}
		paths.push_back(path);
	}
	if (ec) {
		std::cerr << "Error: Cannot list " << dir.string() << ": " << ec.message() << '\n';
		return {};
	}

	std::ranges::sort(paths);

	CatalogBuilder builder;
	for (const auto& path : paths) {
		builder.add({.identifier      = path.stem().string(),
		             .primary_label   = path.stem().string(),
		             .secondary_label = path.lexically_relative(root).generic_string()});
	}
	return builder.build();
}

[[nodiscard]] fs::path resolve(const CatalogEntry& entry, const fs::path& root)
{
	return root / entry.secondary_label;
}

} // namespace Scripts
