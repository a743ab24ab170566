#ifndef SCRIPT_CATALOG_H
#define SCRIPT_CATALOG_H

#include "catalog.h"
#include "config_t.h"

#include <filesystem>

// ============================================================================
// Script Catalog
// ============================================================================

namespace Scripts {

// Absolute project root: the configured root, or the working directory.
[[nodiscard]] std::filesystem::path project_root(const ScriptsConfig& config);

// Regular files directly under <root>/<directory> with the configured
// extension, sorted by path. Identifier is the file stem, the secondary label
// the path relative to root. A missing directory yields an empty catalog.
[[nodiscard]] Catalog discover(const ScriptsConfig& config, const std::filesystem::path& root);

[[nodiscard]] std::filesystem::path resolve(const CatalogEntry& entry,
                                            const std::filesystem::path& root);

} // namespace Scripts

#endif
