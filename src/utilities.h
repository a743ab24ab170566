#ifndef UTILITIES_H
#define UTILITIES_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ============================================================================
// Utilities
// ============================================================================

namespace Util {

[[nodiscard]] std::string to_lower(const std::string_view s);

// Strips diacritics and compatibility forms down to ASCII, drops whatever
// has no ASCII base, then lowercases.
[[nodiscard]] std::string normalize(const std::string_view s);

[[nodiscard]] std::string_view trim(const std::string_view s);

[[nodiscard]] bool is_digits(const std::string_view s);

[[nodiscard]] std::string join(const std::vector<std::string>& words,
                               const std::string_view separator);

[[nodiscard]] std::string shell_quote(const std::string_view s);

[[nodiscard]] std::optional<std::string> find_executable(const std::string_view name);

[[nodiscard]] bool is_terminal(const int fd);

} // namespace Util

#endif
