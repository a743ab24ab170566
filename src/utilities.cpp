#include "utilities.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <stdexcept>

#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

#include <sys/stat.h>
#include <unistd.h>

// ============================================================================
// Utilities
// ============================================================================

namespace Util {

[[nodiscard]] std::string to_lower(const std::string_view s)
{
	std::string result = {};
	result.reserve(s.size());
	std::ranges::transform(s, std::back_inserter(result), [](const unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	return result;
}

[[nodiscard]] std::string normalize(const std::string_view s)
{
	UErrorCode status = U_ZERO_ERROR;
	const auto* nfkd  = icu::Normalizer2::getNFKDInstance(status);
	const auto source = icu::UnicodeString::fromUTF8(
	        icu::StringPiece(s.data(), static_cast<int32_t>(s.size())));

	icu::UnicodeString decomposed;
	if (U_SUCCESS(status)) {
		decomposed = nfkd->normalize(source, status);
	}
	if (U_FAILURE(status)) {
		throw std::runtime_error(std::string("NFKD normalization failed: ") +
		                         u_errorName(status));
	}

	// Whatever is left outside ASCII (combining marks, letters without a
	// decomposition, invalid input) is dropped
	std::string ascii = {};
	ascii.reserve(static_cast<size_t>(decomposed.length()));
	for (int32_t i = 0; i < decomposed.length(); ++i) {
		const char16_t unit = decomposed.charAt(i);
		if (unit < 0x80) {
			ascii += static_cast<char>(unit);
		}
	}
	return to_lower(ascii);
}

[[nodiscard]] std::string_view trim(const std::string_view s)
{
	const auto is_space = [](const unsigned char c) { return std::isspace(c) != 0; };

	size_t begin = 0;
	size_t end   = s.size();
	while (begin < end && is_space(static_cast<unsigned char>(s[begin]))) {
		++begin;
	}
	while (end > begin && is_space(static_cast<unsigned char>(s[end - 1]))) {
		--end;
	}
	return s.substr(begin, end - begin);
}

[[nodiscard]] bool is_digits(const std::string_view s)
{
	return !s.empty() && std::ranges::all_of(s, [](const unsigned char c) {
		return std::isdigit(c) != 0;
	});
}

[[nodiscard]] std::string join(const std::vector<std::string>& words,
                               const std::string_view separator)
{
	std::string result = {};
	for (const auto& word : words) {
		if (!result.empty()) {
			result += separator;
		}
		result += word;
	}
	return result;
}

[[nodiscard]] std::string shell_quote(const std::string_view s)
{
	using namespace std::string_view_literals;

	if (s.empty()) {
		return "''";
	}

	const auto safe = [](const unsigned char c) {
		return std::isalnum(c) || "@%+=:,./_-"sv.find(static_cast<char>(c)) !=
		                                  std::string_view::npos;
	};
	if (std::ranges::all_of(s, safe)) {
		return std::string(s);
	}

	std::string quoted = "'";
	for (const char c : s) {
		if (c == '\'') {
			quoted += "'\"'\"'";
		} else {
			quoted += c;
		}
	}
	quoted += '\'';
	return quoted;
}

[[nodiscard]] std::optional<std::string> find_executable(const std::string_view name)
{
	const auto executable = [](const std::string& path) {
		struct stat st = {};
		return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
		       ::access(path.c_str(), X_OK) == 0;
	};

	if (name.empty()) {
		return std::nullopt;
	}

	if (name.find('/') != std::string_view::npos) {
		std::string path{name};
		return executable(path) ? std::optional{path} : std::nullopt;
	}

	const char* env = std::getenv("PATH");
	const std::string_view search_path = env ? env : "/usr/local/bin:/usr/bin:/bin";

	size_t start = 0;
	while (start <= search_path.size()) {
		const size_t colon = std::min(search_path.find(':', start), search_path.size());
		std::string dir{search_path.substr(start, colon - start)};
		if (dir.empty()) {
			dir = ".";
		}

		std::string candidate = dir + "/" + std::string(name);
		if (executable(candidate)) {
			return candidate;
		}
		start = colon + 1;
	}
	return std::nullopt;
}

[[nodiscard]] bool is_terminal(const int fd)
{
	return ::isatty(fd) == 1;
}

} // namespace Util
