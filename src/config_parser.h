#ifndef CONFIG_PARSER_H
#define CONFIG_PARSER_H

#include "config_t.h"

#include <optional>
#include <string>
#include <string_view>

// ============================================================================
// Config Parser
// ============================================================================

namespace tinyxml2 {
class XMLDocument;
class XMLElement;
} // namespace tinyxml2

class ConfigParser {
	static constexpr auto get_text = [](const auto* parent, const char* tag) {
		const auto* elem = parent->FirstChildElement(tag);
		return elem ? elem->GetText() : nullptr;
	};

	static void assign(const tinyxml2::XMLElement* parent, const char* tag,
	                   std::string& target);

	static void parse_finder(const tinyxml2::XMLElement* root, FinderConfig& finder);

	static void parse_scripts(const tinyxml2::XMLElement* root, ScriptsConfig& scripts);

	[[nodiscard]] static std::optional<Config> parse_document(const tinyxml2::XMLDocument& doc);

public:
	[[nodiscard]] static std::optional<Config> parse(const std::string_view filename);

	[[nodiscard]] static std::optional<Config> parse_string(const std::string_view text);

	// $FUZZPICK_CONFIG, then $XDG_CONFIG_HOME/fuzzpick/config.xml, then
	// $HOME/.config/fuzzpick/config.xml.
	[[nodiscard]] static std::optional<std::string> default_path();

	// Defaults when no file exists or it cannot be parsed.
	[[nodiscard]] static Config load();
};

#endif
