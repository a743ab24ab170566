#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <tinyxml2.h>
#pragma GCC diagnostic pop

#include "config_parser.h"

#include "utilities.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>

// ============================================================================
// Config Parser
// ============================================================================

void ConfigParser::assign(const tinyxml2::XMLElement* parent, const char* tag,
                          std::string& target)
{
	if (const auto* text = get_text(parent, tag)) {
		const auto value = Util::trim(text);
		if (!value.empty()) {
			target = value;
		}
	}
}

void ConfigParser::parse_finder(const tinyxml2::XMLElement* root, FinderConfig& finder)
{
	const auto* elem = root->FirstChildElement("Finder");
	if (!elem) {
		return;
	}

	assign(elem, "Executable", finder.executable);
	assign(elem, "Height", finder.height);
	assign(elem, "Header", finder.header);

	// Prompt keeps its trailing blank
	if (const auto* prompt = get_text(elem, "Prompt")) {
		finder.prompt = prompt;
	}
}

void ConfigParser::parse_scripts(const tinyxml2::XMLElement* root, ScriptsConfig& scripts)
{
	const auto* elem = root->FirstChildElement("Scripts");
	if (!elem) {
		return;
	}

	assign(elem, "Root", scripts.root);
	assign(elem, "Directory", scripts.directory);
	assign(elem, "Extension", scripts.extension);
	assign(elem, "Interpreter", scripts.interpreter);

	// An empty prefix disables the exclusion
	if (const auto* prefix = elem->FirstChildElement("ExcludedPrefix")) {
		const char* text = prefix->GetText();
		scripts.excluded_prefix = text ? text : "";
	}
}

[[nodiscard]] std::optional<Config> ConfigParser::parse_document(const tinyxml2::XMLDocument& doc)
{
	const auto* root = doc.FirstChildElement("FuzzPick");
	if (!root) {
		std::cerr << "Error: No FuzzPick root element found\n";
		return std::nullopt;
	}

	Config config = {};
	parse_finder(root, config.finder);
	parse_scripts(root, config.scripts);
	return config;
}

[[nodiscard]] std::optional<Config> ConfigParser::parse(const std::string_view filename)
{
	tinyxml2::XMLDocument doc = {};
	if (doc.LoadFile(std::string(filename).c_str()) != tinyxml2::XML_SUCCESS) {
		std::cerr << "Error: Cannot read config file " << filename << ": "
		          << doc.ErrorStr() << '\n';
		return std::nullopt;
	}
	return parse_document(doc);
}

[[nodiscard]] std::optional<Config> ConfigParser::parse_string(const std::string_view text)
{
	tinyxml2::XMLDocument doc = {};
	if (doc.Parse(text.data(), text.size()) != tinyxml2::XML_SUCCESS) {
		std::cerr << "Error parsing config: " << doc.ErrorStr() << '\n';
		return std::nullopt;
	}
	return parse_document(doc);
}

[[nodiscard]] std::optional<std::string> ConfigParser::default_path()
{
	if (const char* explicit_path = std::getenv("FUZZPICK_CONFIG")) {
		return std::string(explicit_path);
	}
	if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
		return std::string(xdg) + "/fuzzpick/config.xml";
	}
	if (const char* home = std::getenv("HOME"); home && *home) {
		return std::string(home) + "/.config/fuzzpick/config.xml";
	}
	return std::nullopt;
}

[[nodiscard]] Config ConfigParser::load()
{
	const auto path = default_path();
	if (!path) {
		return {};
	}

	std::error_code ec = {};
	if (!std::filesystem::exists(*path, ec)) {
		return {};
	}

	if (auto config = parse(*path)) {
		return *config;
	}
	std::cerr << "Using default settings.\n";
	return {};
}
