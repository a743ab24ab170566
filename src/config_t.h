#ifndef CONFIG_T
#define CONFIG_T

#include <string>

struct FinderConfig {
	std::string executable = "fzf";
	std::string height     = "40%";
	std::string header     = {};
	std::string prompt     = "> ";
};

struct ScriptsConfig {
	std::string root            = {};
	std::string directory       = "scripts";
	std::string extension       = ".py";
	std::string excluded_prefix = "_";
	std::string interpreter     = "python3";
};

struct Config {
	FinderConfig finder   = {};
	ScriptsConfig scripts = {};
};

#endif
