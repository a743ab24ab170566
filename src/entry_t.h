#ifndef ENTRY_T
#define ENTRY_T

#include <string>

// One selectable candidate. The identifier is unique within a catalog.
struct CatalogEntry {
	std::string identifier      = {};
	std::string primary_label   = {};
	std::string secondary_label = {};
};

#endif
