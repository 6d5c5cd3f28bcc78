#pragma once

#include "utils.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace mdev::pydep {

// Target of a relative import that climbs above the caller's top level package
inline const String_t invalid_module_name = "<invalid>";

struct ImportEdge {
	String_t caller;
	String_t target;

	friend bool operator<( const ImportEdge& l, const ImportEdge& r )
	{
		return std::tie( l.caller, l.target ) < std::tie( r.caller, r.target );
	}
	friend bool operator==( const ImportEdge& l, const ImportEdge& r )
	{
		return l.caller == r.caller && l.target == r.target;
	}
};

struct ModuleInfo {
	String_t              name;
	std::filesystem::path path;      // absolute, as discovered
	std::filesystem::path resolved;  // symlinks resolved
	std::filesystem::path directory; // resolved containing directory
};

struct modules_data : std::map<String_t, ModuleInfo> {
};

// target -> callers
using ReverseDependencies = std::map<String_t, std::set<String_t>>;

// One discovered file, grouped by the root it was found under
struct SourceFile {
	std::size_t           root_index;
	String_t              module_name;
	std::filesystem::path directory; // resolved containing directory
};

struct ProjectGraph {
	std::set<String_t>      modules;
	std::vector<ImportEdge> edges;
	modules_data            records;
	ReverseDependencies     reverse_deps;
	std::vector<SourceFile> files;
};

} // namespace mdev::pydep
