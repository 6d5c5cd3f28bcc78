#pragma once

#include "utils.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace mdev::pydep {

// How "pkg/__init__.py" is named: "pkg" (Collapse) or "pkg.__init__" (Keep)
enum class InitModules { Collapse, Keep };

struct ModuleName {
	String_t              name;
	std::vector<String_t> parts; // never collapsed, base for relative imports
	bool                  is_package_init = false;
};

// absolute, lexically normalized and without trailing separator
std::filesystem::path normalized_absolute( const std::filesystem::path& path );

/**
 * root: top of the namespace, its directory name is the first segment of every module name
 * file: must be a ".py" file below root
 *
 * returns nothing if file is not a python file or lies outside of root
 */
std::optional<ModuleName> module_name( const std::filesystem::path& root,
									   const std::filesystem::path& file,
									   InitModules                  init_modules = InitModules::Collapse );

// Strips <level> trailing segments from caller_parts and appends module (if any).
// Returns invalid_module_name if level exceeds the number of caller segments.
String_t resolve_relative_import( const std::vector<String_t>& caller_parts, int level, std::string_view module );

} // namespace mdev::pydep
