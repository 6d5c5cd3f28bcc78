#pragma once

#include "ModuleInfo.hpp"
#include "imports.hpp"
#include "module_names.hpp"
#include "utils.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace mdev::pydep {

enum class ScanParallel { No, Yes };

struct FileInfo {
	std::size_t             root_index = 0; // position of the root in the list passed to scan_python_roots
	std::filesystem::path   path;           // absolute
	std::filesystem::path   resolved;       // symlinks resolved
	std::filesystem::path   directory;      // resolved containing directory
	ModuleName              module;
	std::vector<ImportEdge> imports;
	std::optional<String_t> scan_error;
};

// all .py files below root (absolute, sorted); unreadable directories are skipped
std::vector<std::filesystem::path> discover_python_files( const std::filesystem::path& root );

std::vector<FileInfo> scan_python_roots( const std::vector<std::filesystem::path>& roots,
										 InitModules                               init_modules   = InitModules::Collapse,
										 RelativeNames                             relative_names = RelativeNames::Coarse,
										 ScanParallel                              parallel       = ScanParallel::Yes,
										 RootParents                               root_parents   = RootParents::No );

ReverseDependencies build_reverse_dep_graph( const std::vector<ImportEdge>& edges );

// files are processed in order, so for colliding module names the last file wins
ProjectGraph build_project_graph( const std::vector<FileInfo>& files );

ProjectGraph build_project_graph( const std::vector<std::filesystem::path>& roots,
								  InitModules                               init_modules   = InitModules::Collapse,
								  RelativeNames                             relative_names = RelativeNames::Coarse,
								  ScanParallel                              parallel       = ScanParallel::Yes,
								  RootParents                               root_parents   = RootParents::No );

} // namespace mdev::pydep
