#pragma once

#include "ModuleInfo.hpp"
#include "utils.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string_view>
#include <variant>
#include <vector>

namespace mdev::pydep {

enum class Mode { Dep, NoDeps, NoDepsVerbose, PkgDep, NotPkgDep, OutsideLocalDir, EncapsulatedDir };

std::optional<Mode> parse_mode( std::string_view name );
std::string_view    to_string( Mode mode );
bool                requires_package( Mode mode );

struct Query {
	Mode                    mode;
	std::optional<String_t> package;
};

// module -> [seed, ..., module]
using DependencyPaths = std::map<String_t, std::vector<String_t>>;

struct InternalImports {
	std::vector<ImportEdge> edges;
};

struct ModulesWithoutDeps {
	std::set<String_t> modules;
};

struct ExternalImports {
	// every module without internal dependencies, with the imports that don't name a known module
	std::map<String_t, std::vector<String_t>> imports;
};

struct PackageDependents {
	String_t           package;
	std::set<String_t> direct;
	DependencyPaths    indirect;

	// [package, seed, ..., module] or empty if module doesn't depend on package
	std::vector<String_t> chain( const String_t& module ) const;
};

struct NonDependents {
	String_t           package;
	std::set<String_t> modules;
};

struct OutsideLocalImports {
	std::map<String_t, std::set<String_t>> imports;
};

struct EncapsulatedDirectories {
	std::set<std::filesystem::path> directories;
};

using QueryResult = std::variant<InternalImports,
								 ModulesWithoutDeps,
								 ExternalImports,
								 PackageDependents,
								 NonDependents,
								 OutsideLocalImports,
								 EncapsulatedDirectories>;

// lexical check, both paths have to be absolute and normalized
bool is_within( const std::filesystem::path& path, const std::filesystem::path& dir );

// sorted, an import that occurs several times is listed several times
std::vector<ImportEdge> internal_imports( const ProjectGraph& graph );

std::set<String_t> modules_without_internal_deps( const ProjectGraph& graph );

std::map<String_t, std::vector<String_t>> external_imports( const ProjectGraph& graph, const std::set<String_t>& modules );

std::set<String_t> direct_dependents( const std::vector<ImportEdge>& edges, std::string_view package );

/**
 * Breadth first search over the reverse dependencies, starting at all seeds simultaneously.
 * Seeds are processed in sorted order, so every module gets a shortest path and among those
 * the one starting at the smallest seed. Seeds themselves are not part of the result.
 */
DependencyPaths trace_dependency_paths( const ReverseDependencies& reverse_deps, const std::set<String_t>& seeds );

PackageDependents package_dependents( const ProjectGraph& graph, std::string_view package );

std::set<String_t> non_dependents( const ProjectGraph& graph, std::string_view package );

std::map<String_t, std::set<String_t>> imports_outside_local_dir( const ProjectGraph& graph );

std::set<std::filesystem::path> encapsulated_directories( const ProjectGraph& graph );

// throws std::invalid_argument if query.mode requires a package and none is given
QueryResult run_query( const ProjectGraph& graph, const Query& query );

} // namespace mdev::pydep
