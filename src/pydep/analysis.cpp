#include "analysis.hpp"

#include <algorithm>
#include <array>
#include <deque>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::pair<mdev::pydep::Mode, std::string_view>, 7> mode_names{{
	{mdev::pydep::Mode::Dep, "dep"},
	{mdev::pydep::Mode::NoDeps, "nodeps"},
	{mdev::pydep::Mode::NoDepsVerbose, "nodeps_verbose"},
	{mdev::pydep::Mode::PkgDep, "pkg_dep"},
	{mdev::pydep::Mode::NotPkgDep, "not_pkg_dep"},
	{mdev::pydep::Mode::OutsideLocalDir, "outside_local_dir"},
	{mdev::pydep::Mode::EncapsulatedDir, "encapsulated_dir"},
}};

template<class Set>
Set set_difference( const Set& l, const Set& r )
{
	Set ret;
	std::set_difference( l.begin(), l.end(), r.begin(), r.end(), std::inserter( ret, ret.begin() ) );
	return ret;
}

} // namespace

namespace mdev::pydep {

std::optional<Mode> parse_mode( std::string_view name )
{
	for( const auto& [mode, mode_name] : mode_names ) {
		if( mode_name == name ) {
			return mode;
		}
	}
	return {};
}

std::string_view to_string( Mode mode )
{
	for( const auto& [m, mode_name] : mode_names ) {
		if( m == mode ) {
			return mode_name;
		}
	}
	return {};
}

bool requires_package( Mode mode )
{
	return mode == Mode::PkgDep || mode == Mode::NotPkgDep;
}

std::vector<String_t> PackageDependents::chain( const String_t& module ) const
{
	if( direct.count( module ) ) {
		return {package, module};
	}
	const auto it = indirect.find( module );
	if( it == indirect.end() ) {
		return {};
	}
	std::vector<String_t> ret{package};
	ret.insert( ret.end(), it->second.begin(), it->second.end() );
	return ret;
}

bool is_within( const fs::path& path, const fs::path& dir )
{
	const auto relative = path.lexically_relative( dir );
	return !relative.empty() && *relative.begin() != "..";
}

//################### Internal dependencies #####################################

std::vector<ImportEdge> internal_imports( const ProjectGraph& graph )
{
	std::vector<ImportEdge> ret;
	std::copy_if( graph.edges.begin(), graph.edges.end(), std::back_inserter( ret ), [&]( const ImportEdge& e ) {
		return graph.modules.count( e.target ) != 0;
	} );
	// one entry per import statement, repeated imports are listed repeatedly
	std::sort( ret.begin(), ret.end() );
	return ret;
}

std::set<String_t> modules_without_internal_deps( const ProjectGraph& graph )
{
	std::set<String_t> has_deps;
	for( const auto& e : graph.edges ) {
		if( graph.modules.count( e.target ) ) {
			has_deps.insert( e.caller );
		}
	}
	return set_difference( graph.modules, has_deps );
}

std::map<String_t, std::vector<String_t>> external_imports( const ProjectGraph& graph, const std::set<String_t>& modules )
{
	std::map<String_t, std::vector<String_t>> ret;
	for( const auto& m : modules ) {
		ret[m];
	}
	for( const auto& e : graph.edges ) {
		if( modules.count( e.caller ) && !graph.modules.count( e.target ) ) {
			ret[e.caller].push_back( e.target );
		}
	}
	return ret;
}

//################### Package dependencies #####################################

std::set<String_t> direct_dependents( const std::vector<ImportEdge>& edges, std::string_view package )
{
	std::set<String_t> ret;
	for( const auto& e : edges ) {
		if( has_dotted_prefix( e.target, package ) ) {
			ret.insert( e.caller );
		}
	}
	return ret;
}

DependencyPaths trace_dependency_paths( const ReverseDependencies& reverse_deps, const std::set<String_t>& seeds )
{
	DependencyPaths      paths;
	std::set<String_t>   visited( seeds );
	std::deque<String_t> queue( seeds.begin(), seeds.end() );

	while( !queue.empty() ) {
		const String_t current = std::move( queue.front() );
		queue.pop_front();

		const auto it = reverse_deps.find( current );
		if( it == reverse_deps.end() ) {
			continue;
		}
		for( const auto& dependent : it->second ) {
			if( !visited.insert( dependent ).second ) {
				continue;
			}
			auto path = seeds.count( current ) ? std::vector<String_t>{current} : paths.at( current );
			path.push_back( dependent );
			paths.emplace( dependent, std::move( path ) );
			queue.push_back( dependent );
		}
	}
	return paths;
}

PackageDependents package_dependents( const ProjectGraph& graph, std::string_view package )
{
	PackageDependents ret;
	ret.package  = String_t( package );
	ret.direct   = direct_dependents( graph.edges, package );
	ret.indirect = trace_dependency_paths( graph.reverse_deps, ret.direct );
	return ret;
}

std::set<String_t> non_dependents( const ProjectGraph& graph, std::string_view package )
{
	const auto dependents = package_dependents( graph, package );

	std::set<String_t> ret;
	for( const auto& m : graph.modules ) {
		if( !dependents.direct.count( m ) && !dependents.indirect.count( m ) ) {
			ret.insert( m );
		}
	}
	return ret;
}

//################### Directory locality #####################################

std::map<String_t, std::set<String_t>> imports_outside_local_dir( const ProjectGraph& graph )
{
	std::map<String_t, std::set<String_t>> ret;
	for( const auto& e : graph.edges ) {
		const auto caller = graph.records.find( e.caller );
		const auto target = graph.records.find( e.target );
		if( caller == graph.records.end() || target == graph.records.end() ) {
			continue;
		}
		if( !is_within( target->second.resolved, caller->second.directory ) ) {
			ret[e.caller].insert( e.target );
		}
	}
	return ret;
}

std::set<fs::path> encapsulated_directories( const ProjectGraph& graph )
{
	// only imports of files we know about are relevant
	std::map<String_t, std::vector<const ModuleInfo*>> known_targets;
	for( const auto& e : graph.edges ) {
		const auto target = graph.records.find( e.target );
		if( target != graph.records.end() ) {
			known_targets[e.caller].push_back( &target->second );
		}
	}

	// (root, directory) -> modules directly inside of directory
	std::map<std::pair<std::size_t, fs::path>, std::vector<String_t>> local_modules;
	for( const auto& f : graph.files ) {
		if( graph.records.count( f.module_name ) ) {
			local_modules[{f.root_index, f.directory}].push_back( f.module_name );
		}
	}

	std::set<fs::path> ret;
	for( const auto& [key, modules] : local_modules ) {
		const fs::path& dir = key.second;

		const bool encapsulated = std::all_of( modules.begin(), modules.end(), [&]( const String_t& m ) {
			const auto it = known_targets.find( m );
			if( it == known_targets.end() ) {
				return true;
			}
			return std::all_of( it->second.begin(), it->second.end(), [&]( const ModuleInfo* t ) {
				return is_within( t->resolved, dir );
			} );
		} );

		if( !modules.empty() && encapsulated ) {
			ret.insert( dir );
		}
	}
	return ret;
}

//################### Dispatch #####################################

QueryResult run_query( const ProjectGraph& graph, const Query& query )
{
	if( requires_package( query.mode ) && !query.package ) {
		throw std::invalid_argument( "--mode " + String_t( to_string( query.mode ) ) + " requires a package name." );
	}

	switch( query.mode ) {
		case Mode::Dep: return InternalImports{internal_imports( graph )};
		case Mode::NoDeps: return ModulesWithoutDeps{modules_without_internal_deps( graph )};
		case Mode::NoDepsVerbose:
			return ExternalImports{external_imports( graph, modules_without_internal_deps( graph ) )};
		case Mode::PkgDep: return package_dependents( graph, *query.package );
		case Mode::NotPkgDep: return NonDependents{*query.package, non_dependents( graph, *query.package )};
		case Mode::OutsideLocalDir: return OutsideLocalImports{imports_outside_local_dir( graph )};
		case Mode::EncapsulatedDir: return EncapsulatedDirectories{encapsulated_directories( graph )};
	}
	throw std::invalid_argument( "unknown query mode" );
}

} // namespace mdev::pydep
