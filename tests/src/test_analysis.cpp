#include <pydep/ModuleInfo.hpp>
#include <pydep/analysis.hpp>
#include <pydep/pydep.hpp>

#include <catch2/catch.hpp>

#include <algorithm>
#include <deque>
#include <filesystem>
#include <map>
#include <random>
#include <set>
#include <string>
#include <variant>
#include <vector>

using namespace mdev::pydep;
namespace fs = std::filesystem;

namespace {

using Names = std::set<String_t>;

FileInfo make_file( const std::string& root, const std::string& path, const std::vector<String_t>& targets )
{
	FileInfo f;
	f.path      = path;
	f.resolved  = path;
	f.directory = fs::path( path ).parent_path();
	f.module    = *module_name( root, path );
	for( const auto& t : targets ) {
		f.imports.push_back( ImportEdge{f.module.name, t} );
	}
	return f;
}

// graph where module "m<i>" imports "m<j>" for every edge i -> j
ProjectGraph make_graph( const std::vector<std::pair<int, int>>& edges, int module_count )
{
	std::vector<FileInfo> files;
	for( int i = 0; i < module_count; ++i ) {
		std::vector<String_t> targets;
		for( const auto& [from, to] : edges ) {
			if( from == i ) {
				targets.push_back( "g.m" + std::to_string( to ) );
			}
		}
		files.push_back( make_file( "/g", "/g/m" + std::to_string( i ) + ".py", targets ) );
	}
	return build_project_graph( files );
}

// hops from any of the seeds to every reachable module, following reverse dependencies
std::map<String_t, std::size_t> single_source_distances( const ReverseDependencies& reverse_deps, const String_t& seed )
{
	std::map<String_t, std::size_t> dist{{seed, 0}};
	std::deque<String_t>            queue{seed};
	while( !queue.empty() ) {
		const auto current = queue.front();
		queue.pop_front();
		const auto it = reverse_deps.find( current );
		if( it == reverse_deps.end() ) {
			continue;
		}
		for( const auto& d : it->second ) {
			if( dist.emplace( d, dist[current] + 1 ).second ) {
				queue.push_back( d );
			}
		}
	}
	return dist;
}

} // namespace

TEST_CASE( "build_reverse_dep_graph collapses repeated imports", "[analysis]" )
{
	const std::vector<ImportEdge> edges{{"a", "x"}, {"a", "x"}, {"b", "x"}, {"a", "y"}, {"c", "c"}};

	const auto reverse = build_reverse_dep_graph( edges );

	CHECK( reverse.size() == 3 );
	CHECK( reverse.at( "x" ) == Names{"a", "b"} );
	CHECK( reverse.at( "y" ) == Names{"a"} );
	CHECK( reverse.at( "c" ) == Names{"c"} );
}

TEST_CASE( "build_project_graph", "[analysis]" )
{
	const std::vector<FileInfo> files{
		make_file( "/p/pkgA", "/p/pkgA/a.py", {"pkgA.b", "os"} ),
		make_file( "/p/pkgA", "/p/pkgA/b.py", {} ),
		make_file( "/q/pkgA", "/q/pkgA/b.py", {"json"} ), // collides with the first pkgA.b
	};

	const auto graph = build_project_graph( files );

	CHECK( graph.modules == Names{"pkgA.a", "pkgA.b"} );
	CHECK( graph.edges.size() == 3 );
	CHECK( graph.files.size() == 3 );
	CHECK( graph.records.at( "pkgA.b" ).path == "/q/pkgA/b.py" );
	CHECK( graph.reverse_deps.at( "pkgA.b" ) == Names{"pkgA.a"} );
}

TEST_CASE( "internal imports and modules without internal dependencies", "[analysis]" )
{
	const auto graph = build_project_graph( std::vector<FileInfo>{
		make_file( "/p/pkgA", "/p/pkgA/a.py", {"pkgA.b", "os", "pkgA.b"} ),
		make_file( "/p/pkgA", "/p/pkgA/b.py", {"sys", "pkgA.missing"} ),
		make_file( "/p/pkgA", "/p/pkgA/c.py", {"pkgA.c"} ), // self import counts
		make_file( "/p/pkgA", "/p/pkgA/d.py", {invalid_module_name} ),
		make_file( "/p/pkgA", "/p/pkgA/e.py", {} ),
	} );

	const auto internal = internal_imports( graph );
	CHECK( internal == std::vector<ImportEdge>{{"pkgA.a", "pkgA.b"}, {"pkgA.a", "pkgA.b"}, {"pkgA.c", "pkgA.c"}} );

	const auto no_deps = modules_without_internal_deps( graph );
	CHECK( no_deps == Names{"pkgA.b", "pkgA.d", "pkgA.e"} );

	// a module is reported iff it has no import of a known module
	for( const auto& m : graph.modules ) {
		const bool imports_known = std::any_of( graph.edges.begin(), graph.edges.end(), [&]( const ImportEdge& e ) {
			return e.caller == m && graph.modules.count( e.target );
		} );
		CHECK( no_deps.count( m ) != static_cast<std::size_t>( imports_known ) );
	}

	const auto externals = external_imports( graph, no_deps );
	CHECK( externals.size() == 3 );
	CHECK( externals.at( "pkgA.b" ) == std::vector<String_t>{"sys", "pkgA.missing"} );
	CHECK( externals.at( "pkgA.d" ) == std::vector<String_t>{invalid_module_name} );
	CHECK( externals.at( "pkgA.e" ).empty() );
}

TEST_CASE( "direct dependents match the package and its submodules", "[analysis]" )
{
	const std::vector<ImportEdge> edges{
		{"a", "pkg"}, {"b", "pkg.sub"}, {"c", "pkgX"}, {"d", "other.pkg"}, {"e", "pkg.sub.deep"}};

	CHECK( direct_dependents( edges, "pkg" ) == Names{"a", "b", "e"} );
	CHECK( direct_dependents( edges, "pkg.sub" ) == Names{"b", "e"} );
	CHECK( direct_dependents( edges, "nothing" ).empty() );
}

TEST_CASE( "trace_dependency_paths", "[analysis]" )
{
	SECTION( "chain" )
	{
		// c imports b imports a
		const ReverseDependencies reverse{{"a", {"b"}}, {"b", {"c"}}, {"c", {"d"}}};

		const auto paths = trace_dependency_paths( reverse, {"a"} );
		CHECK( paths.size() == 3 );
		CHECK( paths.at( "b" ) == std::vector<String_t>{"a", "b"} );
		CHECK( paths.at( "d" ) == std::vector<String_t>{"a", "b", "c", "d"} );
		CHECK( paths.count( "a" ) == 0 );
	}
	SECTION( "cycles terminate" )
	{
		const ReverseDependencies reverse{{"a", {"b"}}, {"b", {"c"}}, {"c", {"a", "b"}}};

		const auto paths = trace_dependency_paths( reverse, {"a"} );
		CHECK( paths.size() == 2 );
		CHECK( paths.at( "c" ) == std::vector<String_t>{"a", "b", "c"} );
	}
	SECTION( "shortest path wins" )
	{
		const ReverseDependencies reverse{{"s", {"long1", "x"}}, {"long1", {"long2"}}, {"long2", {"target"}}, {"x", {"target"}}};

		const auto paths = trace_dependency_paths( reverse, {"s"} );
		CHECK( paths.at( "target" ) == std::vector<String_t>{"s", "x", "target"} );
	}
	SECTION( "equally long paths prefer the smallest seed" )
	{
		const ReverseDependencies reverse{{"seed_b", {"n"}}, {"seed_a", {"m"}}, {"m", {"target"}}, {"n", {"target"}}};

		const auto paths = trace_dependency_paths( reverse, {"seed_b", "seed_a"} );
		CHECK( paths.at( "target" ) == std::vector<String_t>{"seed_a", "m", "target"} );
	}
	SECTION( "seeds are never reported, even if reachable from other seeds" )
	{
		const ReverseDependencies reverse{{"a", {"b"}}, {"b", {"c"}}};

		const auto paths = trace_dependency_paths( reverse, {"a", "b"} );
		CHECK( paths.size() == 1 );
		CHECK( paths.at( "c" ) == std::vector<String_t>{"b", "c"} );
	}
}

TEST_CASE( "trace_dependency_paths finds shortest paths in random graphs", "[analysis]" )
{
	std::mt19937 rng( 42 );

	for( int round = 0; round < 20; ++round ) {
		const int                          module_count = 30;
		std::uniform_int_distribution<int> pick( 0, module_count - 1 );

		std::vector<std::pair<int, int>> edges;
		for( int i = 0; i < 60; ++i ) {
			edges.emplace_back( pick( rng ), pick( rng ) );
		}
		const auto graph = make_graph( edges, module_count );

		std::set<String_t> seeds;
		for( int i = 0; i < 3; ++i ) {
			seeds.insert( "g.m" + std::to_string( pick( rng ) ) );
		}

		const auto paths = trace_dependency_paths( graph.reverse_deps, seeds );

		std::map<String_t, std::size_t> best;
		for( const auto& s : seeds ) {
			for( const auto& [m, d] : single_source_distances( graph.reverse_deps, s ) ) {
				auto it = best.find( m );
				if( it == best.end() || d < it->second ) {
					best[m] = d;
				}
			}
		}

		// everything reachable is found, with a minimal number of hops along existing reverse edges
		std::size_t reachable = 0;
		for( const auto& [m, d] : best ) {
			if( seeds.count( m ) ) {
				continue;
			}
			++reachable;
			REQUIRE( paths.count( m ) );
			const auto& path = paths.at( m );
			CHECK( path.size() == d + 1 );
			CHECK( seeds.count( path.front() ) );
			CHECK( path.back() == m );
			for( std::size_t i = 1; i < path.size(); ++i ) {
				CHECK( graph.reverse_deps.at( path[i - 1] ).count( path[i] ) );
			}
		}
		CHECK( paths.size() == reachable );

		// same seeds inserted in a different order give identical results
		std::vector<String_t> shuffled( seeds.begin(), seeds.end() );
		std::shuffle( shuffled.begin(), shuffled.end(), rng );
		CHECK( trace_dependency_paths( graph.reverse_deps, std::set<String_t>( shuffled.begin(), shuffled.end() ) )
			   == paths );
	}
}

TEST_CASE( "dependents and non dependents partition the modules", "[analysis]" )
{
	std::mt19937 rng( 7 );

	for( int round = 0; round < 10; ++round ) {
		const int                          module_count = 25;
		std::uniform_int_distribution<int> pick( 0, module_count - 1 );

		std::vector<std::pair<int, int>> edges;
		for( int i = 0; i < 30; ++i ) {
			edges.emplace_back( pick( rng ), pick( rng ) );
		}
		const auto graph = make_graph( edges, module_count );

		for( const String_t package : {"g.m" + std::to_string( pick( rng ) ), String_t( "g" ), String_t( "unknown" )} ) {
			const auto dependents = package_dependents( graph, package );
			const auto others     = non_dependents( graph, package );

			std::set<String_t> all = others;
			for( const auto& m : dependents.direct ) {
				CHECK( all.insert( m ).second );
			}
			for( const auto& [m, path] : dependents.indirect ) {
				CHECK( all.insert( m ).second );
			}
			CHECK( all == graph.modules );
		}
	}
}

TEST_CASE( "package dependents", "[analysis]" )
{
	const auto graph = build_project_graph( std::vector<FileInfo>{
		make_file( "/p/pkgA", "/p/pkgA/a.py", {"pkgA.b"} ),
		make_file( "/p/pkgA", "/p/pkgA/b.py", {"requests"} ),
		make_file( "/p/pkgA", "/p/pkgA/c.py", {"pkgA.a"} ),
		make_file( "/p/pkgA", "/p/pkgA/d.py", {"requests.adapters"} ),
		make_file( "/p/pkgA", "/p/pkgA/e.py", {"os"} ),
		make_file( "/p/pkgA", "/p/pkgA/f.py", {invalid_module_name} ),
	} );

	const auto dependents = package_dependents( graph, "requests" );
	CHECK( dependents.package == "requests" );
	CHECK( dependents.direct == Names{"pkgA.b", "pkgA.d"} );
	CHECK( dependents.indirect.size() == 2 );
	CHECK( dependents.indirect.at( "pkgA.c" ) == std::vector<String_t>{"pkgA.b", "pkgA.a", "pkgA.c"} );

	CHECK( dependents.chain( "pkgA.d" ) == std::vector<String_t>{"requests", "pkgA.d"} );
	CHECK( dependents.chain( "pkgA.a" ) == std::vector<String_t>{"requests", "pkgA.b", "pkgA.a"} );
	CHECK( dependents.chain( "pkgA.e" ).empty() );

	CHECK( non_dependents( graph, "requests" ) == Names{"pkgA.e", "pkgA.f"} );
}

TEST_CASE( "invalid relative imports never show up in positive results", "[analysis]" )
{
	const auto graph = build_project_graph( std::vector<FileInfo>{
		make_file( "/p/pkgA", "/p/pkgA/a.py", {invalid_module_name} ),
		make_file( "/p/pkgA", "/p/pkgA/b.py", {"pkgA.a"} ),
	} );

	CHECK( internal_imports( graph ) == std::vector<ImportEdge>{{"pkgA.b", "pkgA.a"}} );
	CHECK( modules_without_internal_deps( graph ).count( "pkgA.a" ) );
	CHECK( package_dependents( graph, "pkgA" ).direct == Names{"pkgA.b"} );
	CHECK( imports_outside_local_dir( graph ).empty() );
	CHECK( encapsulated_directories( graph ) == std::set<fs::path>{"/p/pkgA"} );
}

TEST_CASE( "imports outside of the local directory", "[analysis]" )
{
	const auto graph = build_project_graph( std::vector<FileInfo>{
		make_file( "/p/pkgA", "/p/pkgA/top.py", {"pkgA.sub.inner", "pkgA.sibling"} ),
		make_file( "/p/pkgA", "/p/pkgA/sibling.py", {} ),
		make_file( "/p/pkgA", "/p/pkgA/sub/inner.py", {"pkgA.sub.deeper.x", "pkgA.top", "pkgA.other.y", "os"} ),
		make_file( "/p/pkgA", "/p/pkgA/sub/deeper/x.py", {"pkgA.sub.inner"} ),
		make_file( "/p/pkgA", "/p/pkgA/other/y.py", {} ),
		make_file( "/p/pkgA", "/p/pkgA/subway.py", {"pkgA.sub.inner"} ),
	} );

	const auto outside = imports_outside_local_dir( graph );

	CHECK( outside.size() == 2 );
	CHECK( outside.at( "pkgA.sub.inner" ) == Names{"pkgA.other.y", "pkgA.top"} );
	CHECK( outside.at( "pkgA.sub.deeper.x" ) == Names{"pkgA.sub.inner"} );
}

TEST_CASE( "encapsulated directories", "[analysis]" )
{
	std::vector<FileInfo> files{
		make_file( "/p/pkgA", "/p/pkgA/main.py", {"pkgA.lib.core"} ),
		make_file( "/p/pkgA", "/p/pkgA/lib/core.py", {"pkgA.lib.util", "pkgA.lib.impl.detail", "numpy"} ),
		make_file( "/p/pkgA", "/p/pkgA/lib/util.py", {"pkgA.lib.core"} ),
		make_file( "/p/pkgA", "/p/pkgA/lib/impl/detail.py", {"pkgA.lib.util"} ),
		make_file( "/p/pkgA", "/p/pkgA/tools/tool.py", {"pkgA.main"} ),
	};

	CHECK( encapsulated_directories( build_project_graph( files ) )
		   == std::set<fs::path>{"/p/pkgA", "/p/pkgA/lib"} );

	// a single import of a sibling tree breaks encapsulation of lib
	files.push_back( make_file( "/p/pkgA", "/p/pkgA/lib/leak.py", {"pkgA.tools.tool"} ) );
	CHECK( encapsulated_directories( build_project_graph( files ) ) == std::set<fs::path>{"/p/pkgA"} );
}

TEST_CASE( "directories are checked per root", "[analysis]" )
{
	// the same directory seen from two roots
	std::vector<FileInfo> files{
		make_file( "/p/outer", "/p/outer/inner/m.py", {"outer.x"} ),
		make_file( "/p/outer", "/p/outer/x.py", {} ),
	};
	auto from_inner       = make_file( "/p/outer/inner", "/p/outer/inner/m.py", {} );
	from_inner.root_index = 1;
	files.push_back( from_inner );

	const auto graph = build_project_graph( files );
	CHECK( graph.modules == Names{"inner.m", "outer.inner.m", "outer.x"} );
	CHECK( encapsulated_directories( graph ) == std::set<fs::path>{"/p/outer", "/p/outer/inner"} );
}

TEST_CASE( "is_within", "[analysis]" )
{
	CHECK( is_within( "/a/b/c.py", "/a/b" ) );
	CHECK( is_within( "/a/b/c/d.py", "/a/b" ) );
	CHECK( is_within( "/a/b", "/a/b" ) );
	CHECK_FALSE( is_within( "/a/bc/d.py", "/a/b" ) );
	CHECK_FALSE( is_within( "/a/d.py", "/a/b" ) );
}

TEST_CASE( "modes", "[analysis]" )
{
	for( const auto mode : {Mode::Dep,
							Mode::NoDeps,
							Mode::NoDepsVerbose,
							Mode::PkgDep,
							Mode::NotPkgDep,
							Mode::OutsideLocalDir,
							Mode::EncapsulatedDir} ) {
		CHECK( parse_mode( to_string( mode ) ) == mode );
	}
	CHECK( to_string( Mode::NoDepsVerbose ) == "nodeps_verbose" );
	CHECK_FALSE( parse_mode( "deps" ) );
	CHECK_FALSE( parse_mode( "" ) );

	CHECK( requires_package( Mode::PkgDep ) );
	CHECK( requires_package( Mode::NotPkgDep ) );
	CHECK_FALSE( requires_package( Mode::Dep ) );
}

TEST_CASE( "run_query dispatches on the mode", "[analysis]" )
{
	const auto graph = build_project_graph( std::vector<FileInfo>{
		make_file( "/p/pkgA", "/p/pkgA/a.py", {"pkgA.b"} ),
		make_file( "/p/pkgA", "/p/pkgA/b.py", {"json"} ),
	} );

	CHECK( std::holds_alternative<InternalImports>( run_query( graph, {Mode::Dep, {}} ) ) );
	CHECK( std::holds_alternative<ModulesWithoutDeps>( run_query( graph, {Mode::NoDeps, {}} ) ) );
	CHECK( std::holds_alternative<ExternalImports>( run_query( graph, {Mode::NoDepsVerbose, {}} ) ) );
	CHECK( std::holds_alternative<OutsideLocalImports>( run_query( graph, {Mode::OutsideLocalDir, {}} ) ) );
	CHECK( std::holds_alternative<EncapsulatedDirectories>( run_query( graph, {Mode::EncapsulatedDir, {}} ) ) );

	const auto dependents = run_query( graph, {Mode::PkgDep, String_t( "json" )} );
	REQUIRE( std::holds_alternative<PackageDependents>( dependents ) );
	CHECK( std::get<PackageDependents>( dependents ).direct == Names{"pkgA.b"} );
	CHECK( std::get<PackageDependents>( dependents ).indirect.count( "pkgA.a" ) );

	const auto others = run_query( graph, {Mode::NotPkgDep, String_t( "pkgA.a" )} );
	REQUIRE( std::holds_alternative<NonDependents>( others ) );
	CHECK( std::get<NonDependents>( others ).modules == Names{"pkgA.a", "pkgA.b"} );

	// the package is ignored by the other modes
	CHECK( std::get<ModulesWithoutDeps>( run_query( graph, {Mode::NoDeps, String_t( "json" )} ) ).modules
		   == Names{"pkgA.b"} );

	CHECK_THROWS_AS( run_query( graph, {Mode::PkgDep, {}} ), std::invalid_argument );
	CHECK_THROWS_AS( run_query( graph, {Mode::NotPkgDep, {}} ), std::invalid_argument );
}
