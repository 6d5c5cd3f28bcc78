#include "pydep.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include <system_error>

//#define PYDEP_DONT_USE_STD_PARALLEL

// clang-format off
#ifndef PYDEP_DONT_USE_STD_PARALLEL
	#ifndef __cpp_lib_parallel_algorithm
		#define PYDEP_DONT_USE_STD_PARALLEL
	#endif
#endif // !PYDEP_DONT_USE_STD_PARALLEL


#ifndef PYDEP_DONT_USE_STD_PARALLEL
	#include <execution>
#endif //

// clang-format on

namespace fs = std::filesystem;

namespace mdev::pydep {

namespace {

//################### Detect files #####################################

fs::path resolve_path( const fs::path& path )
{
	std::error_code ec;
	fs::path        ret = fs::weakly_canonical( path, ec );
	return ec ? path : ret;
}

std::optional<std::string> read_file( const fs::path& file )
{
	std::ifstream is( file, std::ios::binary );
	if( !is ) {
		return {};
	}
	std::string content{std::istreambuf_iterator<char>( is ), std::istreambuf_iterator<char>()};
	if( is.bad() ) {
		return {};
	}
	return content;
}

// A directory that can't be read, or fails half way through, only loses its own entries.
// Directory symlinks are not followed.
void list_directory( const fs::path& dir, std::vector<fs::path>& files, std::vector<fs::path>& subdirs )
{
	std::error_code ec;
	for( fs::directory_iterator it( dir, fs::directory_options::skip_permission_denied, ec ), end;
		 !ec && it != end;
		 it.increment( ec ) ) {
		std::error_code entry_ec;
		if( it->is_directory( entry_ec ) ) {
			if( !it->is_symlink( entry_ec ) ) {
				subdirs.push_back( it->path() );
			}
		} else if( it->path().extension() == ".py" && it->is_regular_file( entry_ec ) ) {
			files.push_back( normalized_absolute( it->path() ) );
		}
	}
}

//################### Parse imports #####################################

void scan_file( FileInfo& file, const ImportContext& ctx )
{
	file.resolved  = resolve_path( file.path );
	file.directory = resolve_path( file.path.parent_path() );

	const auto source = read_file( file.path );
	if( !source ) {
		file.scan_error = "could not read file";
		return;
	}
	file.imports = analyze_imports( file.module, *source, ctx, &file.scan_error );
}

} // namespace

std::vector<fs::path> discover_python_files( const fs::path& root )
{
	std::vector<fs::path> files;

	std::error_code ec;
	if( !fs::is_directory( root, ec ) ) {
		return files;
	}

	std::vector<fs::path> pending{root};
	while( !pending.empty() ) {
		const fs::path dir = std::move( pending.back() );
		pending.pop_back();
		list_directory( dir, files, pending );
	}
	std::sort( files.begin(), files.end() );
	return files;
}

std::vector<FileInfo> scan_python_roots( const std::vector<fs::path>& roots,
										 InitModules                  init_modules,
										 RelativeNames                relative_names,
										 ScanParallel                 parallel,
										 RootParents                  root_parents )
{
	std::vector<FileInfo> files;
	std::set<fs::path>    known_files;

	for( std::size_t i = 0; i < roots.size(); ++i ) {
		for( auto& path : discover_python_files( roots[i] ) ) {
			auto name = module_name( roots[i], path, init_modules );
			if( !name ) {
				continue;
			}
			known_files.insert( path );

			FileInfo f;
			f.root_index = i;
			f.path       = std::move( path );
			f.module     = std::move( *name );
			files.push_back( std::move( f ) );
		}
	}

	// module names start with the name of their root, so relative imports (and with RootParents::Yes
	// also "from a.b import c") are looked up next to the roots
	std::vector<fs::path> namespace_bases;
	for( const auto& root : roots ) {
		auto base = normalized_absolute( root ).parent_path();
		if( std::find( namespace_bases.begin(), namespace_bases.end(), base ) == namespace_bases.end() ) {
			namespace_bases.push_back( std::move( base ) );
		}
	}

	const FileExists exists = [&known_files]( const fs::path& p ) { return known_files.count( p ) != 0; };

	std::vector<ImportContext> contexts;
	contexts.reserve( roots.size() );
	for( const auto& root : roots ) {
		contexts.push_back(
			ImportContext{normalized_absolute( root ), namespace_bases, exists, relative_names, root_parents} );
	}

	// every task only touches its own FileInfo, known_files and contexts are read only
	const auto scan = [&contexts]( FileInfo& f ) { scan_file( f, contexts[f.root_index] ); };

#ifndef PYDEP_DONT_USE_STD_PARALLEL
	if( parallel == ScanParallel::Yes ) {
		std::for_each( std::execution::par, files.begin(), files.end(), scan );
		return files;
	}
#else
	(void)parallel;
#endif
	std::for_each( files.begin(), files.end(), scan );
	return files;
}

ReverseDependencies build_reverse_dep_graph( const std::vector<ImportEdge>& edges )
{
	ReverseDependencies ret;
	for( const auto& e : edges ) {
		ret[e.target].insert( e.caller );
	}
	return ret;
}

ProjectGraph build_project_graph( const std::vector<FileInfo>& files )
{
	ProjectGraph graph;
	for( const auto& f : files ) {
		const auto& name = f.module.name;

		graph.modules.insert( name );
		graph.records[name] = ModuleInfo{name, f.path, f.resolved, f.directory};
		graph.files.push_back( SourceFile{f.root_index, name, f.directory} );
		graph.edges.insert( graph.edges.end(), f.imports.begin(), f.imports.end() );
	}
	graph.reverse_deps = build_reverse_dep_graph( graph.edges );
	return graph;
}

ProjectGraph build_project_graph( const std::vector<fs::path>& roots,
								  InitModules                  init_modules,
								  RelativeNames                relative_names,
								  ScanParallel                 parallel,
								  RootParents                  root_parents )
{
	return build_project_graph( scan_python_roots( roots, init_modules, relative_names, parallel, root_parents ) );
}

} // namespace mdev::pydep
