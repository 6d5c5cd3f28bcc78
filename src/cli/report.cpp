#include "report.hpp"

#include <algorithm>
#include <iomanip>
#include <string>
#include <variant>

namespace mdev::pydep::cli {

namespace {

template<class... Ts>
struct overloaded : Ts... {
	using Ts::operator()...;
};
template<class... Ts>
overloaded( Ts... ) -> overloaded<Ts...>;

constexpr int         module_column_width = 60;
constexpr const char* arrow               = "\xE2\x86\xB3"; // U+21B3

void print_modules( std::ostream& os, const std::set<String_t>& modules )
{
	for( const auto& m : modules ) {
		os << m << "\n";
	}
}

void print_path( std::ostream& os, const std::vector<String_t>& path )
{
	for( std::size_t i = 0; i < path.size(); ++i ) {
		os << ( i == 0 ? "" : " -> " ) << path[i];
	}
}

} // namespace

void print_report( std::ostream& os, const ProjectGraph& graph, const QueryResult& result )
{
	std::visit( overloaded{
					[&]( const InternalImports& r ) {
						os << "\nInternal Imports Found:\n";
						for( const auto& e : r.edges ) {
							os << e.caller << " imports " << e.target << " --> " << e.target << "\n";
						}
					},
					[&]( const ModulesWithoutDeps& r ) {
						os << "\nModules with no internal dependencies:\n";
						print_modules( os, r.modules );
					},
					[&]( const ExternalImports& r ) {
						os << "\nModules with no internal dependencies (external dependencies shown):\n";
						os << std::left << std::setw( module_column_width ) << "MODULE"
						   << " | EXTERNAL IMPORT\n";
						os << std::string( 90, '=' ) << "\n";
						for( const auto& [module, externals] : r.imports ) {
							if( externals.empty() ) {
								os << std::left << std::setw( module_column_width ) << module << " | -\n";
								continue;
							}
							for( std::size_t i = 0; i < externals.size(); ++i ) {
								os << std::left << std::setw( module_column_width ) << ( i == 0 ? module : "" )
								   << " | " << externals[i] << "\n";
							}
						}
					},
					[&]( const PackageDependents& r ) {
						for( const auto& [module, path] : r.indirect ) {
							os << module << " (indirect)\n";
							os << "  path: ";
							print_path( os, path );
							os << "\n";
						}
						for( const auto& module : r.direct ) {
							os << module << " (direct)\n";
						}
					},
					[&]( const NonDependents& r ) {
						os << "\nModules NOT dependent (even recursively) on package '" << r.package << "':\n";
						print_modules( os, r.modules );
					},
					[&]( const OutsideLocalImports& r ) {
						os << "\nFiles importing outside their local directory or subdirectories:\n";
						for( const auto& [caller, imports] : r.imports ) {
							os << graph.records.at( caller ).path.string() << "\n";
							for( const auto& imported : imports ) {
								const auto it = graph.records.find( imported );
								if( it != graph.records.end() ) {
									os << "  " << arrow << " " << it->second.path.string() << "\n";
								} else {
									os << "  " << arrow << " " << imported << " (not found in local module map)\n";
								}
							}
						}
					},
					[&]( const EncapsulatedDirectories& r ) {
						os << "\nEncapsulated directories (only import within own directory tree):\n";
						for( const auto& dir : r.directories ) {
							os << dir.string() << "\n";
						}
					},
				},
				result );
}

void print_scan_errors( std::ostream& os, const std::vector<FileInfo>& files )
{
	for( const auto& f : files ) {
		if( f.scan_error ) {
			os << "Skipping imports of " << f.path.string() << " (" << *f.scan_error << ")\n";
		}
	}
}

void print_scan_stats( std::ostream&                       os,
					   std::size_t                         root_count,
					   const std::vector<FileInfo>&        files,
					   const ProjectGraph&                 graph,
					   std::chrono::steady_clock::duration scan_time )
{
	const auto failed = std::count_if( files.begin(), files.end(), []( const FileInfo& f ) { return f.scan_error.has_value(); } );
	const auto ms     = std::chrono::duration_cast<std::chrono::milliseconds>( scan_time ).count();

	os << "Scanned " << files.size() << " files in " << root_count << " roots (" << failed << " unparsable) in " << ms
	   << " ms\n";
	os << "Modules: " << graph.modules.size() << ", imports: " << graph.edges.size() << "\n";
}

} // namespace mdev::pydep::cli
