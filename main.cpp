#include <cli/control.hpp>
#include <cli/report.hpp>

#include <pydep/analysis.hpp>
#include <pydep/pydep.hpp>

#include <QCoreApplication>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace mdev::pydep;

int main( int argc, char** argv )
{
	QCoreApplication app( argc, argv );
	QCoreApplication::setApplicationName( "pydep_graph" );
	QCoreApplication::setApplicationVersion( PYDEP_VERSION );

	const auto settings = cli::parse_command_line( app.arguments() );
	if( !settings ) {
		return 1;
	}

	const auto start = std::chrono::steady_clock::now();

	const std::vector<FileInfo> files = scan_python_roots( settings->roots, //
														   settings->init_modules,
														   settings->relative_names,
														   settings->parallel,
														   settings->root_parents );
	const ProjectGraph          graph = build_project_graph( files );

	if( settings->verbose ) {
		cli::print_scan_errors( std::cerr, files );
		cli::print_scan_stats( std::cerr, settings->roots.size(), files, graph, std::chrono::steady_clock::now() - start );
	}

	try {
		cli::print_report( std::cout, graph, run_query( graph, settings->query ) );
	} catch( const std::invalid_argument& e ) {
		std::cerr << "Error: " << e.what() << std::endl;
		return 1;
	}
	return 0;
}
