#include "control.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QProcessEnvironment>
#include <QString>

#include <iostream>
#include <system_error>

namespace mdev::pydep::cli {

std::ostream& operator<<( std::ostream& stream, const QString& str )
{
	stream << str.toStdString();
	return stream;
}

std::vector<std::filesystem::path> determine_roots( const QStringList& root_args )
{
	QStringList candidates = root_args;

	if( candidates.isEmpty() ) {
		QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
		candidates = env.value( "PYDEP_ROOT", "" ).split( QDir::listSeparator(), Qt::SkipEmptyParts );
	}

	std::vector<std::filesystem::path> roots;
	for( const auto& c : candidates ) {
		std::filesystem::path root = c.toStdString();

		std::error_code ec;
		if( !std::filesystem::is_directory( root, ec ) ) {
			std::cerr << "Root is not a directory, skipping: " << root.string() << "\n";
			continue;
		}
		roots.push_back( std::move( root ) );
	}
	return roots;
}

std::optional<Settings> parse_command_line( const QStringList& arguments )
{
	QCommandLineParser parser;
	parser.setApplicationDescription( "Collect Python module import relationships" );
	parser.addHelpOption();
	parser.addVersionOption();

	const QCommandLineOption root_option(
		"root", "Root directory (can be used multiple times). Defaults to the entries of PYDEP_ROOT.", "dir" );
	const QCommandLineOption mode_option(
		"mode",
		"* dep: find files which depend on files in root\n"
		"* nodeps: find py files which don't depend on any file in root\n"
		"* nodeps_verbose: same as nodeps but prints table of external deps\n"
		"* pkg_dep: find files which recursively depend on package\n"
		"* not_pkg_dep: find files which don't depend (even recursively) on package\n"
		"* outside_local_dir: find files that import modules outside their own directory and subdirs\n"
		"* encapsulated_dir: list directories where all Python files depend only on their own dir/subdirs",
		"mode" );
	const QCommandLineOption keep_init_option( "keep-init-suffix",
											   "Name package initializers 'pkg.__init__' instead of 'pkg'." );
	const QCommandLineOption relative_option( "resolve-relative-names",
											  "Check whether names imported via relative imports are submodules." );
	const QCommandLineOption root_parents_option(
		"search-root-parents",
		"Also look for the module of 'from X import name' next to the roots, not only below them." );
	const QCommandLineOption sequential_option( "sequential", "Scan files on a single thread." );
	const QCommandLineOption verbose_option( "verbose", "Report unparsable files and scan statistics on stderr." );

	parser.addOptions( {root_option,
						mode_option,
						keep_init_option,
						relative_option,
						root_parents_option,
						sequential_option,
						verbose_option} );
	parser.addPositionalArgument( "package", "Package name for 'pkg_dep' and 'not_pkg_dep' mode.", "[package]" );

	parser.process( arguments );

	if( !parser.isSet( mode_option ) ) {
		std::cerr << "Error: --mode is required.\n";
		return {};
	}
	const auto mode = parse_mode( parser.value( mode_option ).toStdString() );
	if( !mode ) {
		std::cerr << "Error: unknown mode '" << parser.value( mode_option ) << "'.\n";
		return {};
	}

	Settings settings;
	settings.query.mode = *mode;

	const QStringList positional = parser.positionalArguments();
	if( !positional.isEmpty() ) {
		settings.query.package = positional.first().toStdString();
	}
	if( requires_package( *mode ) && !settings.query.package ) {
		std::cerr << "Error: --mode " << to_string( *mode ) << " requires a package name.\n";
		return {};
	}

	settings.roots = determine_roots( parser.values( root_option ) );
	if( settings.roots.empty() ) {
		std::cerr << "Error: at least one root directory is required (--root or PYDEP_ROOT).\n";
		return {};
	}

	if( parser.isSet( keep_init_option ) ) {
		settings.init_modules = InitModules::Keep;
	}
	if( parser.isSet( relative_option ) ) {
		settings.relative_names = RelativeNames::Resolve;
	}
	if( parser.isSet( root_parents_option ) ) {
		settings.root_parents = RootParents::Yes;
	}
	if( parser.isSet( sequential_option ) ) {
		settings.parallel = ScanParallel::No;
	}
	settings.verbose = parser.isSet( verbose_option );

	return settings;
}

} // namespace mdev::pydep::cli
