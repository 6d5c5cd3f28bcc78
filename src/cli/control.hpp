#pragma once

#include <pydep/analysis.hpp>
#include <pydep/imports.hpp>
#include <pydep/module_names.hpp>
#include <pydep/pydep.hpp>

#include <QStringList>

#include <filesystem>
#include <optional>
#include <vector>

namespace mdev::pydep::cli {

struct Settings {
	std::vector<std::filesystem::path> roots;
	Query                              query{Mode::Dep, {}};
	InitModules                        init_modules   = InitModules::Collapse;
	RelativeNames                      relative_names = RelativeNames::Coarse;
	RootParents                        root_parents   = RootParents::No;
	ScanParallel                       parallel       = ScanParallel::Yes;
	bool                               verbose        = false;
};

// --root values, or the entries of PYDEP_ROOT if there are none; non-directories are dropped
std::vector<std::filesystem::path> determine_roots( const QStringList& root_args );

// Usage errors are printed to stderr, in which case nothing is returned.
// --help and --version terminate the application.
std::optional<Settings> parse_command_line( const QStringList& arguments );

} // namespace mdev::pydep::cli
