#pragma once

#include "ModuleInfo.hpp"
#include "module_names.hpp"
#include "utils.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mdev::pydep {

// Whether "from . import name" checks each name for a submodule (Resolve) or
// just depends on the package the dots resolve to (Coarse)
enum class RelativeNames { Coarse, Resolve };

// Whether "from X import name" also looks for X next to every root (Yes), where the first
// segment of all module names lives, or only below the root of the importing file (No)
enum class RootParents { No, Yes };

struct ImportStatement {
	int                   line    = 0;
	bool                  is_from = false;
	int                   level   = 0;
	String_t              module; // "from" only, empty for "from . import x"
	std::vector<String_t> names;  // dotted names of "import", imported names of "from" ("*" included)
};

class ParseError : public std::runtime_error {
public:
	ParseError( int line, const std::string& msg )
		: std::runtime_error( "line " + std::to_string( line ) + ": " + msg )
		, _line( line )
	{
	}

	int line() const noexcept { return _line; }

private:
	int _line;
};

/**
 * Finds all import statements in python source code.
 * Only the lexical structure (strings, comments, brackets, continuation lines) is
 * tracked, everything that is not an import statement is skipped.
 *
 * throws ParseError on malformed input (unterminated strings, unbalanced brackets,
 * broken import statements, invalid utf-8)
 */
std::vector<ImportStatement> parse_import_statements( std::string_view source );

using FileExists = std::function<bool( const std::filesystem::path& )>;

struct ImportContext {
	std::filesystem::path              root;            // root the importing file was found under
	std::vector<std::filesystem::path> namespace_bases; // parent directories of all roots
	FileExists                         exists;
	RelativeNames                      relative_names = RelativeNames::Coarse;
	RootParents                        root_parents   = RootParents::No;
};

// true if <root>/<package>/<name>.py or <root>/<package>/<name>/__init__.py exists,
// with RootParents::Yes every namespace base is tried as well
bool is_submodule( const ImportContext& ctx, std::string_view package, std::string_view name );

std::vector<ImportEdge> resolve_imports( const ModuleName&                   caller,
										 const std::vector<ImportStatement>& statements,
										 const ImportContext&                ctx );

// Returns no edges if source can't be parsed, the reason is stored in error (if given)
std::vector<ImportEdge> analyze_imports( const ModuleName&        caller,
										 std::string_view         source,
										 const ImportContext&     ctx,
										 std::optional<String_t>* error = nullptr );

} // namespace mdev::pydep
