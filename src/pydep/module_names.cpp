#include "module_names.hpp"

#include "ModuleInfo.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace mdev::pydep {

namespace {

constexpr std::string_view python_extension = ".py";
constexpr std::string_view package_init     = "__init__";

} // namespace

fs::path normalized_absolute( const fs::path& path )
{
	std::error_code ec;
	fs::path        ret = fs::absolute( path, ec );
	if( ec ) {
		ret = path;
	}
	ret = ret.lexically_normal();
	// "/x/pkgA/" -> "/x/pkgA", otherwise filename() would be empty
	if( !ret.has_filename() && ret.has_relative_path() ) {
		ret = ret.parent_path();
	}
	return ret;
}

std::optional<ModuleName> module_name( const fs::path& root, const fs::path& file, InitModules init_modules )
{
	const fs::path abs_root = normalized_absolute( root );
	const fs::path abs_file = normalized_absolute( file );

	if( abs_file.extension() != python_extension ) {
		return {};
	}

	// component wise, so that /x/pkgAB/m.py is not considered to be inside /x/pkgA
	fs::path relative = abs_file.lexically_relative( abs_root );
	if( relative.empty() || relative == "." || *relative.begin() == ".." ) {
		return {};
	}
	relative.replace_extension();

	ModuleName ret;
	ret.parts.push_back( abs_root.filename().string() );
	for( const auto& component : relative ) {
		ret.parts.push_back( component.string() );
	}
	ret.is_package_init = ret.parts.back() == package_init;

	if( ret.is_package_init && init_modules == InitModules::Collapse ) {
		ret.name = join_dotted( ret.parts.begin(), ret.parts.end() - 1 );
	} else {
		ret.name = join_dotted( ret.parts );
	}
	return ret;
}

String_t resolve_relative_import( const std::vector<String_t>& caller_parts, int level, std::string_view module )
{
	if( level < 0 || static_cast<std::size_t>( level ) > caller_parts.size() ) {
		return invalid_module_name;
	}

	std::vector<String_t> base( caller_parts.begin(), caller_parts.end() - level );
	if( !module.empty() ) {
		merge_into( split_dotted( module ), base );
	}
	return join_dotted( base );
}

} // namespace mdev::pydep
