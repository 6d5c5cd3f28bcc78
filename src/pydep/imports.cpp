#include "imports.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <utility>

namespace fs = std::filesystem;

namespace mdev::pydep {

namespace {

//################### Encoding #####################################

// returns offset of the first byte that is not part of a valid utf-8 sequence, or npos
std::size_t find_invalid_utf8( std::string_view str )
{
	std::size_t i = 0;
	while( i < str.size() ) {
		const auto c = static_cast<unsigned char>( str[i] );
		if( c < 0x80 ) {
			++i;
			continue;
		}

		std::size_t   trailing  = 0;
		std::uint32_t cp        = 0;
		std::uint32_t min_value = 0;
		if( ( c & 0xE0 ) == 0xC0 ) {
			trailing  = 1;
			cp        = c & 0x1F;
			min_value = 0x80;
		} else if( ( c & 0xF0 ) == 0xE0 ) {
			trailing  = 2;
			cp        = c & 0x0F;
			min_value = 0x800;
		} else if( ( c & 0xF8 ) == 0xF0 ) {
			trailing  = 3;
			cp        = c & 0x07;
			min_value = 0x10000;
		} else {
			return i;
		}

		if( i + trailing >= str.size() ) {
			return i;
		}
		for( std::size_t k = 1; k <= trailing; ++k ) {
			const auto cc = static_cast<unsigned char>( str[i + k] );
			if( ( cc & 0xC0 ) != 0x80 ) {
				return i;
			}
			cp = ( cp << 6 ) | ( cc & 0x3F );
		}
		if( cp < min_value || cp > 0x10FFFF || ( cp >= 0xD800 && cp <= 0xDFFF ) ) {
			return i;
		}
		i += trailing + 1;
	}
	return std::string_view::npos;
}

// "\r\n" and a lone "\r" become "\n", like python's text mode reads source files
std::string universal_newlines( std::string_view str )
{
	std::string ret;
	ret.reserve( str.size() );
	for( std::size_t i = 0; i < str.size(); ++i ) {
		if( str[i] != '\r' ) {
			ret += str[i];
		} else if( i + 1 == str.size() || str[i + 1] != '\n' ) {
			ret += '\n';
		}
	}
	return ret;
}

int line_of_offset( std::string_view str, std::size_t offset )
{
	return 1 + static_cast<int>( std::count( str.begin(), str.begin() + offset, '\n' ) );
}

//################### Lexer #####################################

enum class TokenKind { Name, Dot, Comma, Star, LParen, RParen, Colon, Semicolon, Newline, Other };

struct Token {
	TokenKind        kind;
	std::string_view text;
	int              line;
	int              depth; // bracket nesting the token appears in
};

bool is_digit( char c )
{
	return c >= '0' && c <= '9';
}

bool is_name_start( char c )
{
	// any non-ascii byte is taken to be part of an identifier
	return ( c >= 'a' && c <= 'z' ) || ( c >= 'A' && c <= 'Z' ) || c == '_'
		   || static_cast<unsigned char>( c ) >= 0x80;
}

bool is_name_char( char c )
{
	return is_name_start( c ) || is_digit( c );
}

bool is_quote( char c )
{
	return c == '"' || c == '\'';
}

bool is_string_prefix( std::string_view name )
{
	static constexpr std::array<std::string_view, 8> prefixes{"r", "u", "b", "f", "br", "rb", "fr", "rf"};

	if( name.size() > 2 ) {
		return false;
	}
	std::string lower( name );
	std::transform( lower.begin(), lower.end(), lower.begin(), []( unsigned char c ) {
		return static_cast<char>( std::tolower( c ) );
	} );
	return std::find( prefixes.begin(), prefixes.end(), lower ) != prefixes.end();
}

char closing_bracket( char open )
{
	switch( open ) {
		case '(': return ')';
		case '[': return ']';
		default: return '}';
	}
}

class Lexer {
public:
	explicit Lexer( std::string_view src )
		: _src( src )
	{
	}

	std::vector<Token> tokenize()
	{
		while( _pos < _src.size() ) {
			const char c = _src[_pos];
			if( c == '#' ) {
				skip_comment();
			} else if( c == '\n' ) {
				end_line();
				++_pos;
				++_line;
			} else if( c == ' ' || c == '\t' || c == '\f' ) {
				++_pos;
			} else if( c == '\\' ) {
				line_continuation();
			} else if( is_quote( c ) ) {
				string_literal( _pos );
			} else if( is_name_start( c ) ) {
				name_or_prefixed_string();
			} else if( is_digit( c ) || ( c == '.' && _pos + 1 < _src.size() && is_digit( _src[_pos + 1] ) ) ) {
				number();
			} else {
				punctuation();
			}
		}

		if( !_brackets.empty() ) {
			throw ParseError( _brackets.back().second,
							  std::string( "'" ) + _brackets.back().first + "' was never closed" );
		}
		end_line();
		return std::move( _tokens );
	}

private:
	int depth() const { return static_cast<int>( _brackets.size() ); }

	void push( TokenKind kind, std::size_t start )
	{
		_tokens.push_back( Token{kind, _src.substr( start, _pos - start ), _line, depth()} );
	}

	// newlines inside of brackets don't end a logical line
	void end_line()
	{
		if( depth() == 0 && ( _tokens.empty() || _tokens.back().kind != TokenKind::Newline ) ) {
			_tokens.push_back( Token{TokenKind::Newline, {}, _line, 0} );
		}
	}

	void skip_comment()
	{
		const auto k = _src.find( '\n', _pos );
		_pos         = k == std::string_view::npos ? _src.size() : k;
	}

	void line_continuation()
	{
		if( _src.substr( _pos, 2 ) == "\\\n" ) {
			_pos += 2;
		} else {
			throw ParseError( _line, "unexpected character after line continuation character" );
		}
		++_line;
	}

	// start points to the first character of the literal, which may be a prefix like 'rb'
	void string_literal( std::size_t start )
	{
		const char quote      = _src[_pos];
		const int  start_line = _line;
		const char triple[]   = {quote, quote, quote, '\0'};
		const bool is_triple  = _src.substr( _pos, 3 ) == triple;

		if( is_triple ) {
			_pos += 3;
			for( ;; ) {
				if( _pos >= _src.size() ) {
					throw ParseError( start_line, "unterminated triple-quoted string literal" );
				}
				const char c = _src[_pos];
				if( c == '\\' ) {
					if( _pos + 1 < _src.size() && _src[_pos + 1] == '\n' ) {
						++_line;
					}
					_pos += 2;
					continue;
				}
				if( c == '\n' ) {
					++_line;
				}
				if( _src.substr( _pos, 3 ) == triple ) {
					_pos += 3;
					break;
				}
				++_pos;
			}
		} else {
			++_pos;
			for( ;; ) {
				if( _pos >= _src.size() || _src[_pos] == '\n' ) {
					throw ParseError( start_line, "unterminated string literal" );
				}
				const char c = _src[_pos];
				if( c == '\\' ) {
					if( _pos + 1 < _src.size() && _src[_pos + 1] == '\n' ) {
						++_line;
					}
					_pos += 2;
					continue;
				}
				++_pos;
				if( c == quote ) {
					break;
				}
			}
		}
		_tokens.push_back( Token{TokenKind::Other, _src.substr( start, _pos - start ), start_line, depth()} );
	}

	void name_or_prefixed_string()
	{
		const std::size_t start = _pos;
		while( _pos < _src.size() && is_name_char( _src[_pos] ) ) {
			++_pos;
		}
		if( _pos < _src.size() && is_quote( _src[_pos] ) && is_string_prefix( _src.substr( start, _pos - start ) ) ) {
			string_literal( start );
			return;
		}
		push( TokenKind::Name, start );
	}

	void number()
	{
		const std::size_t start = _pos;
		while( _pos < _src.size() ) {
			const char c = _src[_pos];
			if( is_name_char( c ) || c == '.' ) {
				++_pos;
			} else if( ( c == '+' || c == '-' ) && ( _src[_pos - 1] == 'e' || _src[_pos - 1] == 'E' ) ) {
				++_pos;
			} else {
				break;
			}
		}
		push( TokenKind::Other, start );
	}

	void punctuation()
	{
		const std::size_t start = _pos;
		const char        c     = _src[_pos++];
		switch( c ) {
			case '(':
			case '[':
			case '{':
				push( c == '(' ? TokenKind::LParen : TokenKind::Other, start );
				_brackets.emplace_back( c, _line );
				break;
			case ')':
			case ']':
			case '}':
				if( _brackets.empty() || closing_bracket( _brackets.back().first ) != c ) {
					throw ParseError( _line, std::string( "unmatched '" ) + c + "'" );
				}
				_brackets.pop_back();
				push( c == ')' ? TokenKind::RParen : TokenKind::Other, start );
				break;
			case ',': push( TokenKind::Comma, start ); break;
			case '*': push( TokenKind::Star, start ); break;
			case ';': push( TokenKind::Semicolon, start ); break;
			case '.': push( TokenKind::Dot, start ); break;
			case ':':
				if( _pos < _src.size() && _src[_pos] == '=' ) {
					++_pos;
					push( TokenKind::Other, start );
				} else {
					push( TokenKind::Colon, start );
				}
				break;
			default: push( TokenKind::Other, start ); break;
		}
	}

	std::string_view                  _src;
	std::size_t                       _pos  = 0;
	int                               _line = 1;
	std::vector<std::pair<char, int>> _brackets; // open bracket + line
	std::vector<Token>                _tokens;
};

//################### Import statements #####################################

class ImportParser {
public:
	// tokens has to end with a Newline token
	explicit ImportParser( const std::vector<Token>& tokens )
		: _tokens( tokens )
	{
	}

	std::vector<ImportStatement> parse()
	{
		std::vector<ImportStatement> ret;

		bool statement_start = true;
		while( _pos < _tokens.size() ) {
			const Token& t = _tokens[_pos];
			if( ends_statement( t ) ) {
				statement_start = true;
				++_pos;
				continue;
			}
			if( statement_start && t.kind == TokenKind::Name ) {
				if( t.text == "import" ) {
					ret.push_back( import_statement() );
					statement_start = false;
					continue;
				}
				if( t.text == "from" ) {
					ret.push_back( from_statement() );
					statement_start = false;
					continue;
				}
			}
			statement_start = false;
			++_pos;
		}
		return ret;
	}

private:
	// a ':' outside of brackets ends the header of a compound statement ("try: import x")
	static bool ends_statement( const Token& t )
	{
		return t.kind == TokenKind::Newline
			   || ( t.depth == 0 && ( t.kind == TokenKind::Semicolon || t.kind == TokenKind::Colon ) );
	}

	const Token& current() const { return _pos < _tokens.size() ? _tokens[_pos] : _tokens.back(); }

	bool is_keyword( std::string_view kw ) const
	{
		return current().kind == TokenKind::Name && current().text == kw;
	}

	bool accept( TokenKind kind )
	{
		if( current().kind != kind ) {
			return false;
		}
		++_pos;
		return true;
	}

	[[noreturn]] void fail( const std::string& msg ) const { throw ParseError( current().line, msg ); }

	String_t name( const char* what )
	{
		if( current().kind != TokenKind::Name ) {
			fail( std::string( "expected " ) + what );
		}
		return String_t( _tokens[_pos++].text );
	}

	String_t dotted_name()
	{
		String_t ret = name( "module name" );
		while( accept( TokenKind::Dot ) ) {
			ret += '.';
			ret += name( "name after '.'" );
		}
		return ret;
	}

	void optional_alias()
	{
		if( is_keyword( "as" ) ) {
			++_pos;
			name( "name after 'as'" );
		}
	}

	void expect_end() const
	{
		const Token& t = current();
		if( t.kind == TokenKind::Newline || ( t.kind == TokenKind::Semicolon && t.depth == 0 ) ) {
			return;
		}
		fail( "unexpected '" + String_t( t.text ) + "' in import statement" );
	}

	ImportStatement import_statement()
	{
		ImportStatement st;
		st.line = current().line;
		++_pos;
		do {
			st.names.push_back( dotted_name() );
			optional_alias();
		} while( accept( TokenKind::Comma ) );
		expect_end();
		return st;
	}

	void import_as_names( std::vector<String_t>& names, bool parenthesized )
	{
		for( ;; ) {
			names.push_back( name( "name to import" ) );
			optional_alias();
			if( !accept( TokenKind::Comma ) ) {
				break;
			}
			// trailing comma is only allowed inside of parentheses
			if( parenthesized && current().kind == TokenKind::RParen ) {
				break;
			}
		}
	}

	ImportStatement from_statement()
	{
		ImportStatement st;
		st.line    = current().line;
		st.is_from = true;
		++_pos;

		while( accept( TokenKind::Dot ) ) {
			++st.level;
		}
		if( current().kind == TokenKind::Name && !is_keyword( "import" ) ) {
			st.module = dotted_name();
		}
		if( st.level == 0 && st.module.empty() ) {
			fail( "expected module name after 'from'" );
		}
		if( !is_keyword( "import" ) ) {
			fail( "expected 'import'" );
		}
		++_pos;

		if( accept( TokenKind::Star ) ) {
			st.names.push_back( "*" );
		} else if( accept( TokenKind::LParen ) ) {
			import_as_names( st.names, true );
			if( !accept( TokenKind::RParen ) ) {
				fail( "expected ')'" );
			}
		} else {
			import_as_names( st.names, false );
		}
		expect_end();
		return st;
	}

	const std::vector<Token>& _tokens;
	std::size_t               _pos = 0;
};

String_t qualify( const String_t& package, const String_t& name )
{
	return package.empty() ? name : package + "." + name;
}

// <base>/<package parts>/<name>.py or <base>/<package parts>/<name>/__init__.py
bool has_submodule_file( const FileExists&            exists,
						 fs::path                     dir,
						 const std::vector<String_t>& package_parts,
						 std::string_view             name )
{
	for( const auto& p : package_parts ) {
		dir /= p;
	}
	const String_t n( name );
	return exists( dir / ( n + ".py" ) ) || exists( dir / n / "__init__.py" );
}

// names resolved from relative imports start with the name of the root, so they live next to it
bool is_relative_submodule( const ImportContext& ctx, std::string_view package, std::string_view name )
{
	if( !ctx.exists || name == "*" || ctx.root.empty() ) {
		return false;
	}
	return has_submodule_file( ctx.exists, ctx.root.parent_path(), split_dotted( package ), name );
}

} // namespace

std::vector<ImportStatement> parse_import_statements( std::string_view source )
{
	const auto bad = find_invalid_utf8( source );
	if( bad != std::string_view::npos ) {
		throw ParseError( line_of_offset( source, bad ), "invalid utf-8 encoding" );
	}
	if( source.substr( 0, 3 ) == "\xEF\xBB\xBF" ) {
		source.remove_prefix( 3 );
	}

	const std::string text   = universal_newlines( source );
	const auto        tokens = Lexer( text ).tokenize();
	return ImportParser( tokens ).parse();
}

//################### Import targets #####################################

bool is_submodule( const ImportContext& ctx, std::string_view package, std::string_view name )
{
	if( !ctx.exists || name == "*" ) {
		return false;
	}

	const auto package_parts = split_dotted( package );
	if( !ctx.root.empty() && has_submodule_file( ctx.exists, ctx.root, package_parts, name ) ) {
		return true;
	}
	if( ctx.root_parents == RootParents::No ) {
		return false;
	}
	return std::any_of( ctx.namespace_bases.begin(), ctx.namespace_bases.end(), [&]( const fs::path& base ) {
		return has_submodule_file( ctx.exists, base, package_parts, name );
	} );
}

std::vector<ImportEdge>
resolve_imports( const ModuleName& caller, const std::vector<ImportStatement>& statements, const ImportContext& ctx )
{
	std::vector<ImportEdge> edges;

	const auto add = [&]( String_t target ) { edges.push_back( ImportEdge{caller.name, std::move( target )} ); };

	// from <package> import a, b
	const auto add_names = [&]( const String_t& package, const std::vector<String_t>& names, bool relative ) {
		for( const auto& n : names ) {
			const bool submodule
				= relative ? is_relative_submodule( ctx, package, n ) : is_submodule( ctx, package, n );
			add( submodule ? qualify( package, n ) : package );
		}
	};

	for( const auto& st : statements ) {
		if( !st.is_from ) {
			for( const auto& n : st.names ) {
				add( n );
			}
		} else if( st.level == 0 ) {
			add_names( st.module, st.names, false );
		} else {
			const String_t base = resolve_relative_import( caller.parts, st.level, st.module );
			if( base == invalid_module_name || ctx.relative_names == RelativeNames::Coarse ) {
				add( base );
			} else {
				add_names( base, st.names, true );
			}
		}
	}
	return edges;
}

std::vector<ImportEdge> analyze_imports( const ModuleName&        caller,
										 std::string_view         source,
										 const ImportContext&     ctx,
										 std::optional<String_t>* error )
{
	try {
		return resolve_imports( caller, parse_import_statements( source ), ctx );
	} catch( const ParseError& e ) {
		if( error ) {
			*error = e.what();
		}
		return {};
	}
}

} // namespace mdev::pydep
