#pragma once

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace mdev::pydep {

using String_t = std::string;

template<class T>
void merge_into( std::vector<T>&& src, std::vector<T>& dest )
{
	dest.insert( dest.end(), std::make_move_iterator( src.begin() ), std::make_move_iterator( src.end() ) );
	src.clear();
}

// "a.b.c" -> {"a","b","c"}; empty input gives an empty list
inline std::vector<String_t> split_dotted( std::string_view name )
{
	std::vector<String_t> parts;
	if( name.empty() ) {
		return parts;
	}
	for( ;; ) {
		const auto k = name.find( '.' );
		parts.emplace_back( name.substr( 0, k ) );
		if( k == std::string_view::npos ) {
			break;
		}
		name.remove_prefix( k + 1 );
	}
	return parts;
}

template<class It>
String_t join_dotted( It first, It last )
{
	String_t ret;
	for( auto it = first; it != last; ++it ) {
		if( it != first ) {
			ret += '.';
		}
		ret += *it;
	}
	return ret;
}

inline String_t join_dotted( const std::vector<String_t>& parts )
{
	return join_dotted( parts.begin(), parts.end() );
}

// true if name == prefix or name starts with prefix + "."
inline bool has_dotted_prefix( std::string_view name, std::string_view prefix )
{
	if( name.substr( 0, prefix.size() ) != prefix ) {
		return false;
	}
	return name.size() == prefix.size() || name[prefix.size()] == '.';
}

} // namespace mdev::pydep
