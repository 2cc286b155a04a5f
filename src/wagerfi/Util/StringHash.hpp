#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace Wagerfi
{

struct StringHash
{
    using hash_type = std::hash< std::string_view >;
    using is_transparent = void;

    size_t operator( )( const char * str ) const        { return hash_type{ }( str ); }
    size_t operator( )( std::string_view str ) const   { return hash_type{ }( str ); }
    size_t operator( )( const std::string & str ) const { return hash_type{ }( str ); }
};

template< class ValueType >
using TransparentStringMap = std::unordered_map< std::string, ValueType, StringHash, std::equal_to< > >;

using TransparentStringSet = std::unordered_set< std::string, StringHash, std::equal_to< > >;

} // namespace Wagerfi
