#pragma once

#include "wagerfi/Util/Fixed.hpp"
#include "wagerfi/Util/Utils.hpp"

#include <fmt/format.h>

#include <simdjson.h>

#include <chrono>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace Wagerfi
{

// Customization point for deserializing config and decision documents.
// See: boost::json::value_to
template< class T >
struct json_to_tag
{ };

template< class T >
T json_to( simdjson::ondemand::value value )
{
    static_assert( !std::is_reference_v< T > );

    return tag_invoke( json_to_tag< typename std::remove_cv_t< T > >( ), std::move( value ) );
}

// Decimals are read from the raw token so no precision is lost to double.
// Quoted decimals ( "12.5" ) are accepted as well.
inline FixedFloat tag_invoke( Wagerfi::json_to_tag< FixedFloat >, simdjson::ondemand::value jsonValue )
{
    std::string_view token = jsonValue.raw_json_token( );
    if ( !token.empty( ) && token.front( ) == '"' )
    {
        token.remove_prefix( 1 );
    }

    size_t tokenSize = 0;
    for ( auto character : token )
    {
        switch ( character )
        {
            case '0':
            case '1':
            case '2':
            case '3':
            case '4':
            case '5':
            case '6':
            case '7':
            case '8':
            case '9':
            case '.':
            case '-':
            case '+':
            case 'e':
            case 'E':
                ++tokenSize;
                continue;
            default:
                break;
        }
        break;
    }
    return FixedFloat( std::string( token.substr( 0, tokenSize ) ) );
}

// Optional field lookup, returns std::nullopt when the key is absent or null.
template< class T >
std::optional< T > json_to_optional( simdjson::ondemand::object & jsonObject, std::string_view key )
{
    simdjson::ondemand::value fieldValue;
    if ( jsonObject.find_field_unordered( key ).get( fieldValue ) != simdjson::SUCCESS )
    {
        return std::nullopt;
    }
    if ( fieldValue.is_null( ) )
    {
        return std::nullopt;
    }
    return json_to< T >( fieldValue );
}

inline std::string tag_invoke( Wagerfi::json_to_tag< std::string >, simdjson::ondemand::value jsonValue )
{
    return std::string( jsonValue.get_string( ).value( ) );
}

inline uint64_t tag_invoke( Wagerfi::json_to_tag< uint64_t >, simdjson::ondemand::value jsonValue )
{
    return jsonValue.get_uint64( ).value( );
}

inline uint32_t tag_invoke( Wagerfi::json_to_tag< uint32_t >, simdjson::ondemand::value jsonValue )
{
    const uint64_t value = jsonValue.get_uint64( ).value( );
    if ( value > std::numeric_limits< uint32_t >::max( ) )
    {
        throw WagerfiError( fmt::format( "Value {} does not fit in 32 bits", value ) );
    }
    return static_cast< uint32_t >( value );
}

inline bool tag_invoke( Wagerfi::json_to_tag< bool >, simdjson::ondemand::value jsonValue )
{
    return jsonValue.get_bool( ).value( );
}

inline double tag_invoke( Wagerfi::json_to_tag< double >, simdjson::ondemand::value jsonValue )
{
    return jsonValue.get_double( ).value( );
}

inline std::chrono::milliseconds tag_invoke( Wagerfi::json_to_tag< std::chrono::milliseconds >, simdjson::ondemand::value jsonValue )
{
    return std::chrono::milliseconds( jsonValue.get_uint64( ).value( ) );
}

} // namespace Wagerfi
