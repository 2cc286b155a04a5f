#include "wagerfi/Feed/StaticPriceFeed.hpp"

namespace Wagerfi
{
namespace Feed
{

std::optional< Trading::Price > StaticPriceFeed::get_index_price( std::string_view ticker ) const
{
    std::shared_lock lock( _mutex );

    const auto & findPrice = _indexPrices.find( ticker );
    if ( findPrice == _indexPrices.end( ) )
    {
        return std::nullopt;
    }
    return findPrice->second;
}

std::optional< bool > StaticPriceFeed::get_resolution_outcome( std::string_view marketId ) const
{
    std::shared_lock lock( _mutex );

    const auto & findOutcome = _outcomes.find( marketId );
    if ( findOutcome == _outcomes.end( ) )
    {
        return std::nullopt;
    }
    return findOutcome->second;
}

void StaticPriceFeed::set_index_price( std::string_view ticker, Trading::Price price )
{
    std::unique_lock lock( _mutex );
    _indexPrices.insert_or_assign( std::string( ticker ), std::move( price ) );
}

void StaticPriceFeed::set_resolution_outcome( std::string_view marketId, bool outcome )
{
    std::unique_lock lock( _mutex );
    _outcomes.insert_or_assign( std::string( marketId ), outcome );
}

} // namespace Feed
} // namespace Wagerfi
