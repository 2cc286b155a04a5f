#include "wagerfi/Storage/StorageTypes.hpp"

#include "wagerfi/Risk/PerpRiskEngine.hpp"

#include <fmt/format.h>

namespace Wagerfi
{
namespace Storage
{

std::string pool_key( std::string_view poolId ) { return fmt::format( "pool/{}", poolId ); }
std::string prediction_market_key( std::string_view marketId ) { return fmt::format( "prediction_market/{}", marketId ); }
std::string prediction_position_key( std::string_view positionId ) { return fmt::format( "prediction_position/{}", positionId ); }
std::string perp_market_key( std::string_view ticker ) { return fmt::format( "perp_market/{}", ticker ); }
std::string perp_position_key( std::string_view positionId ) { return fmt::format( "perp_position/{}", positionId ); }

Timestamp timestamp_from_seconds( uint64_t secondsSinceEpoch )
{
    return Timestamp( std::chrono::seconds( secondsSinceEpoch ) );
}

PredictionMarket tag_invoke( json_to_tag< PredictionMarket >, simdjson::ondemand::value jsonValue )
{
    simdjson::ondemand::object jsonObject = jsonValue.get_object( );

    PredictionMarket market;
    market.id = std::string( jsonObject[ "id" ].get_string( ).value( ) );
    market.question = json_to_optional< std::string >( jsonObject, "question" ).value_or( "" );
    market.yesReserve = json_to< Trading::Quantity >( jsonObject[ "yesReserve" ].value( ) );
    market.noReserve = json_to< Trading::Quantity >( jsonObject[ "noReserve" ].value( ) );
    market.liquidity = json_to_optional< Trading::Quantity >( jsonObject, "liquidity" ).value_or( fixed_zero( ) );
    market.resolved = json_to_optional< bool >( jsonObject, "resolved" ).value_or( false );
    market.outcome = json_to_optional< bool >( jsonObject, "outcome" );
    market.endDate = timestamp_from_seconds( jsonObject[ "endDate" ].get_uint64( ).value( ) );

    return market;
}

Pool tag_invoke( json_to_tag< Pool >, simdjson::ondemand::value jsonValue )
{
    simdjson::ondemand::object jsonObject = jsonValue.get_object( );

    Pool pool;
    pool.id = std::string( jsonObject[ "id" ].get_string( ).value( ) );
    pool.ownerId = std::string( jsonObject[ "ownerId" ].get_string( ).value( ) );
    pool.availableBalance = json_to< Trading::Quantity >( jsonObject[ "availableBalance" ].value( ) );
    pool.totalDeposits = json_to_optional< Trading::Quantity >( jsonObject, "totalDeposits" ).value_or( pool.availableBalance );
    pool.lifetimePnL = fixed_zero( );
    pool.totalFeesCollected = fixed_zero( );

    return pool;
}

PerpMarket tag_invoke( json_to_tag< PerpMarket >, simdjson::ondemand::value jsonValue )
{
    simdjson::ondemand::object jsonObject = jsonValue.get_object( );

    PerpMarket market;
    market.ticker = std::string( jsonObject[ "ticker" ].get_string( ).value( ) );
    market.fundingRate = json_to_optional< FixedFloat >( jsonObject, "fundingRate" ).value_or( FixedFloat( "0.01" ) );
    market.lastTradePrice = json_to< Trading::Price >( jsonObject[ "lastTradePrice" ].value( ) );
    market.maxLeverage = json_to_optional< uint32_t >( jsonObject, "maxLeverage" ).value_or( 100 );
    market.minOrderSize = json_to_optional< Trading::Quantity >( jsonObject, "minOrderSize" ).value_or( Trading::Quantity( 10 ) );
    market.openInterest = fixed_zero( );

    if ( market.maxLeverage == 0 || market.maxLeverage > Risk::max_leverage( ) )
    {
        throw WagerfiError( fmt::format( "maxLeverage of {} must be within [1, {}]", market.ticker, Risk::max_leverage( ) ) );
    }

    return market;
}

} // namespace Storage
} // namespace Wagerfi
