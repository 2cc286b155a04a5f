#include "wagerfi/Execution/TradeExecutionTypes.hpp"

#include "wagerfi/Risk/PerpRiskEngine.hpp"

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <algorithm>
#include <iterator>

namespace Wagerfi
{
namespace Execution
{

template< class EnumType >
static EnumType parse_enum( std::string_view text )
{
    auto value = magic_enum::enum_cast< EnumType >( text );
    if ( !value )
    {
        throw WagerfiError( fmt::format( "Invalid {}: {}", magic_enum::enum_type_name< EnumType >( ), text ) );
    }
    return *value;
}

TradingDecision tag_invoke( json_to_tag< TradingDecision >, simdjson::ondemand::value jsonValue )
{
    simdjson::ondemand::object jsonObject = jsonValue.get_object( );

    TradingDecision decision;
    decision.actorId = std::string( jsonObject[ "actorId" ].get_string( ).value( ) );
    decision.actorName = json_to_optional< std::string >( jsonObject, "actorName" ).value_or( decision.actorId );
    decision.poolId = std::string( jsonObject[ "poolId" ].get_string( ).value( ) );
    decision.action = parse_enum< TradeAction >( jsonObject[ "action" ].get_string( ).value( ) );

    auto marketType = json_to_optional< std::string >( jsonObject, "marketType" );
    decision.marketType = marketType
        ? parse_enum< MarketType >( *marketType )
        : ( is_perpetual_action( decision.action ) ? MarketType::perpetual : MarketType::prediction );

    decision.marketId = json_to_optional< std::string >( jsonObject, "marketId" ).value_or( "" );
    decision.ticker = json_to_optional< std::string >( jsonObject, "ticker" ).value_or( "" );
    decision.positionId = json_to_optional< std::string >( jsonObject, "positionId" ).value_or( "" );
    decision.amount = json_to_optional< Trading::Quantity >( jsonObject, "amount" ).value_or( fixed_zero( ) );
    decision.leverage = json_to_optional< uint32_t >( jsonObject, "leverage" );
    decision.priceLimit = json_to_optional< Trading::Price >( jsonObject, "priceLimit" );
    decision.confidence = json_to_optional< double >( jsonObject, "confidence" ).value_or( 0.0 );
    decision.reasoning = json_to_optional< std::string >( jsonObject, "reasoning" ).value_or( "" );

    return decision;
}

// +1 when the trade pushes towards yes / long, -1 towards no / short.
static int trade_direction( const ExecutedTrade & trade )
{
    switch ( trade.action )
    {
        case TradeAction::buy_yes:
        case TradeAction::open_long:
            return 1;
        case TradeAction::buy_no:
        case TradeAction::open_short:
            return -1;
        case TradeAction::sell:
        case TradeAction::close_position:
            return trade.outcomeSide == Trading::OutcomeSide::no ? 1 : -1;
        case TradeAction::close_perp:
            return trade.perpSide == Trading::PerpSide::short_side ? 1 : -1;
        case TradeAction::hold:
            return 0;
    }
    return 0;
}

std::vector< TradeImpact > aggregate_trade_impacts( const std::vector< ExecutedTrade > & trades )
{
    std::vector< TradeImpact > impacts;

    for ( const auto & trade : trades )
    {
        if ( trade.action == TradeAction::hold )
        {
            continue;
        }

        auto impact = std::find_if
        (
            impacts.begin( ),
            impacts.end( ),
            [ &trade ]( const auto & candidate ){ return candidate.marketType == trade.marketType && candidate.marketId == trade.marketId; }
        );
        if ( impact == impacts.end( ) )
        {
            impacts.push_back( TradeImpact{ .marketType = trade.marketType, .marketId = trade.marketId, .totalVolume = fixed_zero( ), .netVolume = fixed_zero( ) } );
            impact = std::prev( impacts.end( ) );
        }

        const Trading::Quantity volume = trade.volume( );
        ++impact->tradeCount;
        impact->totalVolume += volume;
        impact->netVolume += trade_direction( trade ) > 0 ? volume : Trading::Quantity( -volume );
    }

    return impacts;
}

TradeExecutorConfig tag_invoke( json_to_tag< TradeExecutorConfig >, simdjson::ondemand::value jsonValue )
{
    simdjson::ondemand::object jsonObject = jsonValue.get_object( );

    TradeExecutorConfig config;
    if ( auto predictionFeeRate = json_to_optional< FixedFloat >( jsonObject, "predictionFeeRate" ) )
    {
        config.predictionFeeRate = *predictionFeeRate;
    }
    if ( auto perpFeeRate = json_to_optional< FixedFloat >( jsonObject, "perpFeeRate" ) )
    {
        config.perpFeeRate = *perpFeeRate;
    }
    config.maxLeverage = json_to_optional< uint32_t >( jsonObject, "maxLeverage" ).value_or( config.maxLeverage );
    config.defaultLeverage = json_to_optional< uint32_t >( jsonObject, "defaultLeverage" ).value_or( config.defaultLeverage );
    if ( auto minPredictionAmount = json_to_optional< Trading::Quantity >( jsonObject, "minPredictionAmount" ) )
    {
        config.minPredictionAmount = *minPredictionAmount;
    }
    config.lockTimeout = json_to_optional< std::chrono::milliseconds >( jsonObject, "lockTimeoutMs" ).value_or( config.lockTimeout );
    if ( auto fundingIntervalHours = json_to_optional< uint64_t >( jsonObject, "fundingIntervalHours" ) )
    {
        config.fundingInterval = std::chrono::hours( *fundingIntervalHours );
    }

    if ( config.maxLeverage == 0 || config.maxLeverage > Risk::max_leverage( ) )
    {
        throw WagerfiError( fmt::format( "maxLeverage must be within [1, {}]", Risk::max_leverage( ) ) );
    }
    if ( config.defaultLeverage == 0 || config.defaultLeverage > config.maxLeverage )
    {
        throw WagerfiError( fmt::format( "defaultLeverage must be within [1, {}]", config.maxLeverage ) );
    }
    if ( config.fundingInterval.count( ) == 0 )
    {
        throw WagerfiError( "fundingIntervalHours must be positive" );
    }

    return config;
}

TradeExecutionConfig tag_invoke( json_to_tag< TradeExecutionConfig >, simdjson::ondemand::value jsonValue )
{
    simdjson::ondemand::object jsonObject = jsonValue.get_object( );

    TradeExecutionConfig config;
    config.workerThreads = json_to_optional< uint32_t >( jsonObject, "workerThreads" ).value_or( config.workerThreads );
    if ( auto executorConfig = json_to_optional< TradeExecutorConfig >( jsonObject, "executor" ) )
    {
        config.executorConfig = std::move( *executorConfig );
    }

    if ( config.workerThreads == 0 )
    {
        throw WagerfiError( "workerThreads must be positive" );
    }

    return config;
}

} // namespace Execution
} // namespace Wagerfi
