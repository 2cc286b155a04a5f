#include "wagerfi/Engine/EngineConfig.hpp"

#include "wagerfi/Util/Logger.hpp"

#include <fmt/format.h>

namespace Wagerfi
{
namespace Engine
{

EngineConfig tag_invoke( json_to_tag< EngineConfig >, simdjson::ondemand::value jsonValue )
{
    simdjson::ondemand::object jsonObject = jsonValue.get_object( );

    EngineConfig config;

    if ( auto tradeExecutionConfig = json_to_optional< Execution::TradeExecutionConfig >( jsonObject, "tradeExecution" ) )
    {
        config.tradeExecutionConfig = std::move( *tradeExecutionConfig );
    }
    if ( auto perpMaintenanceConfig = json_to_optional< Maintenance::PerpMaintenanceConfig >( jsonObject, "perpMaintenance" ) )
    {
        config.perpMaintenanceConfig = std::move( *perpMaintenanceConfig );
    }

    for ( simdjson::ondemand::value pool : jsonObject[ "pools" ].get_array( ) )
    {
        config.pools.push_back( json_to< Storage::Pool >( pool ) );
    }

    for ( simdjson::ondemand::value market : jsonObject[ "predictionMarkets" ].get_array( ) )
    {
        config.predictionMarkets.push_back( json_to< Storage::PredictionMarket >( market ) );
    }

    for ( simdjson::ondemand::value market : jsonObject[ "perpMarkets" ].get_array( ) )
    {
        config.perpMarkets.push_back( json_to< Storage::PerpMarket >( market ) );
    }

    simdjson::ondemand::object indexPrices;
    if ( jsonObject.find_field_unordered( "indexPrices" ).get( indexPrices ) == simdjson::SUCCESS )
    {
        for ( simdjson::ondemand::field field : indexPrices )
        {
            std::string ticker( field.unescaped_key( ).value( ) );
            config.indexPrices.emplace_back( std::move( ticker ), json_to< Trading::Price >( field.value( ) ) );
        }
    }

    simdjson::ondemand::object outcomes;
    if ( jsonObject.find_field_unordered( "outcomes" ).get( outcomes ) == simdjson::SUCCESS )
    {
        for ( simdjson::ondemand::field field : outcomes )
        {
            std::string marketId( field.unescaped_key( ).value( ) );
            config.outcomes.emplace_back( std::move( marketId ), field.value( ).get_bool( ).value( ) );
        }
    }

    return config;
}

EngineConfig load_engine_config( const std::filesystem::path & configPath )
{
    simdjson::ondemand::parser parser;
    simdjson::padded_string configBuffer = simdjson::padded_string::load( configPath.native( ) );
    simdjson::ondemand::document doc = parser.iterate( configBuffer );
    simdjson::ondemand::value jsonValue( doc );
    return json_to< EngineConfig >( jsonValue );
}

std::vector< Execution::TradingDecision > load_decisions( const std::filesystem::path & decisionsPath )
{
    simdjson::ondemand::parser parser;
    simdjson::padded_string decisionsBuffer = simdjson::padded_string::load( decisionsPath.native( ) );
    simdjson::ondemand::document doc = parser.iterate( decisionsBuffer );

    std::vector< Execution::TradingDecision > decisions;
    for ( simdjson::ondemand::value decision : doc.get_array( ) )
    {
        decisions.push_back( json_to< Execution::TradingDecision >( decision ) );
    }
    return decisions;
}

void seed_engine( const EngineConfig & config, Storage::MemoryStore & store, Feed::StaticPriceFeed & priceFeed )
{
    for ( const auto & pool : config.pools )
    {
        store.insert_pool( pool );
    }
    for ( const auto & market : config.predictionMarkets )
    {
        store.insert_prediction_market( market );
    }
    for ( const auto & market : config.perpMarkets )
    {
        store.insert_perp_market( market );
    }
    for ( const auto & [ ticker, price ] : config.indexPrices )
    {
        priceFeed.set_index_price( ticker, price );
    }
    for ( const auto & [ marketId, outcome ] : config.outcomes )
    {
        priceFeed.set_resolution_outcome( marketId, outcome );
    }

    WAGERFI_LOG_INFO_GLOBAL( )
        << fmt::format
        (
            "Seeded {} pool(s), {} prediction market(s), {} perp market(s)",
            config.pools.size( ),
            config.predictionMarkets.size( ),
            config.perpMarkets.size( )
        );
}

} // namespace Engine
} // namespace Wagerfi
