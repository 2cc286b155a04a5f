#pragma once

#include "wagerfi/Execution/TradeExecutionTypes.hpp"
#include "wagerfi/Maintenance/PerpMaintenanceTypes.hpp"
#include "wagerfi/Storage/StorageTypes.hpp"

#include "wagerfi/Feed/StaticPriceFeed.hpp"
#include "wagerfi/Storage/MemoryStore.hpp"

#include "wagerfi/Util/JsonUtils.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace Wagerfi
{
namespace Engine
{

struct EngineConfig
{
    friend EngineConfig tag_invoke( json_to_tag< EngineConfig >, simdjson::ondemand::value jsonValue );

    Execution::TradeExecutionConfig tradeExecutionConfig;
    Maintenance::PerpMaintenanceConfig perpMaintenanceConfig;

    std::vector< Storage::Pool > pools;
    std::vector< Storage::PredictionMarket > predictionMarkets;
    std::vector< Storage::PerpMarket > perpMarkets;

    std::vector< std::pair< std::string, Trading::Price > > indexPrices;
    std::vector< std::pair< std::string, bool > > outcomes;
};

EngineConfig load_engine_config( const std::filesystem::path & configPath );

// A JSON array of decisions.
std::vector< Execution::TradingDecision > load_decisions( const std::filesystem::path & decisionsPath );

// Seed rows and feed values from the config.
void seed_engine( const EngineConfig & config, Storage::MemoryStore & store, Feed::StaticPriceFeed & priceFeed );

} // namespace Engine
} // namespace Wagerfi
