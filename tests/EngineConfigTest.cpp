#include "TestHelpers.hpp"

#include "wagerfi/Engine/EngineConfig.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <simdjson.h>

using namespace Wagerfi;
using Catch::Approx;
using Test::to_double;

namespace
{

template< class T >
T parse( const std::string & json )
{
    simdjson::ondemand::parser parser;
    simdjson::padded_string buffer( json );
    simdjson::ondemand::document doc = parser.iterate( buffer );
    simdjson::ondemand::value jsonValue( doc );
    return json_to< T >( jsonValue );
}

} // namespace

TEST_CASE( "Engine config parses every section", "[config]" )
{
    const std::string json = R"({
        "tradeExecution": {
            "workerThreads": 2,
            "executor": {
                "predictionFeeRate": "0.02",
                "perpFeeRate": 0.0005,
                "maxLeverage": 20,
                "defaultLeverage": 3,
                "lockTimeoutMs": 100,
                "fundingIntervalHours": 4
            }
        },
        "perpMaintenance": { "sweepIntervalMs": 5000, "resolveExpiredMarkets": false },
        "pools": [ { "id": "pool-a", "ownerId": "npc-a", "availableBalance": "1500.25" } ],
        "predictionMarkets": [
            { "id": "market-a", "question": "Q?", "yesReserve": 400, "noReserve": "600", "endDate": 1700000000 }
        ],
        "perpMarkets": [ { "ticker": "ACME", "lastTradePrice": "99.5" } ],
        "indexPrices": { "ACME": "100.25" },
        "outcomes": { "market-a": false }
    })";

    const auto config = parse< Engine::EngineConfig >( json );

    const auto & executorConfig = config.tradeExecutionConfig.executorConfig;
    CHECK( config.tradeExecutionConfig.workerThreads == 2 );
    CHECK( to_double( executorConfig.predictionFeeRate ) == Approx( 0.02 ) );
    CHECK( to_double( executorConfig.perpFeeRate ) == Approx( 0.0005 ) );
    CHECK( executorConfig.maxLeverage == 20 );
    CHECK( executorConfig.defaultLeverage == 3 );
    CHECK( executorConfig.lockTimeout == std::chrono::milliseconds( 100 ) );
    CHECK( executorConfig.fundingInterval == std::chrono::hours( 4 ) );
    CHECK( to_double( executorConfig.minPredictionAmount ) == Approx( 1 ) );

    CHECK( config.perpMaintenanceConfig.sweepInterval == std::chrono::milliseconds( 5000 ) );
    CHECK_FALSE( config.perpMaintenanceConfig.resolveExpiredMarkets );

    REQUIRE( config.pools.size( ) == 1 );
    CHECK( config.pools.front( ).id == "pool-a" );
    CHECK( config.pools.front( ).availableBalance == Trading::Quantity( "1500.25" ) );
    CHECK( config.pools.front( ).totalDeposits == config.pools.front( ).availableBalance );

    REQUIRE( config.predictionMarkets.size( ) == 1 );
    CHECK( config.predictionMarkets.front( ).yesReserve == 400 );
    CHECK( config.predictionMarkets.front( ).noReserve == 600 );
    CHECK( config.predictionMarkets.front( ).endDate == Test::test_epoch( ) );
    CHECK_FALSE( config.predictionMarkets.front( ).resolved );

    REQUIRE( config.perpMarkets.size( ) == 1 );
    CHECK( to_double( config.perpMarkets.front( ).fundingRate ) == Approx( 0.01 ) );
    CHECK( config.perpMarkets.front( ).maxLeverage == 100 );
    CHECK( config.perpMarkets.front( ).minOrderSize == 10 );

    REQUIRE( config.indexPrices.size( ) == 1 );
    CHECK( config.indexPrices.front( ).first == "ACME" );
    CHECK( config.indexPrices.front( ).second == Trading::Price( "100.25" ) );

    REQUIRE( config.outcomes.size( ) == 1 );
    CHECK( config.outcomes.front( ) == std::make_pair( std::string( "market-a" ), false ) );

    Storage::MemoryStore store;
    Feed::StaticPriceFeed priceFeed;
    Engine::seed_engine( config, store, priceFeed );

    CHECK( priceFeed.get_index_price( "ACME" ) == Trading::Price( "100.25" ) );
    CHECK( priceFeed.get_resolution_outcome( "market-a" ) == false );
    CHECK_FALSE( priceFeed.get_resolution_outcome( "market-b" ).has_value( ) );
    CHECK( store.balance_transactions( "pool-a" ).size( ) == 1 );
    CHECK( store.prediction_markets( ).size( ) == 1 );
}

TEST_CASE( "Decisions parse with defaults", "[config]" )
{
    const auto decision = parse< Execution::TradingDecision >( R"({
        "actorId": "npc-a",
        "poolId": "pool-a",
        "action": "open_short",
        "ticker": "ACME",
        "amount": "50",
        "leverage": 4,
        "confidence": 0.8
    })" );

    CHECK( decision.actorName == "npc-a" );
    CHECK( decision.action == Execution::TradeAction::open_short );
    CHECK( decision.marketType == Execution::MarketType::perpetual );
    CHECK( decision.amount == 50 );
    CHECK( decision.leverage == 4u );
    CHECK_FALSE( decision.priceLimit.has_value( ) );
    CHECK( decision.confidence == Approx( 0.8 ) );

    const auto hold = parse< Execution::TradingDecision >( R"({ "actorId": "npc-b", "poolId": "pool-b", "action": "hold" })" );
    CHECK( hold.action == Execution::TradeAction::hold );
    CHECK( hold.amount == 0 );
}

TEST_CASE( "Invalid config values are rejected", "[config]" )
{
    REQUIRE_THROWS_AS( parse< Execution::TradingDecision >( R"({ "actorId": "a", "poolId": "p", "action": "buy_maybe" })" ), WagerfiError );
    REQUIRE_THROWS_AS( parse< Execution::TradeExecutorConfig >( R"({ "maxLeverage": 10, "defaultLeverage": 20 })" ), WagerfiError );
    REQUIRE_THROWS_AS( parse< Execution::TradeExecutionConfig >( R"({ "workerThreads": 0 })" ), WagerfiError );
    REQUIRE_THROWS_AS( parse< Maintenance::PerpMaintenanceConfig >( R"({ "sweepIntervalMs": 0 })" ), WagerfiError );
}

TEST_CASE( "Leverage settings stay within 1 to 100", "[config]" )
{
    REQUIRE_THROWS_AS( parse< Execution::TradeExecutorConfig >( R"({ "maxLeverage": 150 })" ), WagerfiError );
    REQUIRE_THROWS_AS( parse< Execution::TradeExecutorConfig >( R"({ "maxLeverage": 0 })" ), WagerfiError );
    REQUIRE_THROWS_AS( parse< Storage::PerpMarket >( R"({ "ticker": "ACME", "lastTradePrice": 100, "maxLeverage": 150 })" ), WagerfiError );
    REQUIRE_THROWS_AS( parse< Storage::PerpMarket >( R"({ "ticker": "ACME", "lastTradePrice": 100, "maxLeverage": 0 })" ), WagerfiError );

    CHECK( parse< Execution::TradeExecutorConfig >( R"({ "maxLeverage": 100 })" ).maxLeverage == 100 );
    CHECK( parse< Storage::PerpMarket >( R"({ "ticker": "ACME", "lastTradePrice": 100, "maxLeverage": 20 })" ).maxLeverage == 20 );
}

TEST_CASE( "Integers wider than 32 bits are rejected", "[config]" )
{
    // 2^32 + 3 would wrap to 3.
    REQUIRE_THROWS_AS
    (
        parse< Execution::TradingDecision >( R"({ "actorId": "a", "poolId": "p", "action": "open_long", "ticker": "ACME", "amount": 10, "leverage": 4294967299 })" ),
        WagerfiError
    );
    REQUIRE_THROWS_AS( parse< Execution::TradeExecutionConfig >( R"({ "workerThreads": 4294967296 })" ), WagerfiError );

    const auto decision = parse< Execution::TradingDecision >
    (
        R"({ "actorId": "a", "poolId": "p", "action": "open_long", "ticker": "ACME", "amount": 10, "leverage": 4294967295 })"
    );
    CHECK( decision.leverage.value( ) == 4294967295u );
}
