#pragma once

#include "wagerfi/Execution/TradeExecutor.hpp"
#include "wagerfi/Feed/StaticPriceFeed.hpp"
#include "wagerfi/Storage/MemoryStore.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace Wagerfi
{
namespace Test
{

inline double to_double( const FixedFloat & value ) { return value.convert_to< double >( ); }

// Fixed point in time so funding and expiry are deterministic.
inline Storage::Timestamp test_epoch( ) { return Storage::timestamp_from_seconds( 1700000000 ); }

// Clock the tests can move forward.
class ManualClock
{
public:
    Storage::Timestamp now( ) const
    {
        std::scoped_lock lock( _mutex );
        return _now;
    }

    void advance( Storage::Timestamp::duration duration )
    {
        std::scoped_lock lock( _mutex );
        _now += duration;
    }

private:
    mutable std::mutex _mutex;
    Storage::Timestamp _now = test_epoch( );
};

inline Storage::Pool make_pool( const std::string & poolId, const Trading::Quantity & balance )
{
    Storage::Pool pool;
    pool.id = poolId;
    pool.ownerId = "owner-" + poolId;
    pool.availableBalance = balance;
    pool.totalDeposits = balance;
    pool.lifetimePnL = fixed_zero( );
    pool.totalFeesCollected = fixed_zero( );
    return pool;
}

inline Storage::PredictionMarket make_prediction_market
(
    const std::string & marketId,
    const Trading::Quantity & yesReserve,
    const Trading::Quantity & noReserve
)
{
    Storage::PredictionMarket market;
    market.id = marketId;
    market.question = "Will " + marketId + " happen?";
    market.yesReserve = yesReserve;
    market.noReserve = noReserve;
    market.liquidity = fixed_zero( );
    market.endDate = test_epoch( ) + std::chrono::hours( 24 * 30 );
    return market;
}

inline Storage::PerpMarket make_perp_market( const std::string & ticker, const Trading::Price & price )
{
    Storage::PerpMarket market;
    market.ticker = ticker;
    market.fundingRate = FixedFloat( "0.01" );
    market.lastTradePrice = price;
    market.maxLeverage = 100;
    market.minOrderSize = Trading::Quantity( 10 );
    market.openInterest = fixed_zero( );
    return market;
}

inline Execution::TradingDecision make_decision
(
    const std::string & poolId,
    Execution::TradeAction action,
    const Trading::Quantity & amount
)
{
    Execution::TradingDecision decision;
    decision.actorId = "actor-" + poolId;
    decision.actorName = "Actor " + poolId;
    decision.poolId = poolId;
    decision.action = action;
    decision.marketType = Execution::is_perpetual_action( action ) ? Execution::MarketType::perpetual : Execution::MarketType::prediction;
    decision.amount = amount;
    return decision;
}

// Store, feed and an initialized executor with one pool, one prediction market and one perp market.
struct ExecutorFixture
{
    explicit ExecutorFixture( std::unique_ptr< Storage::MemoryStore > memoryStore = std::make_unique< Storage::MemoryStore >( ) )
        : store( std::move( memoryStore ) )
    {
        store->insert_pool( make_pool( "pool-1", Trading::Quantity( 5000 ) ) );
        store->insert_prediction_market( make_prediction_market( "market-1", Trading::Quantity( 500 ), Trading::Quantity( 500 ) ) );
        store->insert_perp_market( make_perp_market( "ACME", Trading::Price( 100 ) ) );
        priceFeed.set_index_price( "ACME", Trading::Price( 100 ) );

        config.lockTimeout = std::chrono::milliseconds( 50 );

        executor = std::make_unique< Execution::TradeExecutor >( *store, priceFeed, config, [ this ]( ){ return clock.now( ); } );
        executor->initialize( );
    }

    Storage::Pool pool( const std::string & poolId = "pool-1" )
    {
        return *store->begin( { }, std::chrono::milliseconds( 0 ) )->get_pool( poolId );
    }

    Storage::PredictionMarket prediction_market( const std::string & marketId = "market-1" )
    {
        return *store->begin( { }, std::chrono::milliseconds( 0 ) )->get_prediction_market( marketId );
    }

    Storage::PredictionPosition prediction_position( const std::string & positionId )
    {
        return *store->begin( { }, std::chrono::milliseconds( 0 ) )->get_prediction_position( positionId );
    }

    Storage::PerpPosition perp_position( const std::string & positionId )
    {
        return *store->begin( { }, std::chrono::milliseconds( 0 ) )->get_perp_position( positionId );
    }

    Storage::PerpMarket perp_market( const std::string & ticker = "ACME" )
    {
        return *store->begin( { }, std::chrono::milliseconds( 0 ) )->get_perp_market( ticker );
    }

    std::unique_ptr< Storage::MemoryStore > store;
    Feed::StaticPriceFeed priceFeed;
    ManualClock clock;
    Execution::TradeExecutorConfig config;
    std::unique_ptr< Execution::TradeExecutor > executor;
};

} // namespace Test
} // namespace Wagerfi
