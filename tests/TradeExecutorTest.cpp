#include "TestHelpers.hpp"

#include "wagerfi/Accounting/Ledger.hpp"
#include "wagerfi/Trading/TradeError.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <fmt/format.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace Wagerfi;
using Catch::Approx;
using Execution::TradeAction;
using Test::to_double;

namespace
{

// Fails the next commit once armed.
class FailingCommitStore : public Storage::MemoryStore
{
public:
    void arm( ) { _armed = true; }

protected:
    void before_commit( const Storage::MemoryStoreWrites & writes ) override
    {
        if ( _armed.exchange( false ) )
        {
            throw Trading::StorageError( fmt::format( "Injected failure with {} staged pool write(s)", writes.pools.size( ) ) );
        }
    }

private:
    std::atomic< bool > _armed = false;
};

Execution::TradingDecision buy_decision( const std::string & poolId, TradeAction action, const Trading::Quantity & amount )
{
    auto decision = Test::make_decision( poolId, action, amount );
    decision.marketId = "market-1";
    return decision;
}

Execution::TradingDecision sell_decision( const std::string & poolId, const std::string & positionId, TradeAction action, const Trading::Quantity & shares )
{
    auto decision = Test::make_decision( poolId, action, shares );
    decision.marketId = "market-1";
    decision.positionId = positionId;
    return decision;
}

} // namespace

TEST_CASE( "Buy yes debits the pool and moves the market", "[executor]" )
{
    Test::ExecutorFixture fixture;

    const auto trade = fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 250 ) ) );

    CHECK( trade.marketType == Execution::MarketType::prediction );
    CHECK( trade.outcomeSide == Trading::OutcomeSide::yes );
    CHECK( to_double( trade.amountDebited ) == Approx( 250 ) );
    CHECK( to_double( trade.fee ) == Approx( 2.5 ) );
    CHECK( to_double( trade.quantity ) == Approx( 500.0 - 250000.0 / 747.5 ) );

    const auto pool = fixture.pool( );
    CHECK( to_double( pool.availableBalance ) == Approx( 4750 ) );
    CHECK( to_double( pool.totalFeesCollected ) == Approx( 2.5 ) );

    const auto market = fixture.prediction_market( );
    CHECK( to_double( market.noReserve ) == Approx( 747.5 ) );
    CHECK( to_double( FixedFloat( market.yesReserve * market.noReserve ) ) == Approx( 250000 ).margin( 1e-3 ) );
    CHECK( to_double( market.liquidity ) == Approx( 247.5 ) );

    const auto position = fixture.prediction_position( trade.positionId );
    CHECK( position.is_open( ) );
    CHECK( position.poolId == "pool-1" );
    CHECK( position.shares == trade.quantity );
    CHECK( to_double( position.costBasis ) == Approx( 247.5 ) );

    const auto history = Accounting::Ledger( *fixture.store ).history( "pool-1" );
    REQUIRE( history.size( ) == 2 );
    CHECK( history.back( ).type == Storage::BalanceTransactionType::prediction_buy );
    CHECK( to_double( history.back( ).amount ) == Approx( -250 ) );

    const auto records = fixture.store->trade_records( );
    REQUIRE( records.size( ) == 1 );
    CHECK( records.front( ).action == "buy_yes" );
    CHECK( records.front( ).side == "yes" );
}

TEST_CASE( "Repeated buys add to one position", "[executor]" )
{
    Test::ExecutorFixture fixture;

    const auto first = fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_no, Trading::Quantity( 50 ) ) );
    const auto second = fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_no, Trading::Quantity( 50 ) ) );

    CHECK( first.positionId == second.positionId );

    const auto position = fixture.prediction_position( first.positionId );
    CHECK( to_double( position.shares ) == Approx( to_double( first.quantity ) + to_double( second.quantity ) ) );
    CHECK( to_double( position.costBasis ) == Approx( 99 ) );
}

TEST_CASE( "Buy then sell everything costs both fees", "[executor]" )
{
    Test::ExecutorFixture fixture;

    const auto buy = fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 250 ) ) );
    const auto sell = fixture.executor->execute_single_decision( sell_decision( "pool-1", buy.positionId, TradeAction::close_position, Trading::Quantity( 0 ) ) );

    CHECK( sell.quantity == buy.quantity );
    CHECK( to_double( sell.fee ) == Approx( 247.5 * 0.01 ).margin( 1e-6 ) );

    const auto pool = fixture.pool( );
    CHECK( to_double( pool.availableBalance ) == Approx( 5000 - to_double( buy.fee ) - to_double( sell.fee ) ).margin( 1e-6 ) );
    CHECK( to_double( pool.lifetimePnL ) == Approx( -to_double( sell.fee ) ).margin( 1e-6 ) );
    CHECK( to_double( sell.realizedPnL ) == Approx( -to_double( sell.fee ) ).margin( 1e-6 ) );

    const auto position = fixture.prediction_position( buy.positionId );
    CHECK_FALSE( position.is_open( ) );
    CHECK( position.shares == 0 );

    const auto market = fixture.prediction_market( );
    CHECK( to_double( market.yesReserve ) == Approx( 500 ).margin( 1e-6 ) );
    CHECK( to_double( market.noReserve ) == Approx( 500 ).margin( 1e-6 ) );

    SECTION( "Selling a closed position is rejected" )
    {
        REQUIRE_THROWS_AS
        (
            fixture.executor->execute_single_decision( sell_decision( "pool-1", buy.positionId, TradeAction::sell, Trading::Quantity( 1 ) ) ),
            Trading::ValidationError
        );
    }

    SECTION( "A new buy opens a new position" )
    {
        const auto rebuy = fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 10 ) ) );
        CHECK( rebuy.positionId != buy.positionId );
    }
}

TEST_CASE( "Partial sell releases cost basis pro rata", "[executor]" )
{
    Test::ExecutorFixture fixture;

    const auto buy = fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 100 ) ) );
    const Trading::Quantity half = buy.quantity / 2;

    const auto sell = fixture.executor->execute_single_decision( sell_decision( "pool-1", buy.positionId, TradeAction::sell, half ) );

    const auto position = fixture.prediction_position( buy.positionId );
    CHECK( position.is_open( ) );
    CHECK( to_double( position.shares ) == Approx( to_double( half ) ) );
    CHECK( to_double( position.costBasis ) == Approx( 49.5 ) );
    CHECK( to_double( sell.realizedPnL ) == Approx( to_double( sell.amountCredited ) - 49.5 ) );

    SECTION( "Overselling is rejected" )
    {
        REQUIRE_THROWS_AS
        (
            fixture.executor->execute_single_decision( sell_decision( "pool-1", buy.positionId, TradeAction::sell, buy.quantity ) ),
            Trading::ValidationError
        );
    }

    SECTION( "Another pool cannot sell it" )
    {
        fixture.store->insert_pool( Test::make_pool( "pool-2", Trading::Quantity( 100 ) ) );
        REQUIRE_THROWS_AS
        (
            fixture.executor->execute_single_decision( sell_decision( "pool-2", buy.positionId, TradeAction::sell, half ) ),
            Trading::PositionNotFoundError
        );
    }
}

TEST_CASE( "Rejected buys leave no trace", "[executor]" )
{
    Test::ExecutorFixture fixture;

    SECTION( "Insufficient funds" )
    {
        REQUIRE_THROWS_AS
        (
            fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( "5000.01" ) ) ),
            Trading::InsufficientFundsError
        );
    }

    SECTION( "Slippage" )
    {
        auto decision = buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 250 ) );
        decision.priceLimit = Trading::Price( "0.6" );
        REQUIRE_THROWS_AS( fixture.executor->execute_single_decision( decision ), Trading::SlippageExceededError );
    }

    SECTION( "Below minimum amount" )
    {
        REQUIRE_THROWS_AS
        (
            fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( "0.5" ) ) ),
            Trading::ValidationError
        );
    }

    SECTION( "Unknown pool" )
    {
        REQUIRE_THROWS_AS
        (
            fixture.executor->execute_single_decision( buy_decision( "pool-missing", TradeAction::buy_yes, Trading::Quantity( 10 ) ) ),
            Trading::ValidationError
        );
    }

    SECTION( "Unknown market" )
    {
        auto decision = buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 10 ) );
        decision.marketId = "market-missing";
        REQUIRE_THROWS_AS( fixture.executor->execute_single_decision( decision ), Trading::ValidationError );
    }

    SECTION( "Expired market" )
    {
        fixture.clock.advance( std::chrono::hours( 24 * 31 ) );
        REQUIRE_THROWS_AS
        (
            fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 10 ) ) ),
            Trading::MarketClosedError
        );
    }

    SECTION( "Storage failure on commit" )
    {
        auto failingStore = std::make_unique< FailingCommitStore >( );
        auto * store = failingStore.get( );
        Test::ExecutorFixture failingFixture( std::move( failingStore ) );

        store->arm( );
        REQUIRE_THROWS_AS
        (
            failingFixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 250 ) ) ),
            Trading::StorageError
        );

        CHECK( to_double( failingFixture.pool( ).availableBalance ) == Approx( 5000 ) );
        CHECK( failingFixture.prediction_market( ).noReserve == 500 );
        CHECK( failingFixture.store->trade_records( ).empty( ) );
        CHECK( failingFixture.store->balance_transactions( "pool-1" ).size( ) == 1 );

        // The next commit goes through.
        REQUIRE_NOTHROW( failingFixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 250 ) ) ) );
        CHECK( to_double( failingFixture.pool( ).availableBalance ) == Approx( 4750 ) );
    }

    CHECK( to_double( fixture.pool( ).availableBalance ) == Approx( 5000 ) );
    CHECK( fixture.pool( ).totalFeesCollected == 0 );
    CHECK( fixture.prediction_market( ).yesReserve == 500 );
    CHECK( fixture.prediction_market( ).noReserve == 500 );
    CHECK( fixture.store->trade_records( ).empty( ) );
    CHECK( fixture.store->balance_transactions( "pool-1" ).size( ) == 1 );
}

TEST_CASE( "Held locks surface as retryable contention", "[executor]" )
{
    Test::ExecutorFixture fixture;

    auto holder = fixture.store->begin( { Storage::prediction_market_key( "market-1" ) }, std::chrono::milliseconds( 50 ) );

    std::optional< Trading::TradeErrorCode > errorCode;
    bool retryable = false;
    std::thread trader
    (
        [ & ]( )
        {
            try
            {
                fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 10 ) ) );
            }
            catch ( const Trading::TradeError & ex )
            {
                errorCode = ex.code( );
                retryable = ex.retryable( );
            }
        }
    );
    trader.join( );

    REQUIRE( errorCode.has_value( ) );
    CHECK( *errorCode == Trading::TradeErrorCode::contention );
    CHECK( retryable );
    CHECK( to_double( fixture.pool( ).availableBalance ) == Approx( 5000 ) );

    holder.reset( );
    REQUIRE_NOTHROW( fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 10 ) ) ) );
}

TEST_CASE( "Concurrent buys on one market keep the invariant", "[executor][concurrency]" )
{
    Storage::MemoryStore store;
    Feed::StaticPriceFeed priceFeed;
    store.insert_prediction_market( Test::make_prediction_market( "market-1", Trading::Quantity( 1000 ), Trading::Quantity( 1000 ) ) );

    constexpr uint32_t traderCount = 8;
    constexpr uint32_t buysPerTrader = 10;
    for ( uint32_t trader = 0; trader < traderCount; ++trader )
    {
        store.insert_pool( Test::make_pool( fmt::format( "pool-{}", trader ), Trading::Quantity( 1000 ) ) );
    }

    Execution::TradeExecutorConfig config;
    config.lockTimeout = std::chrono::seconds( 10 );
    Execution::TradeExecutor executor( store, priceFeed, config, [ ]( ){ return Test::test_epoch( ); } );
    executor.initialize( );

    std::atomic< uint32_t > failures = 0;
    {
        std::vector< std::jthread > traders;
        for ( uint32_t trader = 0; trader < traderCount; ++trader )
        {
            traders.emplace_back
            (
                [ &, trader ]( )
                {
                    for ( uint32_t buy = 0; buy < buysPerTrader; ++buy )
                    {
                        const auto action = ( trader + buy ) % 2 == 0 ? TradeAction::buy_yes : TradeAction::buy_no;
                        try
                        {
                            executor.execute_single_decision( buy_decision( fmt::format( "pool-{}", trader ), action, Trading::Quantity( 5 ) ) );
                        }
                        catch ( const Trading::TradeError & )
                        {
                            ++failures;
                        }
                    }
                }
            );
        }
    }

    CHECK( failures == 0 );

    auto view = store.begin( { }, std::chrono::milliseconds( 0 ) );
    const auto market = *view->get_prediction_market( "market-1" );
    CHECK( to_double( FixedFloat( market.yesReserve * market.noReserve ) ) == Approx( 1000000 ).margin( 1e-2 ) );
    CHECK( to_double( market.liquidity ) == Approx( traderCount * buysPerTrader * 4.95 ) );

    for ( uint32_t trader = 0; trader < traderCount; ++trader )
    {
        const auto pool = *view->get_pool( fmt::format( "pool-{}", trader ) );
        CHECK( to_double( pool.availableBalance ) == Approx( 1000 - buysPerTrader * 5 ) );
    }
    CHECK( store.trade_records( ).size( ) == traderCount * buysPerTrader );
}

TEST_CASE( "Batch counts successes, failures and holds", "[executor]" )
{
    Test::ExecutorFixture fixture;

    std::vector< Execution::TradingDecision > decisions;
    decisions.push_back( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 100 ) ) );
    decisions.push_back( buy_decision( "pool-1", TradeAction::buy_no, Trading::Quantity( 1000000 ) ) );
    decisions.push_back( Test::make_decision( "pool-1", TradeAction::hold, Trading::Quantity( 0 ) ) );

    auto perpDecision = Test::make_decision( "pool-1", TradeAction::open_long, Trading::Quantity( 200 ) );
    perpDecision.ticker = "ACME";
    perpDecision.leverage = 3;
    decisions.push_back( perpDecision );

    const auto result = fixture.executor->execute_decision_batch( decisions );

    CHECK( result.totalDecisions == 4 );
    CHECK( result.successfulTrades == 2 );
    CHECK( result.failedTrades == 1 );
    CHECK( result.holdDecisions == 1 );
    CHECK( result.executedTrades.size( ) == 2 );

    REQUIRE( result.errors.size( ) == 1 );
    CHECK( result.errors.front( ).code == Trading::TradeErrorCode::insufficient_funds );
    CHECK( result.errors.front( ).action == TradeAction::buy_no );
    CHECK( result.errors.front( ).actorId == "actor-pool-1" );

    CHECK( to_double( result.totalVolumePrediction ) == Approx( 100 ) );
    CHECK( to_double( result.totalVolumePerp ) == Approx( 200.6 ) );
}

TEST_CASE( "Trade impacts sum volume per market", "[executor]" )
{
    Test::ExecutorFixture fixture;

    std::vector< Execution::ExecutedTrade > trades;

    auto buyYes = Test::make_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 100 ) );
    buyYes.marketId = "market-1";
    trades.push_back( fixture.executor->execute_single_decision( buyYes ) );

    auto openLong = Test::make_decision( "pool-1", TradeAction::open_long, Trading::Quantity( 200 ) );
    openLong.ticker = "ACME";
    openLong.leverage = 3;
    trades.push_back( fixture.executor->execute_single_decision( openLong ) );

    auto buyNo = Test::make_decision( "pool-1", TradeAction::buy_no, Trading::Quantity( 40 ) );
    buyNo.marketId = "market-1";
    trades.push_back( fixture.executor->execute_single_decision( buyNo ) );

    trades.push_back( fixture.executor->execute_single_decision( Test::make_decision( "pool-1", TradeAction::hold, Trading::Quantity( 0 ) ) ) );

    const auto impacts = Execution::aggregate_trade_impacts( trades );
    REQUIRE( impacts.size( ) == 2 );

    CHECK( impacts[ 0 ].marketType == Execution::MarketType::prediction );
    CHECK( impacts[ 0 ].marketId == "market-1" );
    CHECK( impacts[ 0 ].tradeCount == 2 );
    CHECK( to_double( impacts[ 0 ].totalVolume ) == Approx( 140 ) );
    CHECK( to_double( impacts[ 0 ].netVolume ) == Approx( 60 ) );

    CHECK( impacts[ 1 ].marketType == Execution::MarketType::perpetual );
    CHECK( impacts[ 1 ].marketId == "ACME" );
    CHECK( impacts[ 1 ].tradeCount == 1 );
    CHECK( to_double( impacts[ 1 ].netVolume ) == Approx( 200.6 ) );

    SECTION( "Exits count against the side they leave" )
    {
        auto sell = Test::make_decision( "pool-1", TradeAction::close_position, Trading::Quantity( 0 ) );
        sell.marketId = "market-1";
        sell.positionId = trades[ 2 ].positionId;
        const auto exit = fixture.executor->execute_single_decision( sell );

        const auto exitImpacts = Execution::aggregate_trade_impacts( { exit } );
        REQUIRE( exitImpacts.size( ) == 1 );
        CHECK( exitImpacts.front( ).netVolume > 0 );
        CHECK( exitImpacts.front( ).netVolume == exit.amountCredited );
    }
}

TEST_CASE( "Hold executes nothing", "[executor]" )
{
    Test::ExecutorFixture fixture;

    const auto trade = fixture.executor->execute_single_decision( Test::make_decision( "pool-1", TradeAction::hold, Trading::Quantity( 0 ) ) );

    CHECK( trade.action == TradeAction::hold );
    CHECK( trade.volume( ) == 0 );
    CHECK( fixture.store->trade_records( ).empty( ) );
}

TEST_CASE( "Executor must be initialized", "[executor]" )
{
    Storage::MemoryStore store;
    Feed::StaticPriceFeed priceFeed;
    Execution::TradeExecutor executor( store, priceFeed, Execution::TradeExecutorConfig( ) );

    CHECK_FALSE( executor.initialized( ) );
    REQUIRE_THROWS_AS( executor.execute_decision_batch( { } ), WagerfiError );

    executor.initialize( );
    CHECK( executor.initialized( ) );
    CHECK( executor.execute_decision_batch( { } ).totalDecisions == 0 );
}

TEST_CASE( "Resolution pays the winning side", "[executor][resolution]" )
{
    Test::ExecutorFixture fixture;
    fixture.store->insert_pool( Test::make_pool( "pool-2", Trading::Quantity( 1000 ) ) );

    const auto yesBuy = fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 100 ) ) );
    const auto noBuy = fixture.executor->execute_single_decision( buy_decision( "pool-2", TradeAction::buy_no, Trading::Quantity( 100 ) ) );

    SECTION( "No outcome yet" )
    {
        const auto settlement = fixture.executor->resolve_market( "market-1" );
        CHECK_FALSE( settlement.resolved );
        CHECK( fixture.prediction_position( yesBuy.positionId ).is_open( ) );
    }

    SECTION( "Yes wins" )
    {
        fixture.priceFeed.set_resolution_outcome( "market-1", true );

        const auto settlement = fixture.executor->resolve_market( "market-1" );
        CHECK( settlement.resolved );
        CHECK( settlement.outcome == true );
        CHECK( settlement.positionsSettled == 2 );
        CHECK( to_double( settlement.totalPayout ) == Approx( to_double( yesBuy.quantity ) ) );

        CHECK( to_double( fixture.pool( "pool-1" ).availableBalance ) == Approx( 4900 + to_double( yesBuy.quantity ) ) );
        CHECK( to_double( fixture.pool( "pool-1" ).lifetimePnL ) == Approx( to_double( yesBuy.quantity ) - 99 ) );
        CHECK( to_double( fixture.pool( "pool-2" ).availableBalance ) == Approx( 900 ) );
        CHECK( to_double( fixture.pool( "pool-2" ).lifetimePnL ) == Approx( -99 ) );

        CHECK_FALSE( fixture.prediction_position( yesBuy.positionId ).is_open( ) );
        CHECK_FALSE( fixture.prediction_position( noBuy.positionId ).is_open( ) );

        const auto market = fixture.prediction_market( );
        CHECK( market.resolved );
        CHECK( market.outcome == true );

        // Settled once.
        const auto again = fixture.executor->resolve_market( "market-1" );
        CHECK( again.resolved );
        CHECK( again.positionsSettled == 0 );
        CHECK( to_double( fixture.pool( "pool-1" ).availableBalance ) == Approx( 4900 + to_double( yesBuy.quantity ) ) );

        REQUIRE_THROWS_AS
        (
            fixture.executor->execute_single_decision( buy_decision( "pool-1", TradeAction::buy_yes, Trading::Quantity( 10 ) ) ),
            Trading::MarketClosedError
        );
        REQUIRE_THROWS_AS( fixture.executor->quote_buy( "market-1", Trading::OutcomeSide::yes, Trading::Quantity( 10 ) ), Trading::MarketClosedError );
    }

    SECTION( "Expired markets are listed until resolved" )
    {
        CHECK( fixture.executor->expired_market_ids( ).empty( ) );

        fixture.clock.advance( std::chrono::hours( 24 * 31 ) );
        REQUIRE( fixture.executor->expired_market_ids( ) == std::vector< std::string >{ "market-1" } );

        fixture.priceFeed.set_resolution_outcome( "market-1", false );
        CHECK( fixture.executor->resolve_market( "market-1" ).resolved );
        CHECK( fixture.executor->expired_market_ids( ).empty( ) );
        CHECK( to_double( fixture.pool( "pool-2" ).availableBalance ) == Approx( 900 + to_double( noBuy.quantity ) ) );
    }
}

TEST_CASE( "Quotes read without trading", "[executor]" )
{
    Test::ExecutorFixture fixture;

    const auto quote = fixture.executor->quote_buy( "market-1", Trading::OutcomeSide::yes, Trading::Quantity( 250 ) );
    CHECK( to_double( quote.netAmount ) == Approx( 247.5 ) );
    CHECK( fixture.prediction_market( ).yesReserve == 500 );

    const auto sellQuote = fixture.executor->quote_sell( "market-1", Trading::OutcomeSide::no, Trading::Quantity( 10 ) );
    CHECK( sellQuote.grossProceeds > 0 );

    REQUIRE_THROWS_AS( fixture.executor->quote_buy( "market-missing", Trading::OutcomeSide::yes, Trading::Quantity( 10 ) ), Trading::ValidationError );
}
