#pragma once

#include "wagerfi/Execution/TradeExecutionTypes.hpp"

#include "wagerfi/Accounting/Ledger.hpp"
#include "wagerfi/Amm/PredictionAmm.hpp"
#include "wagerfi/Feed/PriceFeed.hpp"
#include "wagerfi/Storage/Store.hpp"

#include "wagerfi/Util/Logger.hpp"
#include "wagerfi/Util/StringHash.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Wagerfi
{
namespace Execution
{

using Clock = std::function< Storage::Timestamp( ) >;

// Validates decisions and applies them to the store. Every call is one transaction: the rows
// it touches are locked, read, quoted against and written back together, or not at all.
// Safe to call from any number of threads.
class TradeExecutor
{
public:
    TradeExecutor
    (
        Storage::Store & store,
        const Feed::PriceFeed & priceFeed,
        TradeExecutorConfig config,
        Clock clock = [ ]( ){ return std::chrono::system_clock::now( ); }
    );

    // Loads the open position index, must be called once before trading.
    void initialize( );
    bool initialized( ) const { return _initialized.load( ); }

    ExecutedTrade execute_single_decision( const TradingDecision & decision );

    // Failures are recorded per decision, hold decisions are counted and skipped.
    ExecutionResult execute_decision_batch( const std::vector< TradingDecision > & decisions );

    // Applies every whole funding interval elapsed since the last tick.
    FundingTickResult apply_funding_tick( std::string_view positionId, Storage::Timestamp now );

    // Marks the position to the index price, returns the liquidation when one was triggered.
    std::optional< ExecutedTrade > check_liquidation( std::string_view positionId );

    // Settles every open position once the feed has finalized the outcome.
    SettlementResult resolve_market( std::string_view marketId );

    Amm::BuyQuote quote_buy( std::string_view marketId, Trading::OutcomeSide side, const Trading::Quantity & amount ) const;
    Amm::SellQuote quote_sell( std::string_view marketId, Trading::OutcomeSide side, const Trading::Quantity & shares ) const;

    std::vector< std::string > open_perp_position_ids( ) const;

    // Unresolved prediction markets whose end date has passed.
    std::vector< std::string > expired_market_ids( ) const;

    const TradeExecutorConfig & config( ) const { return _config; }

    Storage::Timestamp now( ) const { return _clock( ); }

    std::string name( ) const { return "TradeExecutor"; }

private:
    ExecutedTrade execute_buy( const TradingDecision & decision, Trading::OutcomeSide side );
    ExecutedTrade execute_sell( const TradingDecision & decision, bool closeAll );
    ExecutedTrade execute_open_perp( const TradingDecision & decision, Trading::PerpSide side );
    ExecutedTrade execute_close_perp( const TradingDecision & decision );

    // Force closes `position` at its liquidation price, staged on `transaction`.
    ExecutedTrade stage_liquidation
    (
        Storage::StoreTransaction & transaction,
        Storage::PerpPosition position,
        const std::string & actorId,
        Storage::Timestamp now
    );

    void stage_trade_record
    (
        Storage::StoreTransaction & transaction,
        const std::string & actorId,
        const std::string & poolId,
        const ExecutedTrade & trade,
        std::string_view reason,
        Storage::Timestamp now
    );

    std::unique_ptr< Storage::StoreTransaction > begin( std::vector< std::string > lockKeys );
    std::unique_ptr< Storage::StoreTransaction > read_view( ) const;

    Storage::PredictionMarket load_open_market( Storage::StoreTransaction & transaction, std::string_view marketId, Storage::Timestamp now );
    Storage::PerpPosition load_owned_perp_position( std::string_view positionId, std::string_view poolId ) const;

    void check_initialized( ) const;

    void track_perp_position( const Storage::PerpPosition & position );
    void untrack_perp_position( const Storage::PerpPosition & position );

    Storage::Store & _store;
    const Feed::PriceFeed & _priceFeed;
    TradeExecutorConfig _config;
    Clock _clock;

    Amm::PredictionAmm _amm;
    Accounting::Ledger _ledger;

    std::atomic< bool > _initialized = false;

    mutable std::mutex _positionIndexMutex;
    TransparentStringMap< TransparentStringSet > _openPerpPositionsByTicker;

    mutable WagerfiLogger _logger;
};

} // namespace Execution
} // namespace Wagerfi
