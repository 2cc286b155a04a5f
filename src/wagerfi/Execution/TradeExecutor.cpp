#include "wagerfi/Execution/TradeExecutor.hpp"

#include "wagerfi/Risk/PerpRiskEngine.hpp"
#include "wagerfi/Trading/TradeError.hpp"

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <algorithm>

namespace Wagerfi
{
namespace Execution
{

// Attempts to lock a consistent set of pools before settling a market.
static constexpr uint32_t resolution_lock_attempts( ) { return 3; }

TradeExecutor::TradeExecutor
(
    Storage::Store & store,
    const Feed::PriceFeed & priceFeed,
    TradeExecutorConfig config,
    Clock clock
)
    : _store( store )
    , _priceFeed( priceFeed )
    , _config( std::move( config ) )
    , _clock( std::move( clock ) )
    , _amm( _config.predictionFeeRate )
    , _ledger( store )
{ }

void TradeExecutor::initialize( )
{
    WAGERFI_LOG_INFO( _logger ) << fmt::format( "[{}] Initializing", name( ) );

    auto openPositions = _store.open_perp_positions( );
    {
        std::scoped_lock lock( _positionIndexMutex );
        _openPerpPositionsByTicker.clear( );
        for ( const auto & position : openPositions )
        {
            _openPerpPositionsByTicker[ position.ticker ].insert( position.id );
        }
    }

    auto predictionMarkets = _store.prediction_markets( );
    const auto openMarkets = std::count_if
    (
        predictionMarkets.begin( ),
        predictionMarkets.end( ),
        []( const auto & market ){ return !market.resolved; }
    );

    _initialized = true;

    WAGERFI_LOG_INFO( _logger )
        << fmt::format
        (
            "[{}] Initialized, open perp positions: {}, prediction markets: {}, unresolved: {}",
            name( ),
            openPositions.size( ),
            predictionMarkets.size( ),
            openMarkets
        );
}

void TradeExecutor::check_initialized( ) const
{
    if ( !_initialized )
    {
        throw WagerfiError( "TradeExecutor used before initialize( )" );
    }
}

std::unique_ptr< Storage::StoreTransaction > TradeExecutor::begin( std::vector< std::string > lockKeys )
{
    return _store.begin( std::move( lockKeys ), _config.lockTimeout );
}

std::unique_ptr< Storage::StoreTransaction > TradeExecutor::read_view( ) const
{
    return _store.begin( { }, std::chrono::milliseconds( 0 ) );
}

ExecutedTrade TradeExecutor::execute_single_decision( const TradingDecision & decision )
{
    check_initialized( );

    if ( decision.poolId.empty( ) && decision.action != TradeAction::hold )
    {
        throw Trading::ValidationError( "Decision has no pool" );
    }

    switch ( decision.action )
    {
        case TradeAction::buy_yes:
            return execute_buy( decision, Trading::OutcomeSide::yes );
        case TradeAction::buy_no:
            return execute_buy( decision, Trading::OutcomeSide::no );
        case TradeAction::sell:
            return execute_sell( decision, false );
        case TradeAction::close_position:
            return execute_sell( decision, true );
        case TradeAction::open_long:
            return execute_open_perp( decision, Trading::PerpSide::long_side );
        case TradeAction::open_short:
            return execute_open_perp( decision, Trading::PerpSide::short_side );
        case TradeAction::close_perp:
            return execute_close_perp( decision );
        case TradeAction::hold:
        {
            ExecutedTrade trade;
            trade.marketType = decision.marketType;
            trade.action = TradeAction::hold;
            return trade;
        }
    }

    throw Trading::ValidationError( fmt::format( "Unknown trade action: {}", static_cast< int >( decision.action ) ) );
}

ExecutionResult TradeExecutor::execute_decision_batch( const std::vector< TradingDecision > & decisions )
{
    check_initialized( );

    const auto startTime = std::chrono::steady_clock::now( );

    ExecutionResult result;
    result.totalDecisions = decisions.size( );
    result.totalVolumePerp = fixed_zero( );
    result.totalVolumePrediction = fixed_zero( );

    for ( const auto & decision : decisions )
    {
        if ( decision.action == TradeAction::hold )
        {
            ++result.holdDecisions;
            continue;
        }

        try
        {
            auto executedTrade = execute_single_decision( decision );

            ++result.successfulTrades;
            if ( executedTrade.marketType == MarketType::perpetual )
            {
                result.totalVolumePerp += executedTrade.volume( );
            }
            else
            {
                result.totalVolumePrediction += executedTrade.volume( );
            }
            result.executedTrades.push_back( std::move( executedTrade ) );
        }
        catch ( const Trading::TradeError & ex )
        {
            ++result.failedTrades;
            result.errors.push_back
            (
                ExecutionError
                {
                    .actorId = decision.actorId,
                    .action = decision.action,
                    .code = ex.code( ),
                    .message = ex.what( )
                }
            );

            WAGERFI_LOG_ERROR( _logger )
                << fmt::format
                (
                    "[{}] Failed to execute {} for {}: {} ({})",
                    name( ),
                    magic_enum::enum_name( decision.action ),
                    decision.actorName,
                    ex.what( ),
                    magic_enum::enum_name( ex.code( ) )
                );
        }
    }

    const auto duration = std::chrono::duration_cast< std::chrono::milliseconds >( std::chrono::steady_clock::now( ) - startTime );

    WAGERFI_LOG_INFO( _logger )
        << fmt::format
        (
            "[{}] Executed {} trades in {}ms, failed: {}, hold: {}, prediction volume: {}, perp volume: {}",
            name( ),
            result.successfulTrades,
            duration.count( ),
            result.failedTrades,
            result.holdDecisions,
            result.totalVolumePrediction,
            result.totalVolumePerp
        );

    return result;
}

Storage::PredictionMarket TradeExecutor::load_open_market
(
    Storage::StoreTransaction & transaction,
    std::string_view marketId,
    Storage::Timestamp now
)
{
    auto market = transaction.get_prediction_market( marketId );
    if ( !market )
    {
        throw Trading::ValidationError( fmt::format( "Unknown prediction market: {}", marketId ) );
    }
    if ( market->resolved )
    {
        throw Trading::MarketClosedError( fmt::format( "Market {} is resolved", marketId ) );
    }
    if ( market->endDate <= now )
    {
        throw Trading::MarketClosedError( fmt::format( "Market {} has expired", marketId ) );
    }
    return std::move( *market );
}

void TradeExecutor::stage_trade_record
(
    Storage::StoreTransaction & transaction,
    const std::string & actorId,
    const std::string & poolId,
    const ExecutedTrade & trade,
    std::string_view reason,
    Storage::Timestamp now
)
{
    Storage::TradeRecord record;
    record.id = transaction.next_id( "trade" );
    record.actorId = actorId;
    record.poolId = poolId;
    record.marketType = std::string( magic_enum::enum_name( trade.marketType ) );
    record.marketId = trade.marketId;
    record.action = std::string( magic_enum::enum_name( trade.action ) );
    if ( trade.outcomeSide )
    {
        record.side = std::string( magic_enum::enum_name( *trade.outcomeSide ) );
    }
    else if ( trade.perpSide )
    {
        record.side = std::string( magic_enum::enum_name( *trade.perpSide ) );
    }
    record.amount = trade.volume( );
    record.price = trade.executionPrice;
    record.reason = std::string( reason );
    record.createdAt = now;

    transaction.append_trade_record( record );
}

ExecutedTrade TradeExecutor::execute_buy( const TradingDecision & decision, Trading::OutcomeSide side )
{
    if ( decision.marketType != MarketType::prediction )
    {
        throw Trading::ValidationError( fmt::format( "{} requires a prediction market", magic_enum::enum_name( decision.action ) ) );
    }
    if ( decision.marketId.empty( ) )
    {
        throw Trading::ValidationError( "Buy decision has no market" );
    }
    if ( decision.amount <= 0 )
    {
        throw Trading::ValidationError( fmt::format( "Buy amount must be positive, amount: {}", decision.amount ) );
    }
    if ( decision.amount < _config.minPredictionAmount )
    {
        throw Trading::ValidationError
        (
            fmt::format( "Buy amount {} is below the minimum of {}", decision.amount, _config.minPredictionAmount )
        );
    }

    const auto now = _clock( );
    auto transaction = begin
    (
        {
            Storage::pool_key( decision.poolId ),
            Storage::prediction_market_key( decision.marketId )
        }
    );

    auto market = load_open_market( *transaction, decision.marketId, now );
    if ( !transaction->get_pool( decision.poolId ) )
    {
        throw Trading::ValidationError( fmt::format( "Unknown pool: {}", decision.poolId ) );
    }

    const Amm::Reserves reserves( market.yesReserve, market.noReserve );
    const auto quote = _amm.quote_buy( reserves, side, decision.amount );

    if ( decision.priceLimit && quote.averagePrice > *decision.priceLimit )
    {
        throw Trading::SlippageExceededError
        (
            fmt::format( "Average price {} exceeds limit {}", quote.averagePrice, *decision.priceLimit )
        );
    }

    // First write, throws InsufficientFundsError before anything is staged.
    _ledger.debit
    (
        *transaction,
        decision.poolId,
        quote.totalCost,
        { Storage::BalanceTransactionType::prediction_buy, fmt::format( "Buy {} on {}", magic_enum::enum_name( side ), market.id ), market.id },
        now
    );

    auto pool = *transaction->get_pool( decision.poolId );
    pool.totalFeesCollected += quote.fee;
    transaction->put_pool( pool );

    market.yesReserve = quote.newReserves.yes( );
    market.noReserve = quote.newReserves.no( );
    market.liquidity += quote.netAmount;
    transaction->put_prediction_market( market );

    auto position = transaction->find_open_prediction_position( decision.poolId, market.id, side );
    if ( !position )
    {
        position = Storage::PredictionPosition
        {
            .id = transaction->next_id( "prediction" ),
            .poolId = decision.poolId,
            .marketId = market.id,
            .side = side,
            .shares = fixed_zero( ),
            .costBasis = fixed_zero( ),
            .realizedPnL = fixed_zero( ),
            .openedAt = now,
            .closedAt = std::nullopt
        };
    }
    position->shares += quote.sharesOut;
    position->costBasis += quote.netAmount;
    transaction->put_prediction_position( *position );

    ExecutedTrade trade;
    trade.marketType = MarketType::prediction;
    trade.action = decision.action;
    trade.marketId = market.id;
    trade.positionId = position->id;
    trade.outcomeSide = side;
    trade.quantity = quote.sharesOut;
    trade.amountDebited = quote.totalCost;
    trade.amountCredited = fixed_zero( );
    trade.fee = quote.fee;
    trade.executionPrice = quote.averagePrice;
    trade.realizedPnL = fixed_zero( );

    stage_trade_record( *transaction, decision.actorId, decision.poolId, trade, decision.reasoning, now );
    transaction->commit( );

    WAGERFI_LOG_INFO( _logger )
        << fmt::format
        (
            "[{}] {} bought {} {} shares of {} for {}, fee: {}, avg price: {}",
            name( ),
            decision.actorName,
            trade.quantity,
            magic_enum::enum_name( side ),
            market.id,
            trade.amountDebited,
            trade.fee,
            trade.executionPrice
        );

    return trade;
}

ExecutedTrade TradeExecutor::execute_sell( const TradingDecision & decision, bool closeAll )
{
    if ( decision.marketType != MarketType::prediction )
    {
        throw Trading::ValidationError( fmt::format( "{} requires a prediction market", magic_enum::enum_name( decision.action ) ) );
    }
    if ( decision.positionId.empty( ) )
    {
        throw Trading::ValidationError( "Sell decision has no position" );
    }
    if ( !closeAll && decision.amount <= 0 )
    {
        throw Trading::ValidationError( fmt::format( "Sell shares must be positive, shares: {}", decision.amount ) );
    }

    // The position's market is only known after a first read.
    auto snapshot = read_view( )->get_prediction_position( decision.positionId );
    if ( !snapshot || snapshot->poolId != decision.poolId )
    {
        throw Trading::PositionNotFoundError( fmt::format( "Position {} not found for pool {}", decision.positionId, decision.poolId ) );
    }

    const auto now = _clock( );
    auto transaction = begin
    (
        {
            Storage::pool_key( decision.poolId ),
            Storage::prediction_market_key( snapshot->marketId ),
            Storage::prediction_position_key( decision.positionId )
        }
    );

    auto position = *transaction->get_prediction_position( decision.positionId );
    if ( !position.is_open( ) )
    {
        throw Trading::ValidationError( fmt::format( "Position {} is already closed", position.id ) );
    }

    auto market = load_open_market( *transaction, position.marketId, now );

    const Trading::Quantity sharesIn = closeAll ? position.shares : decision.amount;
    if ( sharesIn > position.shares )
    {
        throw Trading::ValidationError( fmt::format( "Cannot sell {} shares, position holds {}", sharesIn, position.shares ) );
    }

    const Amm::Reserves reserves( market.yesReserve, market.noReserve );
    const auto quote = _amm.quote_sell( reserves, position.side, sharesIn );

    if ( decision.priceLimit && quote.averagePrice < *decision.priceLimit )
    {
        throw Trading::SlippageExceededError
        (
            fmt::format( "Average price {} is below limit {}", quote.averagePrice, *decision.priceLimit )
        );
    }

    const bool fullExit = sharesIn == position.shares;
    const Trading::Quantity costReleased = fullExit ? position.costBasis : Trading::Quantity( position.costBasis * sharesIn / position.shares );
    const Trading::Quantity realizedPnL = quote.netProceeds - costReleased;

    _ledger.credit
    (
        *transaction,
        decision.poolId,
        quote.netProceeds,
        { Storage::BalanceTransactionType::prediction_sell, fmt::format( "Sell {} on {}", magic_enum::enum_name( position.side ), market.id ), position.id },
        now
    );

    auto pool = *transaction->get_pool( decision.poolId );
    pool.totalFeesCollected += quote.fee;
    pool.lifetimePnL += realizedPnL;
    transaction->put_pool( pool );

    market.yesReserve = quote.newReserves.yes( );
    market.noReserve = quote.newReserves.no( );
    market.liquidity -= quote.grossProceeds;
    transaction->put_prediction_market( market );

    position.shares -= sharesIn;
    position.costBasis -= costReleased;
    position.realizedPnL += realizedPnL;
    if ( fullExit )
    {
        position.shares = fixed_zero( );
        position.costBasis = fixed_zero( );
        position.closedAt = now;
    }
    transaction->put_prediction_position( position );

    ExecutedTrade trade;
    trade.marketType = MarketType::prediction;
    trade.action = decision.action;
    trade.marketId = market.id;
    trade.positionId = position.id;
    trade.outcomeSide = position.side;
    trade.quantity = sharesIn;
    trade.amountDebited = fixed_zero( );
    trade.amountCredited = quote.netProceeds;
    trade.fee = quote.fee;
    trade.executionPrice = quote.averagePrice;
    trade.realizedPnL = realizedPnL;

    stage_trade_record( *transaction, decision.actorId, decision.poolId, trade, decision.reasoning, now );
    transaction->commit( );

    WAGERFI_LOG_INFO( _logger )
        << fmt::format
        (
            "[{}] {} sold {} {} shares of {} for {}, fee: {}, realized: {}{}",
            name( ),
            decision.actorName,
            sharesIn,
            magic_enum::enum_name( position.side ),
            market.id,
            trade.amountCredited,
            trade.fee,
            realizedPnL,
            fullExit ? ", position closed" : ""
        );

    return trade;
}

ExecutedTrade TradeExecutor::execute_open_perp( const TradingDecision & decision, Trading::PerpSide side )
{
    if ( decision.marketType != MarketType::perpetual )
    {
        throw Trading::ValidationError( fmt::format( "{} requires a perpetual market", magic_enum::enum_name( decision.action ) ) );
    }
    if ( decision.ticker.empty( ) )
    {
        throw Trading::ValidationError( "Open decision has no ticker" );
    }
    if ( decision.amount <= 0 )
    {
        throw Trading::ValidationError( fmt::format( "Margin must be positive, amount: {}", decision.amount ) );
    }

    const uint32_t leverage = decision.leverage.value_or( _config.defaultLeverage );

    const auto now = _clock( );
    auto transaction = begin
    (
        {
            Storage::pool_key( decision.poolId ),
            Storage::perp_market_key( decision.ticker )
        }
    );

    auto market = transaction->get_perp_market( decision.ticker );
    if ( !market )
    {
        throw Trading::ValidationError( fmt::format( "Unknown perpetual market: {}", decision.ticker ) );
    }
    if ( !transaction->get_pool( decision.poolId ) )
    {
        throw Trading::ValidationError( fmt::format( "Unknown pool: {}", decision.poolId ) );
    }

    const uint32_t maxLeverage = std::min( { Risk::max_leverage( ), _config.maxLeverage, market->maxLeverage } );
    if ( leverage < 1 || leverage > maxLeverage )
    {
        throw Trading::ValidationError( fmt::format( "Leverage {} outside [1, {}] for {}", leverage, maxLeverage, market->ticker ) );
    }

    const auto indexPrice = _priceFeed.get_index_price( market->ticker );
    if ( !indexPrice || *indexPrice <= 0 )
    {
        throw Trading::InvalidTradeError( fmt::format( "No index price for {}", market->ticker ) );
    }
    const Trading::Price entryPrice = *indexPrice;

    if ( decision.priceLimit )
    {
        const bool exceeded = side == Trading::PerpSide::long_side
            ? entryPrice > *decision.priceLimit
            : entryPrice < *decision.priceLimit;
        if ( exceeded )
        {
            throw Trading::SlippageExceededError
            (
                fmt::format( "Entry price {} crosses limit {}", entryPrice, *decision.priceLimit )
            );
        }
    }

    const Trading::Quantity margin = decision.amount;
    const Trading::Quantity size = margin * leverage;
    if ( size < market->minOrderSize )
    {
        throw Trading::ValidationError( fmt::format( "Position size {} is below the minimum of {}", size, market->minOrderSize ) );
    }

    const Trading::Quantity fee = Risk::trading_fee( size, _config.perpFeeRate );
    const Trading::Quantity totalCost = margin + fee;

    Storage::PerpPosition position;
    position.id = transaction->next_id( "perp" );

    _ledger.debit
    (
        *transaction,
        decision.poolId,
        totalCost,
        { Storage::BalanceTransactionType::perp_open, fmt::format( "Open {} {}x {}", magic_enum::enum_name( side ), leverage, market->ticker ), position.id },
        now
    );

    auto pool = *transaction->get_pool( decision.poolId );
    pool.totalFeesCollected += fee;
    transaction->put_pool( pool );

    position.ownerId = decision.poolId;
    position.ticker = market->ticker;
    position.side = side;
    position.entryPrice = entryPrice;
    position.currentPrice = entryPrice;
    position.size = size;
    position.margin = margin;
    position.leverage = leverage;
    position.liquidationPrice = Risk::liquidation_price( entryPrice, side, leverage );
    position.unrealizedPnL = fixed_zero( );
    position.unrealizedPnLPercent = fixed_zero( );
    position.fundingPaid = fixed_zero( );
    position.realizedPnL = fixed_zero( );
    position.status = Storage::PerpPositionStatus::open;
    position.openedAt = now;
    position.lastUpdated = now;
    position.lastFundingAt = now;
    transaction->put_perp_position( position );

    market->openInterest += size;
    market->lastTradePrice = entryPrice;
    transaction->put_perp_market( *market );

    ExecutedTrade trade;
    trade.marketType = MarketType::perpetual;
    trade.action = decision.action;
    trade.marketId = market->ticker;
    trade.positionId = position.id;
    trade.perpSide = side;
    trade.quantity = size;
    trade.amountDebited = totalCost;
    trade.amountCredited = fixed_zero( );
    trade.fee = fee;
    trade.executionPrice = entryPrice;
    trade.realizedPnL = fixed_zero( );

    stage_trade_record( *transaction, decision.actorId, decision.poolId, trade, decision.reasoning, now );
    transaction->commit( );

    track_perp_position( position );

    WAGERFI_LOG_INFO( _logger )
        << fmt::format
        (
            "[{}] {} opened {} {}x {} size: {} at {}, margin: {}, fee: {}, liquidation: {}",
            name( ),
            decision.actorName,
            magic_enum::enum_name( side ),
            leverage,
            market->ticker,
            size,
            entryPrice,
            margin,
            fee,
            position.liquidationPrice
        );

    return trade;
}

Storage::PerpPosition TradeExecutor::load_owned_perp_position( std::string_view positionId, std::string_view poolId ) const
{
    auto position = read_view( )->get_perp_position( positionId );
    if ( !position || ( !poolId.empty( ) && position->ownerId != poolId ) )
    {
        throw Trading::PositionNotFoundError( fmt::format( "Perp position {} not found", positionId ) );
    }
    return std::move( *position );
}

ExecutedTrade TradeExecutor::stage_liquidation
(
    Storage::StoreTransaction & transaction,
    Storage::PerpPosition position,
    const std::string & actorId,
    Storage::Timestamp now
)
{
    const Trading::Price exitPrice = position.liquidationPrice;
    const auto pnl = Risk::unrealized_pnl( position.entryPrice, exitPrice, position.side, position.size );
    const Trading::Quantity closeFee = Risk::trading_fee( position.size, _config.perpFeeRate );

    const Trading::Quantity equity = position.margin + pnl.pnl;
    const Trading::Quantity payout = std::max( fixed_zero( ), Trading::Quantity( equity - closeFee ) );
    const Trading::Quantity feeCharged = std::clamp( equity, fixed_zero( ), closeFee );
    const Trading::Quantity realizedPnL = payout - position.margin;

    if ( payout > 0 )
    {
        _ledger.credit
        (
            transaction,
            position.ownerId,
            payout,
            { Storage::BalanceTransactionType::perp_liquidation, fmt::format( "Liquidation of {} on {}", position.id, position.ticker ), position.id },
            now
        );
    }

    auto pool = *transaction.get_pool( position.ownerId );
    pool.totalFeesCollected += feeCharged;
    pool.lifetimePnL += realizedPnL;
    transaction.put_pool( pool );

    if ( auto market = transaction.get_perp_market( position.ticker ) )
    {
        market->openInterest = std::max( fixed_zero( ), Trading::Quantity( market->openInterest - position.size ) );
        transaction.put_perp_market( *market );
    }

    position.currentPrice = exitPrice;
    position.unrealizedPnL = fixed_zero( );
    position.unrealizedPnLPercent = fixed_zero( );
    position.realizedPnL = realizedPnL;
    position.status = Storage::PerpPositionStatus::liquidated;
    position.lastUpdated = now;
    position.closedAt = now;
    transaction.put_perp_position( position );

    ExecutedTrade trade;
    trade.marketType = MarketType::perpetual;
    trade.action = TradeAction::close_perp;
    trade.marketId = position.ticker;
    trade.positionId = position.id;
    trade.perpSide = position.side;
    trade.quantity = position.size;
    trade.amountDebited = fixed_zero( );
    trade.amountCredited = payout;
    trade.fee = feeCharged;
    trade.executionPrice = exitPrice;
    trade.realizedPnL = realizedPnL;
    trade.liquidated = true;

    stage_trade_record( transaction, actorId, position.ownerId, trade, "liquidation", now );

    WAGERFI_LOG_INFO( _logger )
        << fmt::format
        (
            "[{}] Liquidated {} {} {} at {}, size: {}, returned: {}, realized: {}",
            name( ),
            position.id,
            magic_enum::enum_name( position.side ),
            position.ticker,
            exitPrice,
            position.size,
            payout,
            realizedPnL
        );

    return trade;
}

ExecutedTrade TradeExecutor::execute_close_perp( const TradingDecision & decision )
{
    if ( decision.marketType != MarketType::perpetual )
    {
        throw Trading::ValidationError( "close_perp requires a perpetual market" );
    }
    if ( decision.positionId.empty( ) )
    {
        throw Trading::ValidationError( "Close decision has no position" );
    }

    const auto snapshot = load_owned_perp_position( decision.positionId, decision.poolId );

    const auto now = _clock( );
    auto transaction = begin
    (
        {
            Storage::pool_key( decision.poolId ),
            Storage::perp_market_key( snapshot.ticker ),
            Storage::perp_position_key( snapshot.id )
        }
    );

    auto position = *transaction->get_perp_position( snapshot.id );
    switch ( position.status )
    {
        case Storage::PerpPositionStatus::open:
            break;
        case Storage::PerpPositionStatus::liquidated:
            throw Trading::LiquidationConflictError( fmt::format( "Position {} was liquidated", position.id ) );
        case Storage::PerpPositionStatus::closed:
            throw Trading::ValidationError( fmt::format( "Position {} is already closed", position.id ) );
    }

    const auto indexPrice = _priceFeed.get_index_price( position.ticker );
    if ( !indexPrice || *indexPrice <= 0 )
    {
        throw Trading::InvalidTradeError( fmt::format( "No index price for {}", position.ticker ) );
    }
    const Trading::Price exitPrice = *indexPrice;

    // A position past its threshold can only leave through liquidation.
    if ( Risk::should_liquidate( exitPrice, position.liquidationPrice, position.side ) )
    {
        auto trade = stage_liquidation( *transaction, std::move( position ), decision.actorId, now );
        transaction->commit( );
        untrack_perp_position( snapshot );
        return trade;
    }

    if ( decision.priceLimit )
    {
        const bool exceeded = position.side == Trading::PerpSide::long_side
            ? exitPrice < *decision.priceLimit
            : exitPrice > *decision.priceLimit;
        if ( exceeded )
        {
            throw Trading::SlippageExceededError( fmt::format( "Exit price {} crosses limit {}", exitPrice, *decision.priceLimit ) );
        }
    }

    const auto pnl = Risk::unrealized_pnl( position.entryPrice, exitPrice, position.side, position.size );
    const Trading::Quantity closeFee = Risk::trading_fee( position.size, _config.perpFeeRate );

    const Trading::Quantity equity = position.margin + pnl.pnl;
    const Trading::Quantity payout = std::max( fixed_zero( ), Trading::Quantity( equity - closeFee ) );
    const Trading::Quantity feeCharged = std::clamp( equity, fixed_zero( ), closeFee );
    const Trading::Quantity realizedPnL = payout - position.margin;

    if ( payout > 0 )
    {
        _ledger.credit
        (
            *transaction,
            decision.poolId,
            payout,
            { Storage::BalanceTransactionType::perp_close, fmt::format( "Close {} {}", magic_enum::enum_name( position.side ), position.ticker ), position.id },
            now
        );
    }

    auto pool = *transaction->get_pool( decision.poolId );
    pool.totalFeesCollected += feeCharged;
    pool.lifetimePnL += realizedPnL;
    transaction->put_pool( pool );

    auto market = *transaction->get_perp_market( position.ticker );
    market.openInterest = std::max( fixed_zero( ), Trading::Quantity( market.openInterest - position.size ) );
    market.lastTradePrice = exitPrice;
    transaction->put_perp_market( market );

    position.currentPrice = exitPrice;
    position.unrealizedPnL = fixed_zero( );
    position.unrealizedPnLPercent = fixed_zero( );
    position.realizedPnL = realizedPnL;
    position.status = Storage::PerpPositionStatus::closed;
    position.lastUpdated = now;
    position.closedAt = now;
    transaction->put_perp_position( position );

    ExecutedTrade trade;
    trade.marketType = MarketType::perpetual;
    trade.action = TradeAction::close_perp;
    trade.marketId = position.ticker;
    trade.positionId = position.id;
    trade.perpSide = position.side;
    trade.quantity = position.size;
    trade.amountDebited = fixed_zero( );
    trade.amountCredited = payout;
    trade.fee = feeCharged;
    trade.executionPrice = exitPrice;
    trade.realizedPnL = realizedPnL;

    stage_trade_record( *transaction, decision.actorId, decision.poolId, trade, decision.reasoning, now );
    transaction->commit( );

    untrack_perp_position( position );

    WAGERFI_LOG_INFO( _logger )
        << fmt::format
        (
            "[{}] {} closed {} {} at {}, returned: {}, realized: {}",
            name( ),
            decision.actorName,
            magic_enum::enum_name( position.side ),
            position.ticker,
            exitPrice,
            payout,
            realizedPnL
        );

    return trade;
}

FundingTickResult TradeExecutor::apply_funding_tick( std::string_view positionId, Storage::Timestamp now )
{
    check_initialized( );

    FundingTickResult result;
    result.amount = fixed_zero( );

    const auto snapshot = load_owned_perp_position( positionId, { } );
    if ( !snapshot.is_open( ) )
    {
        return result;
    }

    auto transaction = begin
    (
        {
            Storage::pool_key( snapshot.ownerId ),
            Storage::perp_market_key( snapshot.ticker ),
            Storage::perp_position_key( snapshot.id )
        }
    );

    auto position = *transaction->get_perp_position( snapshot.id );
    if ( !position.is_open( ) || now <= position.lastFundingAt )
    {
        return result;
    }

    const auto elapsedIntervals = ( now - position.lastFundingAt ) / _config.fundingInterval;
    if ( elapsedIntervals <= 0 )
    {
        return result;
    }
    result.periodsApplied = static_cast< uint64_t >( elapsedIntervals );

    auto market = transaction->get_perp_market( position.ticker );
    if ( !market )
    {
        throw Trading::ValidationError( fmt::format( "Unknown perpetual market: {}", position.ticker ) );
    }

    const FixedFloat hoursHeld = FixedFloat( _config.fundingInterval.count( ) ) * result.periodsApplied;
    const Trading::Quantity owed = Risk::funding_owed( position.side, position.size, market->fundingRate, hoursHeld );
    result.amount = owed;

    const std::string description = fmt::format( "Funding {} for {} period(s) on {}", position.ticker, result.periodsApplied, position.id );
    if ( owed > 0 )
    {
        const Trading::Quantity available = transaction->get_pool( position.ownerId )->availableBalance;
        const Trading::Quantity fromPool = std::min( owed, available );
        if ( fromPool > 0 )
        {
            _ledger.debit( *transaction, position.ownerId, fromPool, { Storage::BalanceTransactionType::perp_funding, description, position.id }, now );
        }

        // Whatever the pool cannot cover comes out of the posted margin.
        const Trading::Quantity shortfall = owed - fromPool;
        if ( shortfall > 0 )
        {
            position.margin = std::max( fixed_zero( ), Trading::Quantity( position.margin - shortfall ) );
        }
    }
    else if ( owed < 0 )
    {
        _ledger.credit( *transaction, position.ownerId, Trading::Quantity( -owed ), { Storage::BalanceTransactionType::perp_funding, description, position.id }, now );
    }

    auto pool = *transaction->get_pool( position.ownerId );
    pool.lifetimePnL -= owed;
    transaction->put_pool( pool );

    position.fundingPaid += owed;
    position.lastFundingAt += std::chrono::duration_cast< Storage::Timestamp::duration >( _config.fundingInterval * elapsedIntervals );
    position.lastUpdated = now;
    transaction->put_perp_position( position );

    transaction->commit( );

    WAGERFI_LOG_DEBUG( _logger )
        << fmt::format
        (
            "[{}] Funding on {} {} {}: {} period(s), owed: {}, total paid: {}",
            name( ),
            position.id,
            magic_enum::enum_name( position.side ),
            position.ticker,
            result.periodsApplied,
            owed,
            position.fundingPaid
        );

    return result;
}

std::optional< ExecutedTrade > TradeExecutor::check_liquidation( std::string_view positionId )
{
    check_initialized( );

    const auto snapshot = load_owned_perp_position( positionId, { } );
    if ( !snapshot.is_open( ) )
    {
        return std::nullopt;
    }

    const auto indexPrice = _priceFeed.get_index_price( snapshot.ticker );
    if ( !indexPrice )
    {
        WAGERFI_LOG_DEBUG( _logger ) << fmt::format( "[{}] No index price for {}, skipping {}", name( ), snapshot.ticker, snapshot.id );
        return std::nullopt;
    }

    const auto now = _clock( );
    auto transaction = begin
    (
        {
            Storage::pool_key( snapshot.ownerId ),
            Storage::perp_market_key( snapshot.ticker ),
            Storage::perp_position_key( snapshot.id )
        }
    );

    auto position = *transaction->get_perp_position( snapshot.id );
    if ( !position.is_open( ) )
    {
        return std::nullopt;
    }

    if ( Risk::should_liquidate( *indexPrice, position.liquidationPrice, position.side ) )
    {
        auto trade = stage_liquidation( *transaction, position, position.ownerId, now );
        transaction->commit( );
        untrack_perp_position( position );
        return trade;
    }

    const auto pnl = Risk::unrealized_pnl( position.entryPrice, *indexPrice, position.side, position.size );
    position.currentPrice = *indexPrice;
    position.unrealizedPnL = pnl.pnl;
    position.unrealizedPnLPercent = pnl.pnlPercent;
    position.lastUpdated = now;
    transaction->put_perp_position( position );
    transaction->commit( );

    return std::nullopt;
}

SettlementResult TradeExecutor::resolve_market( std::string_view marketId )
{
    check_initialized( );

    SettlementResult result;
    result.totalPayout = fixed_zero( );

    const auto outcome = _priceFeed.get_resolution_outcome( marketId );
    if ( !outcome )
    {
        WAGERFI_LOG_DEBUG( _logger ) << fmt::format( "[{}] Market {} has no final outcome yet", name( ), marketId );
        return result;
    }

    for ( uint32_t attempt = 0; attempt < resolution_lock_attempts( ); ++attempt )
    {
        std::vector< std::string > lockKeys{ Storage::prediction_market_key( marketId ) };
        TransparentStringSet poolIds;
        {
            auto view = read_view( );
            auto market = view->get_prediction_market( marketId );
            if ( !market )
            {
                throw Trading::ValidationError( fmt::format( "Unknown prediction market: {}", marketId ) );
            }
            if ( market->resolved )
            {
                result.resolved = true;
                result.outcome = market->outcome;
                return result;
            }
            for ( const auto & position : view->open_prediction_positions( marketId ) )
            {
                if ( poolIds.insert( position.poolId ).second )
                {
                    lockKeys.push_back( Storage::pool_key( position.poolId ) );
                }
            }
        }

        auto transaction = begin( std::move( lockKeys ) );
        auto market = *transaction->get_prediction_market( marketId );
        if ( market.resolved )
        {
            result.resolved = true;
            result.outcome = market.outcome;
            return result;
        }

        // Buys need the market lock, so the position set cannot grow while it is held.
        // It may have grown before, in which case the lock set is missing a pool.
        auto positions = transaction->open_prediction_positions( marketId );
        const bool lockSetComplete = std::all_of
        (
            positions.begin( ),
            positions.end( ),
            [ &poolIds ]( const auto & position ){ return poolIds.contains( position.poolId ); }
        );
        if ( !lockSetComplete )
        {
            continue;
        }

        const auto now = _clock( );
        const auto winningSide = *outcome ? Trading::OutcomeSide::yes : Trading::OutcomeSide::no;

        for ( auto & position : positions )
        {
            const Trading::Quantity payout = position.side == winningSide ? position.shares : fixed_zero( );
            const Trading::Quantity realizedPnL = payout - position.costBasis;

            if ( payout > 0 )
            {
                _ledger.credit
                (
                    *transaction,
                    position.poolId,
                    payout,
                    { Storage::BalanceTransactionType::prediction_settlement, fmt::format( "Settlement of {}", marketId ), position.id },
                    now
                );
            }

            auto pool = *transaction->get_pool( position.poolId );
            pool.lifetimePnL += realizedPnL;
            transaction->put_pool( pool );

            position.realizedPnL += realizedPnL;
            position.shares = fixed_zero( );
            position.costBasis = fixed_zero( );
            position.closedAt = now;
            transaction->put_prediction_position( position );

            ++result.positionsSettled;
            result.totalPayout += payout;
        }

        market.resolved = true;
        market.outcome = *outcome;
        market.liquidity -= result.totalPayout;
        transaction->put_prediction_market( market );
        transaction->commit( );

        result.resolved = true;
        result.outcome = *outcome;

        WAGERFI_LOG_INFO( _logger )
            << fmt::format
            (
                "[{}] Resolved {} as {}, settled {} position(s), paid out: {}",
                name( ),
                marketId,
                *outcome ? "yes" : "no",
                result.positionsSettled,
                result.totalPayout
            );

        return result;
    }

    throw Trading::ContentionError( fmt::format( "Could not lock a stable position set for market {}", marketId ) );
}

Amm::BuyQuote TradeExecutor::quote_buy( std::string_view marketId, Trading::OutcomeSide side, const Trading::Quantity & amount ) const
{
    auto market = read_view( )->get_prediction_market( marketId );
    if ( !market )
    {
        throw Trading::ValidationError( fmt::format( "Unknown prediction market: {}", marketId ) );
    }
    if ( market->resolved )
    {
        throw Trading::MarketClosedError( fmt::format( "Market {} is resolved", marketId ) );
    }
    return _amm.quote_buy( Amm::Reserves( market->yesReserve, market->noReserve ), side, amount );
}

Amm::SellQuote TradeExecutor::quote_sell( std::string_view marketId, Trading::OutcomeSide side, const Trading::Quantity & shares ) const
{
    auto market = read_view( )->get_prediction_market( marketId );
    if ( !market )
    {
        throw Trading::ValidationError( fmt::format( "Unknown prediction market: {}", marketId ) );
    }
    if ( market->resolved )
    {
        throw Trading::MarketClosedError( fmt::format( "Market {} is resolved", marketId ) );
    }
    return _amm.quote_sell( Amm::Reserves( market->yesReserve, market->noReserve ), side, shares );
}

std::vector< std::string > TradeExecutor::open_perp_position_ids( ) const
{
    std::scoped_lock lock( _positionIndexMutex );

    std::vector< std::string > positionIds;
    for ( const auto & [ _, tickerPositions ] : _openPerpPositionsByTicker )
    {
        positionIds.insert( positionIds.end( ), tickerPositions.begin( ), tickerPositions.end( ) );
    }
    return positionIds;
}

std::vector< std::string > TradeExecutor::expired_market_ids( ) const
{
    const auto now = _clock( );

    std::vector< std::string > marketIds;
    for ( const auto & market : _store.prediction_markets( ) )
    {
        if ( !market.resolved && market.endDate <= now )
        {
            marketIds.push_back( market.id );
        }
    }
    return marketIds;
}

void TradeExecutor::track_perp_position( const Storage::PerpPosition & position )
{
    std::scoped_lock lock( _positionIndexMutex );
    _openPerpPositionsByTicker[ position.ticker ].insert( position.id );
}

void TradeExecutor::untrack_perp_position( const Storage::PerpPosition & position )
{
    std::scoped_lock lock( _positionIndexMutex );

    const auto & findTicker = _openPerpPositionsByTicker.find( position.ticker );
    if ( findTicker != _openPerpPositionsByTicker.end( ) )
    {
        findTicker->second.erase( position.id );
    }
}

} // namespace Execution
} // namespace Wagerfi
