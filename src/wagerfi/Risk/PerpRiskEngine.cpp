#include "wagerfi/Risk/PerpRiskEngine.hpp"

#include "wagerfi/Trading/TradeError.hpp"

#include <fmt/format.h>

namespace Wagerfi
{
namespace Risk
{

static void check_leverage( uint32_t leverage )
{
    if ( leverage == 0 )
    {
        throw Trading::ValidationError( "Leverage must be at least 1" );
    }
}

Trading::Price liquidation_price( const Trading::Price & entryPrice, Trading::PerpSide side, uint32_t leverage )
{
    check_leverage( leverage );

    const FixedFloat threshold = maintenance_loss_fraction( ) / leverage;

    switch ( side )
    {
        case Trading::PerpSide::long_side:
            return Trading::Price( entryPrice * ( 1 - threshold ) );
        case Trading::PerpSide::short_side:
            return Trading::Price( entryPrice * ( 1 + threshold ) );
    }
    throw WagerfiError( "Invalid PerpSide" );
}

UnrealizedPnl unrealized_pnl
(
    const Trading::Price & entryPrice,
    const Trading::Price & currentPrice,
    Trading::PerpSide side,
    const Trading::Quantity & size
)
{
    if ( entryPrice <= 0 )
    {
        throw Trading::ValidationError( fmt::format( "Entry price must be positive, entry: {}", entryPrice ) );
    }

    FixedFloat priceChange = ( currentPrice - entryPrice ) / entryPrice;
    if ( side == Trading::PerpSide::short_side )
    {
        priceChange = -priceChange;
    }

    UnrealizedPnl result;
    result.pnl = size * priceChange;
    result.pnlPercent = priceChange * 100;
    return result;
}

Trading::Quantity funding_payment( const Trading::Quantity & size, const FixedFloat & annualRate, const FixedFloat & hoursHeld )
{
    const FixedFloat periodRate = annualRate / ( 365 * funding_periods_per_day( ) );
    return Trading::Quantity( size * periodRate * ( hoursHeld / funding_period_hours( ) ) );
}

Trading::Quantity funding_owed
(
    Trading::PerpSide side,
    const Trading::Quantity & size,
    const FixedFloat & annualRate,
    const FixedFloat & hoursHeld
)
{
    Trading::Quantity payment = funding_payment( size, annualRate, hoursHeld );
    return side == Trading::PerpSide::long_side ? payment : Trading::Quantity( -payment );
}

Trading::Price mark_price( const Trading::Price & indexPrice, const Trading::Price & lastTradePrice, const FixedFloat & fundingRate )
{
    const Trading::Price weighted = indexPrice * mark_index_weight( ) + lastTradePrice * mark_last_trade_weight( );
    return Trading::Price( weighted * ( 1 + fundingRate * mark_funding_premium_factor( ) ) );
}

bool should_liquidate( const Trading::Price & currentPrice, const Trading::Price & liquidationPrice, Trading::PerpSide side )
{
    switch ( side )
    {
        case Trading::PerpSide::long_side:
            return currentPrice <= liquidationPrice;
        case Trading::PerpSide::short_side:
            return currentPrice >= liquidationPrice;
    }
    return false;
}

Trading::Quantity margin_required( const Trading::Quantity & size, uint32_t leverage )
{
    check_leverage( leverage );
    return Trading::Quantity( size / leverage );
}

Trading::Quantity trading_fee( const Trading::Quantity & size, const FixedFloat & feeRate )
{
    return Trading::Quantity( size * feeRate );
}

} // namespace Risk
} // namespace Wagerfi
