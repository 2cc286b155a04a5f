#pragma once

#include "wagerfi/Trading/Price.hpp"
#include "wagerfi/Trading/Quantity.hpp"
#include "wagerfi/Trading/Side.hpp"

#include <cstdint>

namespace Wagerfi
{
namespace Risk
{

struct UnrealizedPnl
{
    Trading::Quantity pnl;
    FixedFloat pnlPercent;
};

// Hard cap on leverage, markets and config may only lower it.
inline constexpr uint32_t max_leverage( ) { return 100; }

// Share of the margin that may be lost before a position is liquidated.
inline FixedFloat maintenance_loss_fraction( ) { return FixedFloat( "0.9" ); }

// Funding is settled three times a day.
inline constexpr uint32_t funding_periods_per_day( ) { return 3; }
inline constexpr uint32_t funding_period_hours( ) { return 8; }

// Mark price weights.
inline FixedFloat mark_index_weight( ) { return FixedFloat( "0.7" ); }
inline FixedFloat mark_last_trade_weight( ) { return FixedFloat( "0.3" ); }
inline FixedFloat mark_funding_premium_factor( ) { return FixedFloat( "0.01" ); }

Trading::Price liquidation_price( const Trading::Price & entryPrice, Trading::PerpSide side, uint32_t leverage );

UnrealizedPnl unrealized_pnl
(
    const Trading::Price & entryPrice,
    const Trading::Price & currentPrice,
    Trading::PerpSide side,
    const Trading::Quantity & size
);

// Positive result is owed by longs to shorts, `annualRate` is a decimal ( 0.01 == 1% ).
Trading::Quantity funding_payment( const Trading::Quantity & size, const FixedFloat & annualRate, const FixedFloat & hoursHeld );

// Signed funding owed by a position, positive means the position pays.
Trading::Quantity funding_owed
(
    Trading::PerpSide side,
    const Trading::Quantity & size,
    const FixedFloat & annualRate,
    const FixedFloat & hoursHeld
);

Trading::Price mark_price( const Trading::Price & indexPrice, const Trading::Price & lastTradePrice, const FixedFloat & fundingRate );

bool should_liquidate( const Trading::Price & currentPrice, const Trading::Price & liquidationPrice, Trading::PerpSide side );

Trading::Quantity margin_required( const Trading::Quantity & size, uint32_t leverage );

Trading::Quantity trading_fee( const Trading::Quantity & size, const FixedFloat & feeRate );

} // namespace Risk
} // namespace Wagerfi
