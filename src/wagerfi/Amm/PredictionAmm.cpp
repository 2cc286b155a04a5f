#include "wagerfi/Amm/PredictionAmm.hpp"

#include "wagerfi/Trading/TradeError.hpp"

#include <fmt/format.h>

namespace Wagerfi
{
namespace Amm
{

PredictionAmm::PredictionAmm( FixedFloat feeRate )
    : _feeRate( std::move( feeRate ) )
{
    if ( _feeRate < 0 || _feeRate >= 1 )
    {
        throw WagerfiError( fmt::format( "Invalid prediction fee rate: {}", _feeRate ) );
    }
}

void PredictionAmm::check_reserves( const Reserves & reserves )
{
    if ( reserves.yes( ) <= 0 || reserves.no( ) <= 0 )
    {
        throw Trading::InvalidTradeError
        (
            fmt::format( "Market reserves must be positive, yes: {}, no: {}", reserves.yes( ), reserves.no( ) )
        );
    }
}

FixedFloat PredictionAmm::invariant( const Reserves & reserves )
{
    return FixedFloat( reserves.yes( ) * reserves.no( ) );
}

Trading::Price PredictionAmm::outcome_price( const Reserves & reserves, Trading::OutcomeSide side )
{
    check_reserves( reserves );

    const Trading::Quantity & opposite = reserves.get( Trading::outcome_flip( side ) );
    return Trading::Price( opposite / ( reserves.yes( ) + reserves.no( ) ) );
}

BuyQuote PredictionAmm::quote_buy( const Reserves & reserves, Trading::OutcomeSide side, const Trading::Quantity & grossAmount ) const
{
    if ( grossAmount <= 0 )
    {
        throw Trading::ValidationError( fmt::format( "Buy amount must be positive, amount: {}", grossAmount ) );
    }
    check_reserves( reserves );

    const auto oppositeSide = Trading::outcome_flip( side );
    const FixedFloat k = invariant( reserves );

    BuyQuote quote;
    quote.fee = grossAmount * _feeRate;
    quote.netAmount = grossAmount - quote.fee;
    quote.totalCost = grossAmount;

    // The opposite reserve absorbs the collateral, the purchased side is solved from k.
    Trading::Quantity newOpposite = reserves.get( oppositeSide ) + quote.netAmount;
    Trading::Quantity newPurchased = k / newOpposite;

    if ( newPurchased <= 0 )
    {
        throw Trading::InvalidTradeError( fmt::format( "Buy of {} would drain the {} reserve", grossAmount, magic_enum::enum_name( side ) ) );
    }

    quote.sharesOut = reserves.get( side ) - newPurchased;
    if ( quote.sharesOut <= 0 )
    {
        throw Trading::InvalidTradeError( fmt::format( "Buy of {} yields no shares", grossAmount ) );
    }

    quote.newReserves.get( side ) = newPurchased;
    quote.newReserves.get( oppositeSide ) = newOpposite;

    quote.averagePrice = grossAmount / quote.sharesOut;

    const Trading::Price oldPrice = outcome_price( reserves, side );
    const Trading::Price newPrice = outcome_price( quote.newReserves, side );
    quote.priceImpact = ( newPrice - oldPrice ) / oldPrice;

    return quote;
}

SellQuote PredictionAmm::quote_sell( const Reserves & reserves, Trading::OutcomeSide side, const Trading::Quantity & sharesIn ) const
{
    if ( sharesIn <= 0 )
    {
        throw Trading::ValidationError( fmt::format( "Sell shares must be positive, shares: {}", sharesIn ) );
    }
    check_reserves( reserves );

    const auto oppositeSide = Trading::outcome_flip( side );
    const FixedFloat k = invariant( reserves );

    // Returned shares grow the sold side, the opposite reserve pays out.
    Trading::Quantity newSold = reserves.get( side ) + sharesIn;
    Trading::Quantity newOpposite = k / newSold;

    SellQuote quote;
    quote.grossProceeds = reserves.get( oppositeSide ) - newOpposite;
    if ( newOpposite <= 0 || quote.grossProceeds <= 0 )
    {
        throw Trading::InvalidTradeError( fmt::format( "Sell of {} shares would drain the opposite reserve", sharesIn ) );
    }

    quote.fee = quote.grossProceeds * _feeRate;
    quote.netProceeds = quote.grossProceeds - quote.fee;

    quote.newReserves.get( side ) = newSold;
    quote.newReserves.get( oppositeSide ) = newOpposite;

    quote.averagePrice = quote.grossProceeds / sharesIn;

    const Trading::Price oldPrice = outcome_price( reserves, side );
    const Trading::Price newPrice = outcome_price( quote.newReserves, side );
    quote.priceImpact = ( newPrice - oldPrice ) / oldPrice;

    return quote;
}

} // namespace Amm
} // namespace Wagerfi
