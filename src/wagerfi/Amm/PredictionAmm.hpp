#pragma once

#include "wagerfi/Trading/Price.hpp"
#include "wagerfi/Trading/Quantity.hpp"
#include "wagerfi/Trading/Side.hpp"

namespace Wagerfi
{
namespace Amm
{

using Reserves = Trading::OutcomePair< Trading::Quantity >;

struct BuyQuote
{
    Trading::Quantity fee;
    Trading::Quantity netAmount;
    Trading::Quantity sharesOut;
    Reserves newReserves;
    Trading::Quantity totalCost;
    Trading::Price averagePrice;
    FixedFloat priceImpact;
};

struct SellQuote
{
    Trading::Quantity fee;
    Trading::Quantity grossProceeds;
    Trading::Quantity netProceeds;
    Reserves newReserves;
    Trading::Price averagePrice;
    FixedFloat priceImpact;
};

// Constant-product market maker for binary outcomes. Stateless apart from the fee rate,
// every quote is computed against the reserves passed in.
class PredictionAmm
{
public:
    explicit PredictionAmm( FixedFloat feeRate );

    // Collateral in, shares of `side` out. The fee is taken from the gross amount first
    // and only the net amount enters the pool, so yes * no is unchanged.
    BuyQuote quote_buy( const Reserves & reserves, Trading::OutcomeSide side, const Trading::Quantity & grossAmount ) const;

    // Shares of `side` in, collateral out. The fee is taken from the gross proceeds.
    SellQuote quote_sell( const Reserves & reserves, Trading::OutcomeSide side, const Trading::Quantity & sharesIn ) const;

    // Implied probability of `side`.
    static Trading::Price outcome_price( const Reserves & reserves, Trading::OutcomeSide side );

    static FixedFloat invariant( const Reserves & reserves );

    const FixedFloat & fee_rate( ) const { return _feeRate; }

private:
    static void check_reserves( const Reserves & reserves );

    FixedFloat _feeRate;
};

} // namespace Amm
} // namespace Wagerfi
