#pragma once

#include "wagerfi/Trading/Price.hpp"
#include "wagerfi/Trading/Quantity.hpp"
#include "wagerfi/Trading/Side.hpp"

#include "wagerfi/Util/JsonUtils.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace Wagerfi
{
namespace Storage
{

using Timestamp = std::chrono::system_clock::time_point;

struct PredictionMarket
{
    friend PredictionMarket tag_invoke( json_to_tag< PredictionMarket >, simdjson::ondemand::value jsonValue );

    std::string id;
    std::string question;
    Trading::Quantity yesReserve;
    Trading::Quantity noReserve;
    // Net collateral that has entered the market.
    Trading::Quantity liquidity;
    bool resolved = false;
    std::optional< bool > outcome;
    Timestamp endDate;
};

struct Pool
{
    friend Pool tag_invoke( json_to_tag< Pool >, simdjson::ondemand::value jsonValue );

    std::string id;
    std::string ownerId;
    Trading::Quantity availableBalance;
    Trading::Quantity totalDeposits;
    Trading::Quantity lifetimePnL;
    Trading::Quantity totalFeesCollected;
};

struct PredictionPosition
{
    std::string id;
    std::string poolId;
    std::string marketId;
    Trading::OutcomeSide side = Trading::OutcomeSide::yes;
    Trading::Quantity shares;
    // Collateral paid net of fees for the shares still held.
    Trading::Quantity costBasis;
    Trading::Quantity realizedPnL;
    Timestamp openedAt;
    std::optional< Timestamp > closedAt;

    bool is_open( ) const { return !closedAt.has_value( ); }
};

struct PerpMarket
{
    friend PerpMarket tag_invoke( json_to_tag< PerpMarket >, simdjson::ondemand::value jsonValue );

    std::string ticker;
    // Annual funding rate as a decimal.
    FixedFloat fundingRate;
    Trading::Price lastTradePrice;
    uint32_t maxLeverage = 100;
    Trading::Quantity minOrderSize;
    Trading::Quantity openInterest;
};

enum class PerpPositionStatus : uint8_t
{
    open,
    closed,
    liquidated
};

struct PerpPosition
{
    std::string id;
    std::string ownerId;
    std::string ticker;
    Trading::PerpSide side = Trading::PerpSide::long_side;
    Trading::Price entryPrice;
    Trading::Price currentPrice;
    Trading::Quantity size;
    Trading::Quantity margin;
    uint32_t leverage = 1;
    Trading::Price liquidationPrice;
    Trading::Quantity unrealizedPnL;
    FixedFloat unrealizedPnLPercent;
    Trading::Quantity fundingPaid;
    Trading::Quantity realizedPnL;
    PerpPositionStatus status = PerpPositionStatus::open;
    Timestamp openedAt;
    Timestamp lastUpdated;
    Timestamp lastFundingAt;
    std::optional< Timestamp > closedAt;

    bool is_open( ) const { return status == PerpPositionStatus::open; }
};

enum class BalanceTransactionType : uint8_t
{
    deposit,
    prediction_buy,
    prediction_sell,
    prediction_settlement,
    perp_open,
    perp_close,
    perp_liquidation,
    perp_funding
};

struct BalanceTransaction
{
    std::string id;
    std::string poolId;
    BalanceTransactionType type = BalanceTransactionType::deposit;
    // Signed, negative for debits.
    Trading::Quantity amount;
    Trading::Quantity balanceBefore;
    Trading::Quantity balanceAfter;
    std::string relatedId;
    std::string description;
    Timestamp createdAt;
};

struct TradeRecord
{
    std::string id;
    std::string actorId;
    std::string poolId;
    std::string marketType;
    std::string marketId;
    std::string action;
    std::string side;
    Trading::Quantity amount;
    Trading::Price price;
    std::string reason;
    Timestamp createdAt;
};

// Lock keys, ordered so every transaction acquires rows in the same sequence.
std::string pool_key( std::string_view poolId );
std::string prediction_market_key( std::string_view marketId );
std::string prediction_position_key( std::string_view positionId );
std::string perp_market_key( std::string_view ticker );
std::string perp_position_key( std::string_view positionId );

Timestamp timestamp_from_seconds( uint64_t secondsSinceEpoch );

} // namespace Storage
} // namespace Wagerfi
