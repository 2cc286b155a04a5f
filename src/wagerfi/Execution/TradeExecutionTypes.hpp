#pragma once

#include "wagerfi/Trading/Price.hpp"
#include "wagerfi/Trading/Quantity.hpp"
#include "wagerfi/Trading/Side.hpp"
#include "wagerfi/Trading/TradeError.hpp"

#include "wagerfi/Util/JsonUtils.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Wagerfi
{
namespace Execution
{

enum class TradeAction : uint8_t
{
    buy_yes,
    buy_no,
    sell,
    close_position,
    open_long,
    open_short,
    close_perp,
    hold
};

enum class MarketType : uint8_t
{
    prediction,
    perpetual
};

struct TradingDecision
{
    friend TradingDecision tag_invoke( json_to_tag< TradingDecision >, simdjson::ondemand::value jsonValue );

    std::string actorId;
    std::string actorName;
    std::string poolId;
    TradeAction action = TradeAction::hold;
    MarketType marketType = MarketType::prediction;
    std::string marketId;
    std::string ticker;
    std::string positionId;
    // Collateral for buys and opens, shares for sells.
    Trading::Quantity amount;
    std::optional< uint32_t > leverage;
    // Worst acceptable average price per share ( prediction ) or entry price ( perpetual ).
    std::optional< Trading::Price > priceLimit;
    double confidence = 0.0;
    std::string reasoning;
};

struct ExecutedTrade
{
    MarketType marketType = MarketType::prediction;
    TradeAction action = TradeAction::hold;
    std::string marketId;
    std::string positionId;
    std::optional< Trading::OutcomeSide > outcomeSide;
    std::optional< Trading::PerpSide > perpSide;
    // Shares for prediction trades, USD notional for perpetual trades.
    Trading::Quantity quantity;
    Trading::Quantity amountDebited;
    Trading::Quantity amountCredited;
    Trading::Quantity fee;
    Trading::Price executionPrice;
    Trading::Quantity realizedPnL;
    bool liquidated = false;

    // Collateral that changed hands.
    Trading::Quantity volume( ) const { return amountDebited > amountCredited ? amountDebited : amountCredited; }
};

struct ExecutionError
{
    std::string actorId;
    TradeAction action = TradeAction::hold;
    Trading::TradeErrorCode code = Trading::TradeErrorCode::validation;
    std::string message;
};

struct ExecutionResult
{
    uint64_t totalDecisions = 0;
    uint64_t successfulTrades = 0;
    uint64_t failedTrades = 0;
    uint64_t holdDecisions = 0;
    Trading::Quantity totalVolumePerp;
    Trading::Quantity totalVolumePrediction;
    std::vector< ExecutionError > errors;
    std::vector< ExecutedTrade > executedTrades;
};

// Collateral moved through one market by a set of trades.
struct TradeImpact
{
    MarketType marketType = MarketType::prediction;
    // Prediction market id or perpetual ticker.
    std::string marketId;
    uint64_t tradeCount = 0;
    Trading::Quantity totalVolume;
    // Positive towards yes / long, negative towards no / short.
    Trading::Quantity netVolume;
};

// One entry per market, in order of first appearance. Hold trades are skipped.
std::vector< TradeImpact > aggregate_trade_impacts( const std::vector< ExecutedTrade > & trades );

struct FundingTickResult
{
    uint64_t periodsApplied = 0;
    // Signed, positive when the position paid.
    Trading::Quantity amount;
};

struct SettlementResult
{
    bool resolved = false;
    std::optional< bool > outcome;
    uint64_t positionsSettled = 0;
    Trading::Quantity totalPayout;
};

struct TradeExecutorConfig
{
    friend TradeExecutorConfig tag_invoke( json_to_tag< TradeExecutorConfig >, simdjson::ondemand::value jsonValue );

    FixedFloat predictionFeeRate = FixedFloat( "0.01" );
    FixedFloat perpFeeRate = FixedFloat( "0.001" );
    uint32_t maxLeverage = 100;
    uint32_t defaultLeverage = 5;
    Trading::Quantity minPredictionAmount = Trading::Quantity( 1 );
    std::chrono::milliseconds lockTimeout = std::chrono::milliseconds( 250 );
    std::chrono::hours fundingInterval = std::chrono::hours( 8 );
};

struct TradeExecutionConfig
{
    friend TradeExecutionConfig tag_invoke( json_to_tag< TradeExecutionConfig >, simdjson::ondemand::value jsonValue );

    TradeExecutorConfig executorConfig;
    // Threads running decisions, trades on unrelated rows proceed in parallel.
    uint32_t workerThreads = 4;
};

constexpr bool is_perpetual_action( TradeAction action )
{
    return action == TradeAction::open_long || action == TradeAction::open_short || action == TradeAction::close_perp;
}

} // namespace Execution
} // namespace Wagerfi
