#pragma once

#include "wagerfi/Execution/TradeExecutionTypes.hpp"
#include "wagerfi/Execution/TradeExecutor.hpp"

#include "wagerfi/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <string>
#include <vector>

namespace Wagerfi
{
namespace Execution
{

class TradeExecutionImpl
{
public:
    TradeExecutionImpl
    (
        boost::asio::io_context & ioContext,
        Storage::Store & store,
        const Feed::PriceFeed & priceFeed,
        TradeExecutorConfig executorConfig
    );

    // Load the open position index.
    template< class CompletionHandlerType >
    void initialize( CompletionHandlerType && completionHandler )
    {
        boost::asio::co_spawn( _ioContext, do_initialize( ), completionHandler );
    }

    // Requests are not serialized here, conflicting trades wait on the store's row locks.
    template< class CompletionHandlerType >
    void execute_decision( TradingDecision decision, CompletionHandlerType && completionHandler )
    {
        boost::asio::co_spawn( _ioContext, do_execute_decision( std::move( decision ) ), completionHandler );
    }

    template< class CompletionHandlerType >
    void execute_decision_batch( std::vector< TradingDecision > decisions, CompletionHandlerType && completionHandler )
    {
        boost::asio::co_spawn( _ioContext, do_execute_decision_batch( std::move( decisions ) ), completionHandler );
    }

    template< class CompletionHandlerType >
    void quote_buy
    (
        std::string marketId,
        Trading::OutcomeSide side,
        Trading::Quantity amount,
        CompletionHandlerType && completionHandler
    )
    {
        boost::asio::co_spawn( _ioContext, do_quote_buy( std::move( marketId ), side, std::move( amount ) ), completionHandler );
    }

    template< class CompletionHandlerType >
    void quote_sell
    (
        std::string marketId,
        Trading::OutcomeSide side,
        Trading::Quantity shares,
        CompletionHandlerType && completionHandler
    )
    {
        boost::asio::co_spawn( _ioContext, do_quote_sell( std::move( marketId ), side, std::move( shares ) ), completionHandler );
    }

    TradeExecutor & executor( ) { return _executor; }

    std::string name( ) const { return "TradeExecution"; }

private:
    boost::asio::awaitable< void > do_initialize( );
    boost::asio::awaitable< ExecutedTrade > do_execute_decision( TradingDecision decision );
    boost::asio::awaitable< ExecutionResult > do_execute_decision_batch( std::vector< TradingDecision > decisions );
    boost::asio::awaitable< Amm::BuyQuote > do_quote_buy( std::string marketId, Trading::OutcomeSide side, Trading::Quantity amount );
    boost::asio::awaitable< Amm::SellQuote > do_quote_sell( std::string marketId, Trading::OutcomeSide side, Trading::Quantity shares );

    boost::asio::io_context & _ioContext;

    TradeExecutor _executor;

    mutable WagerfiLogger _logger;
};

} // namespace Execution
} // namespace Wagerfi
