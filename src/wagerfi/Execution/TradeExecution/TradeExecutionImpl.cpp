#include "wagerfi/Execution/TradeExecution/TradeExecutionImpl.hpp"

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

namespace asio = boost::asio;

namespace Wagerfi
{
namespace Execution
{

TradeExecutionImpl::TradeExecutionImpl
(
    asio::io_context & ioContext,
    Storage::Store & store,
    const Feed::PriceFeed & priceFeed,
    TradeExecutorConfig executorConfig
)
    : _ioContext( ioContext )
    , _executor( store, priceFeed, std::move( executorConfig ) )
{ }

asio::awaitable< void > TradeExecutionImpl::do_initialize( )
{
    _executor.initialize( );
    co_return;
}

asio::awaitable< ExecutedTrade > TradeExecutionImpl::do_execute_decision( TradingDecision decision )
{
    WAGERFI_LOG_TRACE( _logger )
        << fmt::format
        (
            "[{}] Executing {} for {} ({}), confidence: {}",
            name( ),
            magic_enum::enum_name( decision.action ),
            decision.actorName,
            decision.actorId,
            decision.confidence
        );

    co_return _executor.execute_single_decision( decision );
}

asio::awaitable< ExecutionResult > TradeExecutionImpl::do_execute_decision_batch( std::vector< TradingDecision > decisions )
{
    co_return _executor.execute_decision_batch( decisions );
}

asio::awaitable< Amm::BuyQuote > TradeExecutionImpl::do_quote_buy( std::string marketId, Trading::OutcomeSide side, Trading::Quantity amount )
{
    co_return _executor.quote_buy( marketId, side, amount );
}

asio::awaitable< Amm::SellQuote > TradeExecutionImpl::do_quote_sell( std::string marketId, Trading::OutcomeSide side, Trading::Quantity shares )
{
    co_return _executor.quote_sell( marketId, side, shares );
}

} // namespace Execution
} // namespace Wagerfi
