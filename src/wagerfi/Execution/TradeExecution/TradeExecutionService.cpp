#include "wagerfi/Execution/TradeExecution/TradeExecutionService.hpp"

#include <fmt/format.h>

namespace asio = boost::asio;

namespace Wagerfi
{
namespace Execution
{

TradeExecutionService::TradeExecutionService
(
    asio::execution_context & executionContext,
    Storage::Store & store,
    const Feed::PriceFeed & priceFeed,
    TradeExecutionConfig config
)
    : asio::execution_context::service( executionContext )
    , _ioContext( static_cast< int >( config.workerThreads ) )
    , _work( asio::require( _ioContext.get_executor( ), asio::execution::outstanding_work.tracked ) )
    , _impl( _ioContext, store, priceFeed, std::move( config.executorConfig ) )
{
    _workThreads.reserve( config.workerThreads );
    for ( uint32_t threadIndex = 0; threadIndex < config.workerThreads; ++threadIndex )
    {
        _workThreads.emplace_back( [ this ]( ){ return this->_ioContext.run( ); } );
    }

    WAGERFI_LOG_DEBUG( _logger ) << fmt::format( "Started TradeExecutionService with {} worker thread(s)", config.workerThreads );
}

} // namespace Execution
} // namespace Wagerfi
