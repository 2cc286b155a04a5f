#pragma once

#include "wagerfi/Execution/TradeExecution/TradeExecutionImpl.hpp"

#include "wagerfi/Util/Logger.hpp"

#include <boost/asio/execution_context.hpp>
#include <boost/asio/io_context.hpp>

#include <thread>
#include <vector>

namespace Wagerfi
{
namespace Execution
{

class TradeExecutionService : public boost::asio::execution_context::service
{
public:
    // Constructor creates `workerThreads` threads to run a private io_context.
    TradeExecutionService
    (
        boost::asio::execution_context & executionContext,
        Storage::Store & store,
        const Feed::PriceFeed & priceFeed,
        TradeExecutionConfig config
    );

    ~TradeExecutionService( )
    {
        // Indicate that we have finished with the private io_context.
        // io_context::run( ) function will exit once all other work has completed.
        _work = boost::asio::any_io_executor( );
    }

    TradeExecutionImpl & impl( ) { return _impl; }

    static inline boost::asio::execution_context::id id;

private:
    // Destroy all user-defined handler objects owned by the service.
    void shutdown( ) noexcept override
    {
        WAGERFI_LOG_DEBUG( _logger ) << "Shutting down TradeExecutionService";
    }

    // Private io_context used for performing operations on the worker threads.
    boost::asio::io_context _ioContext;
    // A work-tracking executor giving work for the private io_context to perform.
    boost::asio::any_io_executor _work;

    TradeExecutionImpl _impl;

    // Declared last so the workers are joined before the impl is destroyed.
    std::vector< std::jthread > _workThreads;

    WagerfiLogger _logger;
};

} // namespace Execution
} // namespace Wagerfi
