#pragma once

#include "wagerfi/Maintenance/PerpMaintenance/PerpMaintenanceImpl.hpp"

#include "wagerfi/Execution/TradeExecution/TradeExecutionService.hpp"

#include "wagerfi/Util/Logger.hpp"

#include <boost/asio/execution_context.hpp>
#include <boost/asio/io_context.hpp>

#include <thread>

namespace Wagerfi
{
namespace Maintenance
{

class PerpMaintenanceService : public boost::asio::execution_context::service
{
public:
    // Constructor creates a thread to run a private io_service.
    PerpMaintenanceService
    (
        boost::asio::execution_context & executionContext,
        Execution::TradeExecutionService & tradeExecutionService,
        PerpMaintenanceConfig config
    )
        : boost::asio::execution_context::service( executionContext )
        , _ioContext( )
        , _work( boost::asio::require( _ioContext.get_executor( ),
                 boost::asio::execution::outstanding_work.tracked ) )
        , _impl( _ioContext, tradeExecutionService.impl( ).executor( ), std::move( config ) )
        , _workThread( [ this ]( ){ return this->_ioContext.run( ); } )
    { }

    ~PerpMaintenanceService( )
    {
        // Indicate that we have finished with the private io_context.
        // io_context::run( ) function will exit once all other work has completed.
        _work = boost::asio::any_io_executor( );
        _ioContext.stop( );
    }

    PerpMaintenanceImpl & impl( ) { return _impl; }

    static inline boost::asio::execution_context::id id;

private:
    // Destroy all user-defined handler objects owned by the service.
    void shutdown( ) noexcept override
    {
        WAGERFI_LOG_DEBUG( _logger ) << "Shutting down PerpMaintenanceService";
    }

    // Private io_context used for performing operations on this thread.
    boost::asio::io_context _ioContext;
    // A work-tracking executor giving work for the private io_context to perform.
    boost::asio::any_io_executor _work;

    PerpMaintenanceImpl _impl;

    std::jthread _workThread;

    WagerfiLogger _logger;
};

} // namespace Maintenance
} // namespace Wagerfi
