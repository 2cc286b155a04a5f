#pragma once

#include "wagerfi/Maintenance/PerpMaintenanceTypes.hpp"

#include "wagerfi/Execution/TradeExecutor.hpp"

#include "wagerfi/Util/Logger.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/high_resolution_timer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <string>

namespace Wagerfi
{
namespace Maintenance
{

class PerpMaintenanceImpl
{
public:
    PerpMaintenanceImpl
    (
        boost::asio::io_context & ioContext,
        Execution::TradeExecutor & tradeExecutor,
        PerpMaintenanceConfig config
    );

    // Start the periodic sweep, completes once the loop is scheduled.
    template< class CompletionHandlerType >
    void start( CompletionHandlerType && completionHandler )
    {
        boost::asio::co_spawn( _strand, do_start( ), completionHandler );
    }

    // Run a single sweep now.
    template< class CompletionHandlerType >
    void sweep( CompletionHandlerType && completionHandler )
    {
        boost::asio::co_spawn( _strand, do_sweep( ), completionHandler );
    }

    template< class CompletionHandlerType >
    void stop( CompletionHandlerType && completionHandler )
    {
        boost::asio::co_spawn( _strand, do_stop( ), completionHandler );
    }

    std::string name( ) const { return "PerpMaintenance"; }

private:
    boost::asio::awaitable< void > do_start( );
    boost::asio::awaitable< void > do_stop( );
    boost::asio::awaitable< MaintenanceSweepResult > do_sweep( );

    boost::asio::awaitable< void > do_maintain( );

    MaintenanceSweepResult run_sweep( );

    boost::asio::strand< boost::asio::io_context::executor_type > _strand;

    Execution::TradeExecutor & _tradeExecutor;
    PerpMaintenanceConfig _config;

    boost::asio::high_resolution_timer _sweepTimer;

    bool _running = false;

    mutable WagerfiLogger _logger;
};

} // namespace Maintenance
} // namespace Wagerfi
