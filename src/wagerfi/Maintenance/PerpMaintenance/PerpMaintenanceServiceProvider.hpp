#pragma once

#include "wagerfi/Maintenance/PerpMaintenanceTypes.hpp"

#include "wagerfi/Execution/TradeExecution/TradeExecutionService.hpp"

#include <boost/asio/async_result.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <memory>

namespace Wagerfi
{
namespace Maintenance
{

template< class Service >
class PerpMaintenanceServiceProvider
{
public:
    explicit PerpMaintenanceServiceProvider( Service & service )
        : _service( &service )
    { }

    PerpMaintenanceServiceProvider
    (
        boost::asio::io_context & ioContext,
        Execution::TradeExecutionService & tradeExecutionService,
        PerpMaintenanceConfig config
    )
        : _service( &boost::asio::make_service< Service >( ioContext, tradeExecutionService, std::move( config ) ) )
    { }

    template< boost::asio::completion_token_for< void( std::exception_ptr ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto start( CompletionToken && token = { } )
    {
        return boost::asio::async_initiate< CompletionToken, void( std::exception_ptr ) >
        (
            [ this ]< class Handler >( Handler && self )
            {
                _service->impl( ).start
                (
                    [ self = std::make_shared< Handler >( std::forward< Handler >( self ) ) ]( std::exception_ptr ex )
                    {
                        ( *self )( ex );
                    }
                );
            },
            token
        );
    }

    template< boost::asio::completion_token_for< void( std::exception_ptr ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto stop( CompletionToken && token = { } )
    {
        return boost::asio::async_initiate< CompletionToken, void( std::exception_ptr ) >
        (
            [ this ]< class Handler >( Handler && self )
            {
                _service->impl( ).stop
                (
                    [ self = std::make_shared< Handler >( std::forward< Handler >( self ) ) ]( std::exception_ptr ex )
                    {
                        ( *self )( ex );
                    }
                );
            },
            token
        );
    }

    // Funding ticks, liquidation checks and expired market settlement, once.
    template< boost::asio::completion_token_for< void( std::exception_ptr, MaintenanceSweepResult ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto sweep( CompletionToken && token = { } )
    {
        return boost::asio::async_initiate< CompletionToken, void( std::exception_ptr, MaintenanceSweepResult ) >
        (
            [ this ]< class Handler >( Handler && self )
            {
                _service->impl( ).sweep
                (
                    [ self = std::make_shared< Handler >( std::forward< Handler >( self ) ) ]( std::exception_ptr ex, MaintenanceSweepResult result )
                    {
                        ( *self )( ex, result );
                    }
                );
            },
            token
        );
    }

private:
    Service * _service;
};

} // namespace Maintenance
} // namespace Wagerfi
