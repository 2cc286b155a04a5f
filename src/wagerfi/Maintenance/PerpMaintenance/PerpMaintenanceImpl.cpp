#include "wagerfi/Maintenance/PerpMaintenance/PerpMaintenanceImpl.hpp"

#include "wagerfi/Trading/TradeError.hpp"

#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace asio = boost::asio;

namespace Wagerfi
{
namespace Maintenance
{

PerpMaintenanceImpl::PerpMaintenanceImpl
(
    asio::io_context & ioContext,
    Execution::TradeExecutor & tradeExecutor,
    PerpMaintenanceConfig config
)
    : _strand( ioContext.get_executor( ) )
    , _tradeExecutor( tradeExecutor )
    , _config( std::move( config ) )
    , _sweepTimer( _strand )
{ }

MaintenanceSweepResult PerpMaintenanceImpl::run_sweep( )
{
    MaintenanceSweepResult result;
    const auto now = _tradeExecutor.now( );

    for ( const auto & positionId : _tradeExecutor.open_perp_position_ids( ) )
    {
        ++result.positionsChecked;
        try
        {
            if ( _tradeExecutor.apply_funding_tick( positionId, now ).periodsApplied > 0 )
            {
                ++result.fundingTicks;
            }
            if ( _tradeExecutor.check_liquidation( positionId ) )
            {
                ++result.liquidations;
            }
        }
        catch ( const Trading::ContentionError & ex )
        {
            ++result.deferred;
            WAGERFI_LOG_WARNING( _logger ) << fmt::format( "[{}] Deferring {}: {}", name( ), positionId, ex.what( ) );
        }
        catch ( const Trading::TradeError & ex )
        {
            ++result.failures;
            WAGERFI_LOG_ERROR( _logger ) << fmt::format( "[{}] Maintenance of {} failed: {}", name( ), positionId, ex.what( ) );
        }
    }

    if ( _config.resolveExpiredMarkets )
    {
        for ( const auto & marketId : _tradeExecutor.expired_market_ids( ) )
        {
            try
            {
                if ( _tradeExecutor.resolve_market( marketId ).resolved )
                {
                    ++result.marketsResolved;
                }
            }
            catch ( const Trading::ContentionError & ex )
            {
                ++result.deferred;
                WAGERFI_LOG_WARNING( _logger ) << fmt::format( "[{}] Deferring resolution of {}: {}", name( ), marketId, ex.what( ) );
            }
            catch ( const Trading::TradeError & ex )
            {
                ++result.failures;
                WAGERFI_LOG_ERROR( _logger ) << fmt::format( "[{}] Resolution of {} failed: {}", name( ), marketId, ex.what( ) );
            }
        }
    }

    WAGERFI_LOG_DEBUG( _logger )
        << fmt::format
        (
            "[{}] Sweep done, positions: {}, funding ticks: {}, liquidations: {}, resolved: {}, deferred: {}, failures: {}",
            name( ),
            result.positionsChecked,
            result.fundingTicks,
            result.liquidations,
            result.marketsResolved,
            result.deferred,
            result.failures
        );

    return result;
}

asio::awaitable< void > PerpMaintenanceImpl::do_maintain( )
{
    boost::system::error_code errorCode;

    do
    {
        run_sweep( );

        _sweepTimer.expires_after( _config.sweepInterval );
        co_await _sweepTimer.async_wait( asio::redirect_error( asio::use_awaitable, errorCode ) );
    }
    while( !errorCode && _running );

    WAGERFI_LOG_INFO( _logger ) << fmt::format( "[{}] Sweep loop stopped: {}", name( ), errorCode.message( ) );
    co_return;
}

asio::awaitable< void > PerpMaintenanceImpl::do_start( )
{
    if ( _running )
    {
        co_return;
    }
    _running = true;

    WAGERFI_LOG_INFO( _logger ) << fmt::format( "[{}] Starting, sweep interval: {}", name( ), _config.sweepInterval );

    co_spawn( _strand, do_maintain( ), asio::detached );
    co_return;
}

asio::awaitable< void > PerpMaintenanceImpl::do_stop( )
{
    _running = false;
    _sweepTimer.cancel( );
    co_return;
}

asio::awaitable< MaintenanceSweepResult > PerpMaintenanceImpl::do_sweep( )
{
    co_return run_sweep( );
}

} // namespace Maintenance
} // namespace Wagerfi
