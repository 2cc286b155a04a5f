#pragma once

#include "wagerfi/Execution/TradeExecutionTypes.hpp"

#include "wagerfi/Amm/PredictionAmm.hpp"
#include "wagerfi/Feed/PriceFeed.hpp"
#include "wagerfi/Storage/Store.hpp"

#include <boost/asio/async_result.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <memory>
#include <string>
#include <vector>

namespace Wagerfi
{
namespace Execution
{

template< class Service >
class TradeExecutionServiceProvider
{
public:
    explicit TradeExecutionServiceProvider( Service & service )
        : _service( &service )
    { }

    TradeExecutionServiceProvider
    (
        boost::asio::io_context & ioContext,
        Storage::Store & store,
        const Feed::PriceFeed & priceFeed,
        TradeExecutionConfig config
    )
        : _service( &boost::asio::make_service< Service >( ioContext, store, priceFeed, std::move( config ) ) )
    { }

    // Load the open position index, required before the first decision.
    template< boost::asio::completion_token_for< void( std::exception_ptr ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto initialize( CompletionToken && token = { } )
    {
        return boost::asio::async_initiate< CompletionToken, void( std::exception_ptr ) >
        (
            [ this ]< class Handler >( Handler && self )
            {
                _service->impl( ).initialize
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

    // Validate and apply one decision, completes with the typed TradeError on failure.
    template< boost::asio::completion_token_for< void( std::exception_ptr, ExecutedTrade ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto execute_decision( TradingDecision decision, CompletionToken && token = { } )
    {
        return boost::asio::async_initiate< CompletionToken, void( std::exception_ptr, ExecutedTrade ) >
        (
            [ this, decision = std::move( decision ) ]< class Handler >( Handler && self )
            {
                _service->impl( ).execute_decision
                (
                    decision,
                    [ self = std::make_shared< Handler >( std::forward< Handler >( self ) ) ]( std::exception_ptr ex, ExecutedTrade trade )
                    {
                        ( *self )( ex, std::move( trade ) );
                    }
                );
            },
            token
        );
    }

    template< boost::asio::completion_token_for< void( std::exception_ptr, ExecutionResult ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto execute_decision_batch( std::vector< TradingDecision > decisions, CompletionToken && token = { } )
    {
        return boost::asio::async_initiate< CompletionToken, void( std::exception_ptr, ExecutionResult ) >
        (
            [ this, decisions = std::move( decisions ) ]< class Handler >( Handler && self )
            {
                _service->impl( ).execute_decision_batch
                (
                    decisions,
                    [ self = std::make_shared< Handler >( std::forward< Handler >( self ) ) ]( std::exception_ptr ex, ExecutionResult result )
                    {
                        ( *self )( ex, std::move( result ) );
                    }
                );
            },
            token
        );
    }

    // Preview a buy against the committed reserves.
    template< boost::asio::completion_token_for< void( std::exception_ptr, Amm::BuyQuote ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto quote_buy( std::string marketId, Trading::OutcomeSide side, Trading::Quantity amount, CompletionToken && token = { } )
    {
        return boost::asio::async_initiate< CompletionToken, void( std::exception_ptr, Amm::BuyQuote ) >
        (
            [ this, marketId = std::move( marketId ), side, amount = std::move( amount ) ]< class Handler >( Handler && self )
            {
                _service->impl( ).quote_buy
                (
                    marketId,
                    side,
                    amount,
                    [ self = std::make_shared< Handler >( std::forward< Handler >( self ) ) ]( std::exception_ptr ex, Amm::BuyQuote quote )
                    {
                        ( *self )( ex, std::move( quote ) );
                    }
                );
            },
            token
        );
    }

    // Preview a sell against the committed reserves.
    template< boost::asio::completion_token_for< void( std::exception_ptr, Amm::SellQuote ) > CompletionToken = boost::asio::use_awaitable_t< > >
    auto quote_sell( std::string marketId, Trading::OutcomeSide side, Trading::Quantity shares, CompletionToken && token = { } )
    {
        return boost::asio::async_initiate< CompletionToken, void( std::exception_ptr, Amm::SellQuote ) >
        (
            [ this, marketId = std::move( marketId ), side, shares = std::move( shares ) ]< class Handler >( Handler && self )
            {
                _service->impl( ).quote_sell
                (
                    marketId,
                    side,
                    shares,
                    [ self = std::make_shared< Handler >( std::forward< Handler >( self ) ) ]( std::exception_ptr ex, Amm::SellQuote quote )
                    {
                        ( *self )( ex, std::move( quote ) );
                    }
                );
            },
            token
        );
    }

    Service & service( ) { return *_service; }

private:
    Service * _service;
};

} // namespace Execution
} // namespace Wagerfi
