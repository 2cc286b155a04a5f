#pragma once

#include "wagerfi/Util/Utils.hpp"

#include <cstdint>
#include <string>

namespace Wagerfi
{
namespace Trading
{

enum class TradeErrorCode : uint8_t
{
    validation,
    market_closed,
    insufficient_funds,
    invalid_trade,
    slippage_exceeded,
    position_not_found,
    contention,
    liquidation_conflict,
    storage
};

// Base of every error a trade can fail with. Nothing has been written when one is thrown.
class TradeError : public WagerfiError
{
public:
    TradeError( TradeErrorCode code, const std::string & message )
        : WagerfiError( message )
        , _code( code )
    { }

    TradeErrorCode code( ) const { return _code; }

    // Only lock contention is worth retrying unchanged.
    bool retryable( ) const { return _code == TradeErrorCode::contention; }

private:
    TradeErrorCode _code;
};

#define WAGERFI_DECLARE_TRADE_ERROR( ErrorName, errorCode ) \
class ErrorName : public TradeError \
{ \
public: \
    explicit ErrorName( const std::string & message ) \
        : TradeError( TradeErrorCode::errorCode, message ) \
    { } \
};

WAGERFI_DECLARE_TRADE_ERROR( ValidationError, validation )
WAGERFI_DECLARE_TRADE_ERROR( MarketClosedError, market_closed )
WAGERFI_DECLARE_TRADE_ERROR( InsufficientFundsError, insufficient_funds )
WAGERFI_DECLARE_TRADE_ERROR( InvalidTradeError, invalid_trade )
WAGERFI_DECLARE_TRADE_ERROR( SlippageExceededError, slippage_exceeded )
WAGERFI_DECLARE_TRADE_ERROR( PositionNotFoundError, position_not_found )
WAGERFI_DECLARE_TRADE_ERROR( ContentionError, contention )
WAGERFI_DECLARE_TRADE_ERROR( LiquidationConflictError, liquidation_conflict )
WAGERFI_DECLARE_TRADE_ERROR( StorageError, storage )

#undef WAGERFI_DECLARE_TRADE_ERROR

} // namespace Trading
} // namespace Wagerfi
