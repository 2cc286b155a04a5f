#pragma once

#include "wagerfi/Storage/StorageTypes.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Wagerfi
{
namespace Storage
{

// One unit of work against the store. Rows named in the lock set handed to
// Store::begin are held exclusively until the transaction is destroyed.
// Writes are staged and only become visible on commit( ); a transaction
// destroyed without commit( ) discards them.
class StoreTransaction
{
public:
    virtual ~StoreTransaction( ) = default;

    virtual std::optional< Pool > get_pool( std::string_view poolId ) = 0;
    virtual void put_pool( const Pool & pool ) = 0;

    virtual std::optional< PredictionMarket > get_prediction_market( std::string_view marketId ) = 0;
    virtual void put_prediction_market( const PredictionMarket & market ) = 0;

    virtual std::optional< PredictionPosition > get_prediction_position( std::string_view positionId ) = 0;
    // The open position of a pool on one side of a market, if any.
    virtual std::optional< PredictionPosition > find_open_prediction_position
    (
        std::string_view poolId,
        std::string_view marketId,
        Trading::OutcomeSide side
    ) = 0;
    virtual std::vector< PredictionPosition > open_prediction_positions( std::string_view marketId ) = 0;
    virtual void put_prediction_position( const PredictionPosition & position ) = 0;

    virtual std::optional< PerpMarket > get_perp_market( std::string_view ticker ) = 0;
    virtual void put_perp_market( const PerpMarket & market ) = 0;

    virtual std::optional< PerpPosition > get_perp_position( std::string_view positionId ) = 0;
    virtual void put_perp_position( const PerpPosition & position ) = 0;

    virtual void append_balance_transaction( const BalanceTransaction & balanceTransaction ) = 0;
    virtual void append_trade_record( const TradeRecord & tradeRecord ) = 0;

    // Unique row id with the given prefix.
    virtual std::string next_id( std::string_view prefix ) = 0;

    // Applies every staged write or none. Throws Trading::StorageError on failure.
    virtual void commit( ) = 0;
};

class Store
{
public:
    virtual ~Store( ) = default;

    // Acquires every lock key before returning, throws Trading::ContentionError when
    // a key cannot be acquired within `lockTimeout`. An empty lock set gives a read-only view.
    virtual std::unique_ptr< StoreTransaction > begin
    (
        std::vector< std::string > lockKeys,
        std::chrono::milliseconds lockTimeout
    ) = 0;

    // Committed reads, no locking.
    virtual std::vector< PerpPosition > open_perp_positions( ) = 0;
    virtual std::vector< PredictionMarket > prediction_markets( ) = 0;
    virtual std::vector< BalanceTransaction > balance_transactions( std::string_view poolId ) = 0;
    virtual std::vector< TradeRecord > trade_records( ) = 0;
};

} // namespace Storage
} // namespace Wagerfi
