#pragma once

#include "wagerfi/Storage/Store.hpp"

#include "wagerfi/Util/Logger.hpp"
#include "wagerfi/Util/StringHash.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Wagerfi
{
namespace Storage
{

// Writes staged by one transaction.
struct MemoryStoreWrites
{
    TransparentStringMap< Pool > pools;
    TransparentStringMap< PredictionMarket > predictionMarkets;
    TransparentStringMap< PredictionPosition > predictionPositions;
    TransparentStringMap< PerpMarket > perpMarkets;
    TransparentStringMap< PerpPosition > perpPositions;
    std::vector< BalanceTransaction > balanceTransactions;
    std::vector< TradeRecord > tradeRecords;
};

// In-process store with per-row timed locks. Used by the simulator and the tests, and as the
// reference for what a database backed store has to guarantee.
class MemoryStore : public Store
{
public:
    MemoryStore( ) = default;
    ~MemoryStore( ) override = default;

    std::unique_ptr< StoreTransaction > begin
    (
        std::vector< std::string > lockKeys,
        std::chrono::milliseconds lockTimeout
    ) override;

    std::vector< PerpPosition > open_perp_positions( ) override;
    std::vector< PredictionMarket > prediction_markets( ) override;
    std::vector< BalanceTransaction > balance_transactions( std::string_view poolId ) override;
    std::vector< TradeRecord > trade_records( ) override;

    // Seeding, outside of any transaction. A pool seeded with a balance gets a deposit entry.
    void insert_pool( Pool pool );
    void insert_prediction_market( PredictionMarket market );
    void insert_perp_market( PerpMarket market );
    void insert_perp_position( PerpPosition position );
    void insert_prediction_position( PredictionPosition position );

    std::string name( ) const { return "MemoryStore"; }

protected:
    // Called with the staged writes before any of them is applied, throwing aborts the commit.
    virtual void before_commit( const MemoryStoreWrites & writes );

private:
    friend class MemoryStoreTransaction;

    std::shared_ptr< std::timed_mutex > row_lock( const std::string & key );

    void apply( MemoryStoreWrites writes );

    std::string make_id( std::string_view prefix );

    mutable std::shared_mutex _dataMutex;
    TransparentStringMap< Pool > _pools;
    TransparentStringMap< PredictionMarket > _predictionMarkets;
    TransparentStringMap< PredictionPosition > _predictionPositions;
    TransparentStringMap< PerpMarket > _perpMarkets;
    TransparentStringMap< PerpPosition > _perpPositions;
    std::vector< BalanceTransaction > _balanceTransactions;
    std::vector< TradeRecord > _tradeRecords;

    std::mutex _rowLocksMutex;
    TransparentStringMap< std::shared_ptr< std::timed_mutex > > _rowLocks;

    std::atomic< uint64_t > _nextId = 1;

    mutable WagerfiLogger _logger;
};

} // namespace Storage
} // namespace Wagerfi
