#include "wagerfi/Storage/MemoryStore.hpp"

#include "wagerfi/Trading/TradeError.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace Wagerfi
{
namespace Storage
{

namespace
{

template< class RowType >
std::optional< RowType > find_row( const TransparentStringMap< RowType > & rows, std::string_view key )
{
    const auto & findRow = rows.find( key );
    if ( findRow == rows.end( ) )
    {
        return std::nullopt;
    }
    return findRow->second;
}

} // namespace

class MemoryStoreTransaction : public StoreTransaction
{
public:
    MemoryStoreTransaction( MemoryStore & store, std::vector< std::unique_lock< std::timed_mutex > > rowLocks )
        : _store( store )
        , _rowLocks( std::move( rowLocks ) )
    { }

    std::optional< Pool > get_pool( std::string_view poolId ) override
    {
        return read_row( _writes.pools, _store._pools, poolId );
    }

    void put_pool( const Pool & pool ) override
    {
        check_writable( );
        _writes.pools.insert_or_assign( pool.id, pool );
    }

    std::optional< PredictionMarket > get_prediction_market( std::string_view marketId ) override
    {
        return read_row( _writes.predictionMarkets, _store._predictionMarkets, marketId );
    }

    void put_prediction_market( const PredictionMarket & market ) override
    {
        check_writable( );
        _writes.predictionMarkets.insert_or_assign( market.id, market );
    }

    std::optional< PredictionPosition > get_prediction_position( std::string_view positionId ) override
    {
        return read_row( _writes.predictionPositions, _store._predictionPositions, positionId );
    }

    std::optional< PredictionPosition > find_open_prediction_position
    (
        std::string_view poolId,
        std::string_view marketId,
        Trading::OutcomeSide side
    ) override
    {
        auto matches = [ & ]( const PredictionPosition & position )
        {
            return position.is_open( )
                && position.poolId == poolId
                && position.marketId == marketId
                && position.side == side;
        };

        for ( const auto & [ _, position ] : _writes.predictionPositions )
        {
            if ( matches( position ) ) return position;
        }

        std::shared_lock dataLock( _store._dataMutex );
        for ( const auto & [ positionId, position ] : _store._predictionPositions )
        {
            // A staged copy supersedes the committed row, and it was checked above.
            if ( _writes.predictionPositions.contains( positionId ) ) continue;
            if ( matches( position ) ) return position;
        }
        return std::nullopt;
    }

    std::vector< PredictionPosition > open_prediction_positions( std::string_view marketId ) override
    {
        std::vector< PredictionPosition > positions;
        for ( const auto & [ _, position ] : _writes.predictionPositions )
        {
            if ( position.is_open( ) && position.marketId == marketId ) positions.push_back( position );
        }

        std::shared_lock dataLock( _store._dataMutex );
        for ( const auto & [ positionId, position ] : _store._predictionPositions )
        {
            if ( _writes.predictionPositions.contains( positionId ) ) continue;
            if ( position.is_open( ) && position.marketId == marketId ) positions.push_back( position );
        }
        return positions;
    }

    void put_prediction_position( const PredictionPosition & position ) override
    {
        check_writable( );
        _writes.predictionPositions.insert_or_assign( position.id, position );
    }

    std::optional< PerpMarket > get_perp_market( std::string_view ticker ) override
    {
        return read_row( _writes.perpMarkets, _store._perpMarkets, ticker );
    }

    void put_perp_market( const PerpMarket & market ) override
    {
        check_writable( );
        _writes.perpMarkets.insert_or_assign( market.ticker, market );
    }

    std::optional< PerpPosition > get_perp_position( std::string_view positionId ) override
    {
        return read_row( _writes.perpPositions, _store._perpPositions, positionId );
    }

    void put_perp_position( const PerpPosition & position ) override
    {
        check_writable( );
        _writes.perpPositions.insert_or_assign( position.id, position );
    }

    void append_balance_transaction( const BalanceTransaction & balanceTransaction ) override
    {
        check_writable( );
        _writes.balanceTransactions.push_back( balanceTransaction );
    }

    void append_trade_record( const TradeRecord & tradeRecord ) override
    {
        check_writable( );
        _writes.tradeRecords.push_back( tradeRecord );
    }

    std::string next_id( std::string_view prefix ) override
    {
        return _store.make_id( prefix );
    }

    void commit( ) override
    {
        check_writable( );
        _committed = true;

        _store.before_commit( _writes );
        _store.apply( std::move( _writes ) );
    }

private:
    template< class RowType >
    std::optional< RowType > read_row
    (
        const TransparentStringMap< RowType > & stagedRows,
        const TransparentStringMap< RowType > & committedRows,
        std::string_view key
    )
    {
        if ( auto staged = find_row( stagedRows, key ) )
        {
            return staged;
        }

        std::shared_lock dataLock( _store._dataMutex );
        return find_row( committedRows, key );
    }

    void check_writable( ) const
    {
        if ( _committed )
        {
            throw Trading::StorageError( "Transaction already committed" );
        }
    }

    MemoryStore & _store;
    std::vector< std::unique_lock< std::timed_mutex > > _rowLocks;
    MemoryStoreWrites _writes;
    bool _committed = false;
};

std::shared_ptr< std::timed_mutex > MemoryStore::row_lock( const std::string & key )
{
    std::scoped_lock rowLocksLock( _rowLocksMutex );

    auto & rowLock = _rowLocks[ key ];
    if ( !rowLock )
    {
        rowLock = std::make_shared< std::timed_mutex >( );
    }
    return rowLock;
}

std::unique_ptr< StoreTransaction > MemoryStore::begin
(
    std::vector< std::string > lockKeys,
    std::chrono::milliseconds lockTimeout
)
{
    std::sort( lockKeys.begin( ), lockKeys.end( ) );
    lockKeys.erase( std::unique( lockKeys.begin( ), lockKeys.end( ) ), lockKeys.end( ) );

    const auto deadline = std::chrono::steady_clock::now( ) + lockTimeout;

    // Row mutexes outlive the transaction through the shared_ptr held by the map.
    std::vector< std::unique_lock< std::timed_mutex > > rowLocks;
    rowLocks.reserve( lockKeys.size( ) );
    for ( const auto & key : lockKeys )
    {
        std::unique_lock< std::timed_mutex > rowLock( *row_lock( key ), std::defer_lock );
        if ( !rowLock.try_lock_until( deadline ) )
        {
            WAGERFI_LOG_DEBUG( _logger ) << fmt::format( "[{}] Lock timeout on: {}", name( ), key );
            throw Trading::ContentionError( fmt::format( "Timed out waiting for lock on {}", key ) );
        }
        rowLocks.push_back( std::move( rowLock ) );
    }

    return std::make_unique< MemoryStoreTransaction >( *this, std::move( rowLocks ) );
}

void MemoryStore::before_commit( const MemoryStoreWrites & )
{ }

void MemoryStore::apply( MemoryStoreWrites writes )
{
    std::unique_lock dataLock( _dataMutex );

    for ( auto & [ key, row ] : writes.pools ) _pools.insert_or_assign( key, std::move( row ) );
    for ( auto & [ key, row ] : writes.predictionMarkets ) _predictionMarkets.insert_or_assign( key, std::move( row ) );
    for ( auto & [ key, row ] : writes.predictionPositions ) _predictionPositions.insert_or_assign( key, std::move( row ) );
    for ( auto & [ key, row ] : writes.perpMarkets ) _perpMarkets.insert_or_assign( key, std::move( row ) );
    for ( auto & [ key, row ] : writes.perpPositions ) _perpPositions.insert_or_assign( key, std::move( row ) );

    std::move( writes.balanceTransactions.begin( ), writes.balanceTransactions.end( ), std::back_inserter( _balanceTransactions ) );
    std::move( writes.tradeRecords.begin( ), writes.tradeRecords.end( ), std::back_inserter( _tradeRecords ) );
}

std::string MemoryStore::make_id( std::string_view prefix )
{
    return fmt::format( "{}-{}", prefix, _nextId.fetch_add( 1 ) );
}

std::vector< PerpPosition > MemoryStore::open_perp_positions( )
{
    std::shared_lock dataLock( _dataMutex );

    std::vector< PerpPosition > positions;
    for ( const auto & [ _, position ] : _perpPositions )
    {
        if ( position.is_open( ) ) positions.push_back( position );
    }
    return positions;
}

std::vector< PredictionMarket > MemoryStore::prediction_markets( )
{
    std::shared_lock dataLock( _dataMutex );

    std::vector< PredictionMarket > markets;
    markets.reserve( _predictionMarkets.size( ) );
    for ( const auto & [ _, market ] : _predictionMarkets )
    {
        markets.push_back( market );
    }
    return markets;
}

std::vector< BalanceTransaction > MemoryStore::balance_transactions( std::string_view poolId )
{
    std::shared_lock dataLock( _dataMutex );

    std::vector< BalanceTransaction > history;
    std::copy_if
    (
        _balanceTransactions.begin( ),
        _balanceTransactions.end( ),
        std::back_inserter( history ),
        [ poolId ]( const auto & balanceTransaction ){ return balanceTransaction.poolId == poolId; }
    );
    return history;
}

std::vector< TradeRecord > MemoryStore::trade_records( )
{
    std::shared_lock dataLock( _dataMutex );
    return _tradeRecords;
}

void MemoryStore::insert_pool( Pool pool )
{
    std::unique_lock dataLock( _dataMutex );

    if ( pool.availableBalance > 0 )
    {
        BalanceTransaction deposit;
        deposit.id = make_id( "btx" );
        deposit.poolId = pool.id;
        deposit.type = BalanceTransactionType::deposit;
        deposit.amount = pool.availableBalance;
        deposit.balanceBefore = fixed_zero( );
        deposit.balanceAfter = pool.availableBalance;
        deposit.description = "Initial deposit";
        deposit.createdAt = std::chrono::system_clock::now( );
        _balanceTransactions.push_back( std::move( deposit ) );
    }

    auto poolId = pool.id;
    _pools.insert_or_assign( std::move( poolId ), std::move( pool ) );
}

void MemoryStore::insert_prediction_market( PredictionMarket market )
{
    std::unique_lock dataLock( _dataMutex );
    auto marketId = market.id;
    _predictionMarkets.insert_or_assign( std::move( marketId ), std::move( market ) );
}

void MemoryStore::insert_perp_market( PerpMarket market )
{
    std::unique_lock dataLock( _dataMutex );
    auto ticker = market.ticker;
    _perpMarkets.insert_or_assign( std::move( ticker ), std::move( market ) );
}

void MemoryStore::insert_perp_position( PerpPosition position )
{
    std::unique_lock dataLock( _dataMutex );
    auto positionId = position.id;
    _perpPositions.insert_or_assign( std::move( positionId ), std::move( position ) );
}

void MemoryStore::insert_prediction_position( PredictionPosition position )
{
    std::unique_lock dataLock( _dataMutex );
    auto positionId = position.id;
    _predictionPositions.insert_or_assign( std::move( positionId ), std::move( position ) );
}

} // namespace Storage
} // namespace Wagerfi
