#include "wagerfi/Accounting/Ledger.hpp"

#include "wagerfi/Trading/TradeError.hpp"

#include <fmt/format.h>

#include <chrono>

namespace Wagerfi
{
namespace Accounting
{

Ledger::Ledger( Storage::Store & store )
    : _store( store )
{ }

Storage::Pool Ledger::load_pool( Storage::StoreTransaction & transaction, std::string_view poolId )
{
    auto pool = transaction.get_pool( poolId );
    if ( !pool )
    {
        throw Trading::ValidationError( fmt::format( "Unknown pool: {}", poolId ) );
    }
    return std::move( *pool );
}

Storage::BalanceTransaction Ledger::debit
(
    Storage::StoreTransaction & transaction,
    std::string_view poolId,
    const Trading::Quantity & amount,
    LedgerEntry entry,
    Storage::Timestamp now
) const
{
    if ( amount <= 0 )
    {
        throw Trading::ValidationError( fmt::format( "Debit amount must be positive, amount: {}", amount ) );
    }

    auto pool = load_pool( transaction, poolId );
    if ( pool.availableBalance < amount )
    {
        WAGERFI_LOG_DEBUG( _logger )
            << fmt::format( "[{}] Rejected debit of {} from pool {}, balance: {}", name( ), amount, poolId, pool.availableBalance );

        throw Trading::InsufficientFundsError
        (
            fmt::format( "Insufficient balance in pool {}: required {}, available {}", poolId, amount, pool.availableBalance )
        );
    }

    return post( transaction, std::move( pool ), Trading::Quantity( -amount ), std::move( entry ), now );
}

Storage::BalanceTransaction Ledger::credit
(
    Storage::StoreTransaction & transaction,
    std::string_view poolId,
    const Trading::Quantity & amount,
    LedgerEntry entry,
    Storage::Timestamp now
) const
{
    if ( amount <= 0 )
    {
        throw Trading::ValidationError( fmt::format( "Credit amount must be positive, amount: {}", amount ) );
    }

    return post( transaction, load_pool( transaction, poolId ), amount, std::move( entry ), now );
}

Storage::BalanceTransaction Ledger::post
(
    Storage::StoreTransaction & transaction,
    Storage::Pool pool,
    const Trading::Quantity & signedAmount,
    LedgerEntry entry,
    Storage::Timestamp now
) const
{
    Storage::BalanceTransaction balanceTransaction;
    balanceTransaction.id = transaction.next_id( "btx" );
    balanceTransaction.poolId = pool.id;
    balanceTransaction.type = entry.type;
    balanceTransaction.amount = signedAmount;
    balanceTransaction.balanceBefore = pool.availableBalance;
    balanceTransaction.balanceAfter = pool.availableBalance + signedAmount;
    balanceTransaction.relatedId = std::move( entry.relatedId );
    balanceTransaction.description = std::move( entry.description );
    balanceTransaction.createdAt = now;

    pool.availableBalance = balanceTransaction.balanceAfter;

    transaction.put_pool( pool );
    transaction.append_balance_transaction( balanceTransaction );

    WAGERFI_LOG_TRACE( _logger )
        << fmt::format
        (
            "[{}] Staged {} of {} on pool {}, balance: {} -> {}",
            name( ),
            magic_enum::enum_name( balanceTransaction.type ),
            signedAmount,
            pool.id,
            balanceTransaction.balanceBefore,
            balanceTransaction.balanceAfter
        );

    return balanceTransaction;
}

Trading::Quantity Ledger::balance( std::string_view poolId ) const
{
    auto transaction = _store.begin( { }, std::chrono::milliseconds( 0 ) );
    return load_pool( *transaction, poolId ).availableBalance;
}

std::vector< Storage::BalanceTransaction > Ledger::history( std::string_view poolId ) const
{
    return _store.balance_transactions( poolId );
}

} // namespace Accounting
} // namespace Wagerfi
