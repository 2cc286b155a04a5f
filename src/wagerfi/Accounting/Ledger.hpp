#pragma once

#include "wagerfi/Storage/Store.hpp"

#include "wagerfi/Util/Logger.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace Wagerfi
{
namespace Accounting
{

struct LedgerEntry
{
    Storage::BalanceTransactionType type;
    std::string description;
    std::string relatedId;
};

// The only writer of pool balances. Every balance change is staged on the caller's
// transaction together with one append-only BalanceTransaction, so it commits or
// rolls back with the rest of the caller's writes.
class Ledger
{
public:
    explicit Ledger( Storage::Store & store );

    // Throws InsufficientFundsError, and stages nothing, when the pool cannot cover `amount`.
    Storage::BalanceTransaction debit
    (
        Storage::StoreTransaction & transaction,
        std::string_view poolId,
        const Trading::Quantity & amount,
        LedgerEntry entry,
        Storage::Timestamp now
    ) const;

    Storage::BalanceTransaction credit
    (
        Storage::StoreTransaction & transaction,
        std::string_view poolId,
        const Trading::Quantity & amount,
        LedgerEntry entry,
        Storage::Timestamp now
    ) const;

    // Committed balance of a pool.
    Trading::Quantity balance( std::string_view poolId ) const;

    std::vector< Storage::BalanceTransaction > history( std::string_view poolId ) const;

    std::string name( ) const { return "Ledger"; }

private:
    Storage::BalanceTransaction post
    (
        Storage::StoreTransaction & transaction,
        Storage::Pool pool,
        const Trading::Quantity & signedAmount,
        LedgerEntry entry,
        Storage::Timestamp now
    ) const;

    static Storage::Pool load_pool( Storage::StoreTransaction & transaction, std::string_view poolId );

    Storage::Store & _store;

    mutable WagerfiLogger _logger;
};

} // namespace Accounting
} // namespace Wagerfi
