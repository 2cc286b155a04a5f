#pragma once

#include "wagerfi/Util/JsonUtils.hpp"

#include <chrono>
#include <cstdint>

namespace Wagerfi
{
namespace Maintenance
{

struct PerpMaintenanceConfig
{
    friend PerpMaintenanceConfig tag_invoke( json_to_tag< PerpMaintenanceConfig >, simdjson::ondemand::value jsonValue );

    std::chrono::milliseconds sweepInterval = std::chrono::seconds( 60 );
    // Settle expired prediction markets during the sweep.
    bool resolveExpiredMarkets = true;
};

struct MaintenanceSweepResult
{
    uint64_t positionsChecked = 0;
    uint64_t fundingTicks = 0;
    uint64_t liquidations = 0;
    uint64_t marketsResolved = 0;
    // Contended rows, picked up again on the next sweep.
    uint64_t deferred = 0;
    uint64_t failures = 0;
};

} // namespace Maintenance
} // namespace Wagerfi
