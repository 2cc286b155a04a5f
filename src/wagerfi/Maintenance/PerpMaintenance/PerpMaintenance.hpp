#pragma once

#include "wagerfi/Maintenance/PerpMaintenance/PerpMaintenanceService.hpp"
#include "wagerfi/Maintenance/PerpMaintenance/PerpMaintenanceServiceProvider.hpp"

namespace Wagerfi
{
namespace Maintenance
{
    using PerpMaintenance = PerpMaintenanceServiceProvider< PerpMaintenanceService >;
} // namespace Maintenance
} // namespace Wagerfi
