#pragma once

#include "wagerfi/Execution/TradeExecution/TradeExecutionService.hpp"
#include "wagerfi/Execution/TradeExecution/TradeExecutionServiceProvider.hpp"

namespace Wagerfi
{
namespace Execution
{
    using TradeExecution = TradeExecutionServiceProvider< TradeExecutionService >;
} // namespace Execution
} // namespace Wagerfi
