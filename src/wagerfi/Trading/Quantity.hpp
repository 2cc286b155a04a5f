#pragma once

#include "wagerfi/Util/Fixed.hpp"

namespace Wagerfi
{
namespace Trading
{

// Shares, collateral amounts and USD notionals.
using Quantity = FixedFloat;

} // namespace Trading
} // namespace Wagerfi
