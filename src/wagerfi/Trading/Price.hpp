#pragma once

#include "wagerfi/Util/Fixed.hpp"

namespace Wagerfi
{
namespace Trading
{

using Price = FixedFloat;

} // namespace Trading
} // namespace Wagerfi
