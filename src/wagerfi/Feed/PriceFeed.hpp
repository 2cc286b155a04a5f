#pragma once

#include "wagerfi/Trading/Price.hpp"

#include <optional>
#include <string_view>

namespace Wagerfi
{
namespace Feed
{

// Source of perpetual index prices and finalized prediction outcomes.
class PriceFeed
{
public:
    virtual ~PriceFeed( ) = default;

    virtual std::optional< Trading::Price > get_index_price( std::string_view ticker ) const = 0;

    // std::nullopt until the outcome is finalized.
    virtual std::optional< bool > get_resolution_outcome( std::string_view marketId ) const = 0;
};

} // namespace Feed
} // namespace Wagerfi
