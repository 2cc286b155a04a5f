#pragma once

#include "wagerfi/Feed/PriceFeed.hpp"

#include "wagerfi/Util/StringHash.hpp"

#include <mutex>
#include <shared_mutex>

namespace Wagerfi
{
namespace Feed
{

// Feed whose prices and outcomes are set explicitly.
class StaticPriceFeed : public PriceFeed
{
public:
    std::optional< Trading::Price > get_index_price( std::string_view ticker ) const override;
    std::optional< bool > get_resolution_outcome( std::string_view marketId ) const override;

    void set_index_price( std::string_view ticker, Trading::Price price );
    void set_resolution_outcome( std::string_view marketId, bool outcome );

private:
    mutable std::shared_mutex _mutex;
    TransparentStringMap< Trading::Price > _indexPrices;
    TransparentStringMap< bool > _outcomes;
};

} // namespace Feed
} // namespace Wagerfi
