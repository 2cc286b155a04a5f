#pragma once

#include <boost/assert.hpp>

#include <magic_enum/magic_enum.hpp>

#include <cstdint>
#include <tuple>
#include <utility>

namespace Wagerfi
{
namespace Trading
{

// Outcome of a binary prediction market.
enum class OutcomeSide : uint8_t
{
    yes = 0,
    no = 1
};

inline constexpr OutcomeSide outcome_flip( OutcomeSide side )
{
    return side == OutcomeSide::yes ? OutcomeSide::no : OutcomeSide::yes;
}

// Direction of a perpetual position.
enum class PerpSide : uint8_t
{
    long_side = 0,
    short_side = 1
};

template< class ItemType >
struct OutcomePair
{
    OutcomePair( ) = default;
    OutcomePair( ItemType yes, ItemType no ) : _yes( std::move( yes ) ), _no( std::move( no ) ) { }

    // compile-time getters for structured bindings.
    template< size_t SideValue > requires ( SideValue == 0 || SideValue == 1 )
    constexpr auto & get( ) &
    {
        return SideValue == 0 ? _yes : _no;
    }

    template< size_t SideValue > requires ( SideValue == 0 || SideValue == 1 )
    constexpr const auto & get( ) const &
    {
        return SideValue == 0 ? _yes : _no;
    }

    // runtime getters by enumerated side.
    constexpr auto & get( OutcomeSide side ) &
    {
        BOOST_ASSERT_MSG( side == OutcomeSide::yes || side == OutcomeSide::no, "Invalid OutcomeSide" );
        return side == OutcomeSide::yes ? _yes : _no;
    }

    constexpr const auto & get( OutcomeSide side ) const &
    {
        BOOST_ASSERT_MSG( side == OutcomeSide::yes || side == OutcomeSide::no, "Invalid OutcomeSide" );
        return side == OutcomeSide::yes ? _yes : _no;
    }

    constexpr auto & yes( ) & { return _yes; }
    constexpr auto & no( ) & { return _no; }
    constexpr const auto & yes( ) const & { return _yes; }
    constexpr const auto & no( ) const & { return _no; }

private:
    ItemType _yes;
    ItemType _no;
};

} // namespace Trading
} // namespace Wagerfi

namespace std
{
    template< class ItemType >
    struct tuple_size< Wagerfi::Trading::OutcomePair< ItemType > >
    {
        static constexpr size_t value = 2;
    };

    template < class ItemType > struct tuple_element< 0, Wagerfi::Trading::OutcomePair< ItemType > > { using type = ItemType; };
    template < class ItemType > struct tuple_element< 1, Wagerfi::Trading::OutcomePair< ItemType > > { using type = ItemType; };
}
