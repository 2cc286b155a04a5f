#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace Wagerfi
{

// Every monetary amount, share count and rate goes through this type.
using FixedFloat = boost::multiprecision::number< boost::multiprecision::backends::cpp_dec_float< 32, int16_t > >;

inline FixedFloat fixed_zero( ) { return FixedFloat( 0 ); }

} // namespace Wagerfi

template < >
struct fmt::formatter< Wagerfi::FixedFloat > : fmt::ostream_formatter { };
