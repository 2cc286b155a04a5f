#pragma once

#include <stdexcept>

namespace Wagerfi
{

class WagerfiError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

} // namespace Wagerfi
