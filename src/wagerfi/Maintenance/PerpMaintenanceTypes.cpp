#include "wagerfi/Maintenance/PerpMaintenanceTypes.hpp"

#include "wagerfi/Util/Utils.hpp"

namespace Wagerfi
{
namespace Maintenance
{

PerpMaintenanceConfig tag_invoke( json_to_tag< PerpMaintenanceConfig >, simdjson::ondemand::value jsonValue )
{
    simdjson::ondemand::object jsonObject = jsonValue.get_object( );

    PerpMaintenanceConfig config;
    config.sweepInterval = json_to_optional< std::chrono::milliseconds >( jsonObject, "sweepIntervalMs" ).value_or( config.sweepInterval );
    config.resolveExpiredMarkets = json_to_optional< bool >( jsonObject, "resolveExpiredMarkets" ).value_or( config.resolveExpiredMarkets );

    if ( config.sweepInterval.count( ) <= 0 )
    {
        throw WagerfiError( "sweepIntervalMs must be positive" );
    }

    return config;
}

} // namespace Maintenance
} // namespace Wagerfi
