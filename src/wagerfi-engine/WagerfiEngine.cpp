#include "wagerfi/Engine/EngineConfig.hpp"

#include "wagerfi/Execution/TradeExecution/TradeExecution.hpp"
#include "wagerfi/Maintenance/PerpMaintenance/PerpMaintenance.hpp"

#include "wagerfi/Accounting/Ledger.hpp"
#include "wagerfi/Amm/PredictionAmm.hpp"
#include "wagerfi/Feed/StaticPriceFeed.hpp"
#include "wagerfi/Risk/PerpRiskEngine.hpp"
#include "wagerfi/Storage/MemoryStore.hpp"

// Utils
#include "wagerfi/Util/Logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <simdjson.h>

#include <iostream>
#include <optional>
#include <unordered_map>

namespace asio = boost::asio;
namespace po = boost::program_options;
namespace fs = std::filesystem;

//
// Wagerfi trading engine command-line tool.
//

namespace Wagerfi
{

static std::string get_version( ) { return "0.1.0"; }

static constexpr uint32_t maintenance_sweeps_default( ) { return 1; }

// Engine options.

#define DECLARE_ENGINE_CONFIG_PATH_OPTION( engineConfigPath ) \
( \
    "engine_config_path,c", \
    po::value< fs::path >( engineConfigPath )->required( ), \
    "Path to engine config json file." \
)

#define DECLARE_DECISIONS_PATH_OPTION( decisionsPath ) \
( \
    "decisions_path,d", \
    po::value< fs::path >( decisionsPath )->required( ), \
    "Path to a json array of trading decisions." \
)

#define DECLARE_MAINTENANCE_SWEEPS_OPTION( maintenanceSweeps ) \
( \
    "maintenance_sweeps", \
    po::value< uint32_t >( maintenanceSweeps )->default_value( maintenance_sweeps_default( ) ), \
    "Funding, liquidation and settlement sweeps to run after the batch." \
)

// Quote options.

#define DECLARE_MARKET_ID_OPTION( marketId ) \
( \
    "market_id,m", \
    po::value< std::string >( marketId )->required( ), \
    "Prediction market id." \
)

#define DECLARE_OUTCOME_OPTION( outcome ) \
( \
    "outcome,o", \
    po::value< std::string >( outcome )->required( ), \
    "Outcome side: yes or no." \
)

#define DECLARE_AMOUNT_OPTION( amount, description ) \
( \
    "amount,a", \
    po::value< std::string >( amount )->required( ), \
    description \
)

// Perpetual quote options.

#define DECLARE_PERP_SIDE_OPTION( perpSide ) \
( \
    "side,s", \
    po::value< std::string >( perpSide )->required( ), \
    "Position side: long or short." \
)

#define DECLARE_ENTRY_PRICE_OPTION( entryPrice ) \
( \
    "entry_price", \
    po::value< std::string >( entryPrice )->required( ), \
    "Entry price." \
)

#define DECLARE_CURRENT_PRICE_OPTION( currentPrice ) \
( \
    "current_price", \
    po::value< std::string >( currentPrice ), \
    "Current price, defaults to the entry price." \
)

#define DECLARE_LEVERAGE_OPTION( leverage ) \
( \
    "leverage,l", \
    po::value< uint32_t >( leverage )->default_value( 5 ), \
    "Leverage, 1 to 100." \
)

#define DECLARE_FUNDING_RATE_OPTION( fundingRate ) \
( \
    "funding_rate", \
    po::value< std::string >( fundingRate )->default_value( "0.01" ), \
    "Annual funding rate as a decimal." \
)

#define DECLARE_HOURS_HELD_OPTION( hoursHeld ) \
( \
    "hours_held", \
    po::value< std::string >( hoursHeld )->default_value( "8" ), \
    "Hours the position is held for the funding estimate." \
)

static Trading::OutcomeSide parse_outcome( const std::string & outcome )
{
    auto side = magic_enum::enum_cast< Trading::OutcomeSide >( outcome );
    if ( !side )
    {
        throw WagerfiError( fmt::format( "Invalid outcome: {}, expected yes or no", outcome ) );
    }
    return *side;
}

static Trading::PerpSide parse_perp_side( const std::string & side )
{
    if ( side == "long" ) return Trading::PerpSide::long_side;
    if ( side == "short" ) return Trading::PerpSide::short_side;
    throw WagerfiError( fmt::format( "Invalid side: {}, expected long or short", side ) );
}

class EngineCommand
{
public:
    EngineCommand( const std::string & name ) : _name( name ), _commandOptions( _name ) { }
    virtual ~EngineCommand( ) = default;

    const std::string & command_name( ) const { return _name; }
    const po::options_description & get_command_options( ) const { return _commandOptions; }

    // Returns 0 on success, otherwise error code.
    virtual int on_command( ) const & = 0;

protected:
    std::optional< Engine::EngineConfig > load_config( const fs::path & engineConfigPath ) const
    {
        try
        {
            return Engine::load_engine_config( engineConfigPath );
        }
        catch ( const std::exception & ex )
        {
            WAGERFI_LOG_ERROR( _logger ) << "Error parsing engine config: " << ex.what( );
            return std::nullopt;
        }
    }

    std::string _name;
    po::options_description _commandOptions;

    mutable WagerfiLogger _logger;
};

class SimulateCommand : public EngineCommand
{
public:
    SimulateCommand( ) : EngineCommand( "simulate" )
    {
        _commandOptions.add_options( )
            DECLARE_ENGINE_CONFIG_PATH_OPTION( &_engineConfigPath )
            DECLARE_DECISIONS_PATH_OPTION( &_decisionsPath )
            DECLARE_MAINTENANCE_SWEEPS_OPTION( &_maintenanceSweeps );
    }

    int on_command( ) const & override
    {
        WAGERFI_LOG_INFO( _logger ) << "Executing simulation";

        auto config = load_config( _engineConfigPath );
        if ( !config ) return 1;

        std::vector< Execution::TradingDecision > decisions;
        try
        {
            decisions = Engine::load_decisions( _decisionsPath );
        }
        catch ( const std::exception & ex )
        {
            WAGERFI_LOG_ERROR( _logger ) << "Error parsing decisions: " << ex.what( );
            return 1;
        }

        Storage::MemoryStore store;
        Feed::StaticPriceFeed priceFeed;
        Engine::seed_engine( *config, store, priceFeed );

        asio::io_context ioContext;
        Execution::TradeExecution tradeExecution( ioContext, store, priceFeed, config->tradeExecutionConfig );
        Maintenance::PerpMaintenance perpMaintenance( ioContext, tradeExecution.service( ), config->perpMaintenanceConfig );

        tradeExecution.initialize( asio::use_future ).get( );

        auto result = tradeExecution.execute_decision_batch( std::move( decisions ), asio::use_future ).get( );

        for ( uint32_t sweep = 0; sweep < _maintenanceSweeps; ++sweep )
        {
            auto sweepResult = perpMaintenance.sweep( asio::use_future ).get( );
            WAGERFI_LOG_INFO( _logger )
                << fmt::format
                (
                    "Sweep {}: funding ticks: {}, liquidations: {}, markets resolved: {}",
                    sweep + 1,
                    sweepResult.fundingTicks,
                    sweepResult.liquidations,
                    sweepResult.marketsResolved
                );
        }

        print_result( result );

        Accounting::Ledger ledger( store );
        for ( const auto & pool : config->pools )
        {
            std::cout << fmt::format( "pool {} ({}): balance {}\n", pool.id, pool.ownerId, ledger.balance( pool.id ) );
        }
        std::cout << std::flush;

        return result.failedTrades == 0 ? 0 : 2;
    }

private:
    static void print_result( const Execution::ExecutionResult & result )
    {
        std::cout << fmt::format
        (
            "decisions: {}, successful: {}, failed: {}, hold: {}\n"
            "prediction volume: {}, perp volume: {}\n",
            result.totalDecisions,
            result.successfulTrades,
            result.failedTrades,
            result.holdDecisions,
            result.totalVolumePrediction,
            result.totalVolumePerp
        );

        for ( const auto & trade : result.executedTrades )
        {
            std::cout << fmt::format
            (
                "  {} {} {} quantity: {} price: {} debited: {} credited: {} fee: {}{}\n",
                magic_enum::enum_name( trade.action ),
                trade.marketId,
                trade.positionId,
                trade.quantity,
                trade.executionPrice,
                trade.amountDebited,
                trade.amountCredited,
                trade.fee,
                trade.liquidated ? " (liquidated)" : ""
            );
        }

        for ( const auto & impact : Execution::aggregate_trade_impacts( result.executedTrades ) )
        {
            std::cout << fmt::format
            (
                "  impact {} {}: trades: {}, volume: {}, net: {}\n",
                magic_enum::enum_name( impact.marketType ),
                impact.marketId,
                impact.tradeCount,
                impact.totalVolume,
                impact.netVolume
            );
        }

        for ( const auto & error : result.errors )
        {
            std::cout << fmt::format( "  failed {} for {}: {} ({})\n", magic_enum::enum_name( error.action ), error.actorId, error.message, magic_enum::enum_name( error.code ) );
        }
    }

    fs::path _engineConfigPath;
    fs::path _decisionsPath;
    uint32_t _maintenanceSweeps;
};

class QuoteBuyCommand : public EngineCommand
{
public:
    QuoteBuyCommand( ) : EngineCommand( "quote_buy" )
    {
        _commandOptions.add_options( )
            DECLARE_ENGINE_CONFIG_PATH_OPTION( &_engineConfigPath )
            DECLARE_MARKET_ID_OPTION( &_marketId )
            DECLARE_OUTCOME_OPTION( &_outcome )
            DECLARE_AMOUNT_OPTION( &_amount, "Collateral to spend." );
    }

    int on_command( ) const & override
    {
        auto config = load_config( _engineConfigPath );
        if ( !config ) return 1;

        Storage::MemoryStore store;
        Feed::StaticPriceFeed priceFeed;
        Engine::seed_engine( *config, store, priceFeed );

        asio::io_context ioContext;
        Execution::TradeExecution tradeExecution( ioContext, store, priceFeed, config->tradeExecutionConfig );

        try
        {
            auto quote = tradeExecution.quote_buy( _marketId, parse_outcome( _outcome ), Trading::Quantity( _amount ), asio::use_future ).get( );
            std::cout << fmt::format
            (
                "shares: {}\nfee: {}\nnet amount: {}\naverage price: {}\nprice impact: {}\nnew reserves: yes {} no {}\n",
                quote.sharesOut,
                quote.fee,
                quote.netAmount,
                quote.averagePrice,
                quote.priceImpact,
                quote.newReserves.yes( ),
                quote.newReserves.no( )
            );
        }
        catch ( const std::exception & ex )
        {
            WAGERFI_LOG_ERROR( _logger ) << "Quote failed: " << ex.what( );
            return 1;
        }

        return 0;
    }

private:
    fs::path _engineConfigPath;
    std::string _marketId;
    std::string _outcome;
    std::string _amount;
};

class QuoteSellCommand : public EngineCommand
{
public:
    QuoteSellCommand( ) : EngineCommand( "quote_sell" )
    {
        _commandOptions.add_options( )
            DECLARE_ENGINE_CONFIG_PATH_OPTION( &_engineConfigPath )
            DECLARE_MARKET_ID_OPTION( &_marketId )
            DECLARE_OUTCOME_OPTION( &_outcome )
            DECLARE_AMOUNT_OPTION( &_shares, "Shares to sell." );
    }

    int on_command( ) const & override
    {
        auto config = load_config( _engineConfigPath );
        if ( !config ) return 1;

        Storage::MemoryStore store;
        Feed::StaticPriceFeed priceFeed;
        Engine::seed_engine( *config, store, priceFeed );

        asio::io_context ioContext;
        Execution::TradeExecution tradeExecution( ioContext, store, priceFeed, config->tradeExecutionConfig );

        try
        {
            auto quote = tradeExecution.quote_sell( _marketId, parse_outcome( _outcome ), Trading::Quantity( _shares ), asio::use_future ).get( );
            std::cout << fmt::format
            (
                "gross proceeds: {}\nfee: {}\nnet proceeds: {}\naverage price: {}\nprice impact: {}\nnew reserves: yes {} no {}\n",
                quote.grossProceeds,
                quote.fee,
                quote.netProceeds,
                quote.averagePrice,
                quote.priceImpact,
                quote.newReserves.yes( ),
                quote.newReserves.no( )
            );
        }
        catch ( const std::exception & ex )
        {
            WAGERFI_LOG_ERROR( _logger ) << "Quote failed: " << ex.what( );
            return 1;
        }

        return 0;
    }

private:
    fs::path _engineConfigPath;
    std::string _marketId;
    std::string _outcome;
    std::string _shares;
};

class PerpQuoteCommand : public EngineCommand
{
public:
    PerpQuoteCommand( ) : EngineCommand( "perp_quote" )
    {
        _commandOptions.add_options( )
            DECLARE_PERP_SIDE_OPTION( &_side )
            DECLARE_ENTRY_PRICE_OPTION( &_entryPrice )
            DECLARE_CURRENT_PRICE_OPTION( &_currentPrice )
            DECLARE_AMOUNT_OPTION( &_margin, "Margin to post." )
            DECLARE_LEVERAGE_OPTION( &_leverage )
            DECLARE_FUNDING_RATE_OPTION( &_fundingRate )
            DECLARE_HOURS_HELD_OPTION( &_hoursHeld );
    }

    int on_command( ) const & override
    {
        try
        {
            const auto side = parse_perp_side( _side );
            const Trading::Price entryPrice( _entryPrice );
            const Trading::Price currentPrice( _currentPrice.empty( ) ? _entryPrice : _currentPrice );
            const Trading::Quantity margin( _margin );
            const FixedFloat fundingRate( _fundingRate );

            const Trading::Quantity size = margin * _leverage;
            const auto pnl = Risk::unrealized_pnl( entryPrice, currentPrice, side, size );

            std::cout << fmt::format
            (
                "size: {}\nliquidation price: {}\nunrealized pnl: {} ({}%)\nfunding over {}h: {}\nmark price: {}\nliquidate: {}\n",
                size,
                Risk::liquidation_price( entryPrice, side, _leverage ),
                pnl.pnl,
                pnl.pnlPercent,
                _hoursHeld,
                Risk::funding_owed( side, size, fundingRate, FixedFloat( _hoursHeld ) ),
                Risk::mark_price( currentPrice, entryPrice, fundingRate ),
                Risk::should_liquidate( currentPrice, Risk::liquidation_price( entryPrice, side, _leverage ), side )
            );
        }
        catch ( const std::exception & ex )
        {
            WAGERFI_LOG_ERROR( _logger ) << "Perp quote failed: " << ex.what( );
            return 1;
        }

        return 0;
    }

private:
    std::string _side;
    std::string _entryPrice;
    std::string _currentPrice;
    std::string _margin;
    uint32_t _leverage;
    std::string _fundingRate;
    std::string _hoursHeld;
};

class WagerfiEngine
{
public:
    explicit WagerfiEngine( const std::string & programName )
        : _programName( programName )
        , _engineArguments( "Options" )
        , _optionalArguments( "optional arguments" )
    {
        _optionalArguments.add_options( )
            ( "help,h", "Show the help message and exit" )
            (
                "log_level",
                po::value< std::string >( )->default_value( "info" ),
                "Filter console logs by severity"
            )
            ( "version,V", "Show the version number and exit" );

        _engineArguments.add( _optionalArguments );

        register_command( std::make_unique< Wagerfi::SimulateCommand >( ) );
        register_command( std::make_unique< Wagerfi::QuoteBuyCommand >( ) );
        register_command( std::make_unique< Wagerfi::QuoteSellCommand >( ) );
        register_command( std::make_unique< Wagerfi::PerpQuoteCommand >( ) );
    }

    std::optional< po::variables_map > parse_command_line( int argc, char ** argv )
    {
        try
        {
            po::variables_map parsedArgs;
            po::store(
                po::command_line_parser( argc, argv ).options( _engineArguments ).run( ),
                parsedArgs );
            notify( parsedArgs );
            return { parsedArgs };
        }
        catch ( std::exception & ex )
        {
            print_usage_error( ex.what( ) );
            return { };
        }
    }

    bool is_command_valid( const std::string & command ) const
    {
        return _engineCommands.contains( command );
    }

    int execute_command( const std::string & command ) const
    {
        const auto & findCommand = _engineCommands.find( command );
        if ( findCommand == _engineCommands.end( ) )
        {
            print_usage_error( "invalid command: " + command );
            return 1;
        }
        return findCommand->second->on_command( );
    }

    void add_command( const std::string & command )
    {
        const auto & findCommand = _engineCommands.find( command );
        BOOST_ASSERT_MSG( findCommand != _engineCommands.end( ), "Unknown command" );

        const auto * engineCommand = findCommand->second.get( );
        _engineArguments.add( engineCommand->get_command_options( ) );
    }

    void print_usage( ) const
    {
        std::cout << "usage: " << _programName << " [-h] command ...\n" << std::endl;
        std::cout << _programName << " executes and previews trades against the wagerfi markets\n" << std::endl;
    };

    void print_usage_error( const std::string & error ) const
    {
        std::cerr << "usage: " << _programName << " [-h] command ...\n";
        std::cerr << _programName << ": error: " << error << std::endl;
    }

    void print_help( ) const
    {
        print_usage( );
        std::cout << _engineArguments << std::endl;
    }

    void print_positional_help( ) const
    {
        print_help( );

        std::cout << "positional arguments:\n";
        std::cout << "  command:\n";
        for ( const auto & [ commandName, _ ] : _engineCommands )
        {
            std::cout << "    " << commandName << "\n";
        }
        std::cout << std::endl;
    }

    void print_version( )
    {
        std::cout << _programName << " version: " << get_version( ) << std::endl;
    }

private:
    void register_command( std::unique_ptr< Wagerfi::EngineCommand > command )
    {
        const auto & commandName = command->command_name( );
        auto inserted = _engineCommands.emplace( commandName, std::move( command ) ).second;
        BOOST_ASSERT_MSG( inserted, "Registered duplicate command" );
    }

    std::string _programName;

    po::options_description _engineArguments;
    po::options_description _optionalArguments;
    std::unordered_map< std::string, std::unique_ptr< Wagerfi::EngineCommand > > _engineCommands;
};

} // namespace Wagerfi

int main( int argc, char ** argv )
{
    auto programName = fs::path( argv[ 0 ] ).filename( );
    Wagerfi::WagerfiEngine wagerfiEngine( programName );

    std::string command;
    if ( argc > 1 )
    {
        command = argv[ 1 ];
        if ( wagerfiEngine.is_command_valid( command ) )
        {
            wagerfiEngine.add_command( command );
        }
    }

    auto parsedArgs = wagerfiEngine.parse_command_line( argc, argv );
    if ( !parsedArgs ) return 1;

    if ( parsedArgs->count( "help" ) )
    {
        wagerfiEngine.is_command_valid( command ) ? wagerfiEngine.print_help( ) : wagerfiEngine.print_positional_help( );
        return 0;
    }

    if ( parsedArgs->count( "version" ) )
    {
        wagerfiEngine.print_version( );
        return 0;
    }

    // Initialize logger and severity filter.
    boost::log::trivial::severity_level logLevel;
    const auto & logLevelArg = parsedArgs->find( "log_level" );
    BOOST_ASSERT_MSG( logLevelArg != parsedArgs->end( ), "Expected log_level command-line option" );

    const auto & logLevelString = logLevelArg->second.as< std::string >( );
    auto success = boost::log::trivial::from_string( logLevelString.data( ), logLevelString.size( ), logLevel );
    if ( !success )
    {
        std::cerr << "Invalid log-level option, valid options are: trace, debug, info, warning, error" << std::endl;
        return 1;
    }
    Wagerfi::init_logger( logLevel );

    // Execute user's command.
    return wagerfiEngine.execute_command( command );
};
