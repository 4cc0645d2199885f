#include "TracklineApp.h"
#include "common/InputParser.h"
#include "logic/app/Logging.h"

#include <spdlog/spdlog.h>

#include <iostream>
#include <sstream>

int main( int argc, char* argv[] )
{
    auto logFailure = []()
    {
        spdlog::debug( "------------------------ END SESSION (FAILURE) ------------------------" );
    };

    Logging logging;

    try
    {
        logging.setup();
    }
    catch ( const std::exception& e )
    {
        std::cerr << "Exception when setting up logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        spdlog::debug( "------------------------ BEGIN SESSION ------------------------" );
        TracklineApp::logPreamble();

        InputParams params;

        if ( EXIT_FAILURE == parseCommandLine( argc, argv, params ) )
        {
            logFailure();
            return EXIT_FAILURE;
        }

        if ( ! params.set )
        {
            spdlog::debug( "Command line arguments not specified" );
            logFailure();
            return EXIT_FAILURE;
        }

        logging.setConsoleSinkLevel( params.consoleLogLevel );
        logging.setDailyFileSinkLevel( params.consoleLogLevel );

        std::ostringstream ss;
        ss << params;
        spdlog::debug( "Parsed command line parameters:\n{}", ss.str() );

        if ( params.report )
        {
            if ( ! TracklineApp::reportVisibility( params ) )
            {
                logFailure();
                return EXIT_FAILURE;
            }
        }
        else
        {
            TracklineApp app;
            app.setup( params );
            app.init();
            app.run();
        }
    }
    catch ( const std::runtime_error& e )
    {
        spdlog::critical( "Runtime error: {}", e.what() );
        logFailure();
        return EXIT_FAILURE;
    }
    catch ( const std::exception& e )
    {
        spdlog::critical( "Exception: {}", e.what() );
        logFailure();
        return EXIT_FAILURE;
    }

    spdlog::debug( "------------------------ END SESSION (SUCCESS) ------------------------" );
    return EXIT_SUCCESS;
}
