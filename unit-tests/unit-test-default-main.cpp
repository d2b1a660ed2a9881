// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2021 Intel Corporation. All Rights Reserved.

/*
This file creates the default main for our unit-tests so that they can receive the 'context',
'debug' and 'serial' options.
*/

// We are not using the main from catch2
#define CATCH_CONFIG_RUNNER
#include "test.h"

using namespace Catch::clara;

int main( int argc, char* argv[] ) {
    Catch::Session session;
    // The following lines define command line options for all tests and save their values into
    // the test namespace. Add more options with "|" in between every 2 options.
    auto cli = session.cli()
        | Opt( test::context, "context" )
        ["--context"]
        ( "Context in which to run the tests" )
        | Opt( test::debug )
        ["--debug"]
        ( "Turn on librealsense debug logging to the console" )
        | Opt( test::serial, "serial" )
        ["--serial"]
        ( "Only run live tests against the device with this serial number" );

    session.cli( cli );

    auto ret = session.applyCommandLine( argc, argv );
    if( ret ) {
        return ret;
    }

    if( test::debug )
        rscam::log_to_console( rscam::log_severity::debug );

    if( ! test::context.empty() )
        test::log.i( "running in context", test::context );
    if( ! test::serial.empty() )
        test::log.i( "live tests restricted to serial", test::serial );

    return session.run();
}
