// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2021 Intel Corporation. All Rights Reserved.

#pragma once

#include <rscam/rscam.hpp>
#include <catch2/catch.hpp>

#include <sstream>
#include <string>


namespace test {


// Free-form tag of the rig or CI job running the tests (--context); echoed at start-up
extern std::string context;

// --debug: SDK console logging at debug level, plus test::log.d() output
extern bool debug;

// --serial: live tests only use the device with this serial number
extern std::string serial;


// One line of test output, written when it goes out of scope:
//     -I- No device of the D400 product line was found
class log_line
{
    std::ostringstream _line;
    char _type;

public:
    explicit log_line( char type ) : _type( type ) {}
    ~log_line();

    void append() {}

    template< typename T, typename... Rest >
    void append( T const & first, Rest const &... rest )
    {
        if( _line.tellp() )
            _line << ' ';
        _line << first;
        append( rest... );
    }
};


// test::log.i( "found", n, "devices" ) prints its arguments separated by spaces
struct logger
{
    template< typename... Args >
    void d( Args const &... args ) const
    {
        if( debug )
            log_line( 'D' ).append( args... );
    }

    template< typename... Args >
    void i( Args const &... args ) const
    {
        log_line( 'I' ).append( args... );
    }
};
extern logger log;


}
