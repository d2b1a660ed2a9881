// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2021 Intel Corporation. All Rights Reserved.

#include "../../unit-tests-common.h"

#include <map>

using namespace rscam;

// Options written to every L500 sensor before streaming starts
static std::map< option, float > options_to_set()
{
    return { { option::global_time_enabled, 1.f } };
}

// Options a sensor reports as supported but resets once streaming starts, with the value the
// write is known not to stick at. No option is known to behave like this at the moment.
static std::map< option, float > supported_but_ignored_options()
{
    return {};
}

TEST_CASE( "L500 supported but ignored sensor options", "[live][l500]" )
{
    auto dev = find_first_device_of( product_line::l500 );
    if( ! dev )
        return;

    auto to_set = options_to_set();
    auto ignored = supported_but_ignored_options();

    auto sensors = dev.query_sensors();
    REQUIRE_FALSE( sensors.empty() );

    // Every sensor must take every write; an option the sensor rejects fails here
    for( auto && s : sensors )
    {
        for( auto && kvp : to_set )
        {
            CAPTURE( kvp.first, s.get_info( camera_info::name ) );
            REQUIRE_NOTHROW( s.set_option( kvp.first, kvp.second ) );
        }
    }

    std::string serial = dev.get_info( camera_info::serial_number );

    config cfg;
    cfg.enable_device( serial )
        .disable_all_streams()
        .enable_stream( stream_kind::color, 0, 0, format::yuyv, 30 )
        .enable_stream( stream_kind::depth, 0, 0, format::z16, 30 )
        .enable_stream( stream_kind::infrared, 0, 0, format::y8, 30 );

    pipeline pipe;
    REQUIRE_NOTHROW( pipe.start( cfg ) );

    for( auto && s : sensors )
    {
        for( auto && kvp : to_set )
        {
            auto opt = kvp.first;
            CAPTURE( opt, s.get_info( camera_info::name ) );
            auto it = ignored.find( opt );
            if( it != ignored.end() )
            {
                // accepted on write, then quietly reset by the device
                CHECK( s.supports( opt ) );
                CHECK( s.get_option( opt ) != it->second );
            }
            else
            {
                CHECK( s.get_option( opt ) == kvp.second );
            }
        }
    }

    pipe.stop();
}
