// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2015 Intel Corporation. All Rights Reserved.

#pragma once

#include "test.h"

#include <chrono>
#include <cstdlib>
#include <string>


// Returns the first connected device of the given product line, honoring --serial.
// An empty device means the test has nothing to run against; callers return early so the
// rest of the executable still runs.
inline rscam::device find_first_device_of( rscam::product_line line )
{
    rscam::context ctx;
    rscam::device_list devices = ctx.query_devices( rscam::product_line_set{ line } );

    for( auto && dev : devices )
    {
        if( test::serial.empty() )
            return dev;
        if( dev.supports( rscam::camera_info::serial_number )
            && test::serial == dev.get_info( rscam::camera_info::serial_number ) )
            return dev;
    }

    test::log.i( "No device of the", rscam::to_string( line ), "product line was found; skipping test" );
    return rscam::device();
}

// USB 3 links carry enough bandwidth for both infrared imagers next to color and depth
inline bool is_usb3( const rscam::device & dev )
{
    return dev.usb_type() >= 3.0f;
}

inline long long ms_since( std::chrono::steady_clock::time_point begin )
{
    return std::chrono::duration_cast< std::chrono::milliseconds >(
        std::chrono::steady_clock::now() - begin ).count();
}
