// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2021 Intel Corporation. All Rights Reserved.

//////////////////////////////////////////////////////////////////////////////
// Stream configuration and delivery checks against a connected D400 camera //
//////////////////////////////////////////////////////////////////////////////

#include "../../unit-tests-common.h"

#include <algorithm>
#include <cstdlib>

using namespace rscam;

TEST_CASE( "D400 can resolve color, depth and infrared", "[live][d400]" )
{
    auto dev = find_first_device_of( product_line::d400 );
    if( ! dev )
        return;

    std::string serial = dev.get_info( camera_info::serial_number );

    config cfg;
    cfg.enable_device( serial )
        .disable_all_streams()
        .enable_stream( stream_kind::color, 0, 0, 0, format::rgba8, 30 )
        .enable_stream( stream_kind::depth, 0, 0, 0, format::z16, 30 )
        // the infrared imagers are numbered from 1; index 0 is not accepted for them
        .enable_stream( stream_kind::infrared, 1, 0, 0, format::y8, 30 );

    if( is_usb3( dev ) )
        cfg.enable_stream( stream_kind::infrared, 2, 0, 0, format::any, 30 );

    pipeline pipe;

    REQUIRE( cfg.can_resolve( pipe ) );
    pipeline_profile profile;
    REQUIRE_NOTHROW( profile = cfg.resolve( pipe ) );
    REQUIRE( profile );
}

TEST_CASE( "D400 streams at expected framerate", "[live][d400]" )
{
    auto dev = find_first_device_of( product_line::d400 );
    if( ! dev )
        return;

    std::string serial = dev.get_info( camera_info::serial_number );
    const int framerate = 30;
    const int number_of_seconds = 5;

    config cfg;
    cfg.enable_device( serial )
        .disable_all_streams()
        .enable_stream( stream_kind::color, 0, 0, format::rgb8, framerate )
        .enable_stream( stream_kind::depth, 0, 0, format::z16, framerate );

    pipeline pipe;
    REQUIRE( cfg.can_resolve( pipe ) );
    REQUIRE_NOTHROW( pipe.start( cfg ) );

    size_t nframes = 0;
    const int iters = number_of_seconds * framerate;

    auto begin = std::chrono::steady_clock::now();
    long long first_iter_time = 0;

    for( int i = 0; i < iters; i++ )
    {
        frameset frames;
        if( i == 0 )
        {
            // The first frameset takes well over a frame period to arrive (about 1.5s on a
            // D400), so it gets the default timeout and its latency is allowed for below
            frames = pipe.wait_for_frames();
            first_iter_time = ms_since( begin );
        }
        else
        {
            frames = pipe.wait_for_frames( 50 );
        }
        nframes += frames.size();
    }

    auto elapsed_time_ms = ms_since( begin );
    long long expected_time_ms = 1000LL * number_of_seconds;
    auto absdiff_from_expected = std::llabs( elapsed_time_ms - expected_time_ms );

    test::log.d( "first frameset after", first_iter_time, "ms; total", elapsed_time_ms, "ms" );

    CAPTURE( absdiff_from_expected, first_iter_time );
    CHECK( absdiff_from_expected <= first_iter_time + 200 );
    CHECK( nframes == size_t( framerate * number_of_seconds * 2 ) );

    pipe.stop();
}

TEST_CASE( "D400 streams are distinct", "[live][d400]" )
{
    auto dev = find_first_device_of( product_line::d400 );
    if( ! dev )
        return;

    std::string serial = dev.get_info( camera_info::serial_number );

    config cfg;
    size_t expected_frame_count = 4;

    // gyro and accel are left out; they run at a different framerate
    cfg.enable_device( serial )
        .disable_all_streams()
        .enable_stream( stream_kind::color, 0, 0, format::rgba8, 30 )
        .enable_stream( stream_kind::depth, 0, 0, format::z16, 30 );

    if( is_usb3( dev ) )
    {
        cfg.enable_stream( stream_kind::infrared, 1, 0, 0, format::y8, 30 )
            .enable_stream( stream_kind::infrared, 2, 0, 0, format::y8, 30 );
    }
    else
    {
        expected_frame_count = 2;
    }

    pipeline pipe;
    REQUIRE_NOTHROW( pipe.start( cfg ) );

    auto frames = pipe.wait_for_frames();

    CHECK( frames.size() == expected_frame_count );
    CHECK( frames.frames_of_type< color_frame >().size() == 1 );
    CHECK( frames.frames_of_type< depth_frame >().size() == 1 );
    CHECK( frames.frames_of_type< infrared_frame >().size() == expected_frame_count - 2 );

    pipe.stop();
}

// After the startup phase the frame number must increase by one for each new frameset, as long
// as only one stream is active and the pipeline is queried for new framesets faster than the
// framerate.
TEST_CASE( "D400 frame numbers increase", "[live][d400]" )
{
    auto dev = find_first_device_of( product_line::d400 );
    if( ! dev )
        return;

    std::string serial = dev.get_info( camera_info::serial_number );

    config cfg;
    cfg.enable_device( serial )
        .disable_all_streams()
        .enable_stream( stream_kind::depth, 0, 0, format::z16, 30 );

    pipeline pipe;
    REQUIRE_NOTHROW( pipe.start( cfg ) );

    // Startup phase: the camera often drops some frames right after it starts
    for( int i = 0; i < 5; i++ )
        pipe.wait_for_frames();

    unsigned long long last_frame_number = 0;
    bool have_last = false;
    for( int i = 0; i < 5; i++ )
    {
        auto frames = pipe.wait_for_frames();
        auto depth_frames = frames.frames_of_type< depth_frame >();
        REQUIRE_FALSE( depth_frames.empty() );

        auto frame_number = depth_frames.front().get_frame_number();
        if( have_last )
            CHECK( frame_number == last_frame_number + 1 );
        last_frame_number = frame_number;
        have_last = true;
    }

    pipe.stop();
}

// The auto-exposure region of interest of the color sensor can be read and written
TEST_CASE( "D400 region of interest accessible", "[live][d400]" )
{
    auto dev = find_first_device_of( product_line::d400 );
    if( ! dev )
        return;

    std::string serial = dev.get_info( camera_info::serial_number );

    config cfg;
    cfg.enable_device( serial )
        .disable_all_streams()
        .enable_stream( stream_kind::color, 0, 0, format::rgba8, 30 );

    pipeline pipe;
    REQUIRE_NOTHROW( pipe.start( cfg ) );

    // Wait until a frame is received to make sure the camera is properly initialized
    pipe.wait_for_frames();

    auto profile = pipe.get_active_profile();
    auto streams = profile.get_streams();
    REQUIRE_FALSE( streams.empty() );
    auto video = streams.front().as< video_stream_profile >();
    REQUIRE( video );
    auto intr = video.get_intrinsics();
    int width = intr.width();
    int height = intr.height();

    auto sensors = profile.get_device().query_sensors();
    auto it = std::find_if( sensors.begin(), sensors.end(), []( const sensor & s ) {
        return s.extension() == extension::color_sensor;
    } );
    REQUIRE( it != sensors.end() );
    sensor color = *it;

    REQUIRE_NOTHROW( color.set_option( option::enable_auto_exposure, 1.f ) );

    region_of_interest old_roi{};
    REQUIRE_NOTHROW( old_roi = color.get_region_of_interest() );
    CAPTURE( old_roi.min_x, old_roi.min_y, old_roi.max_x, old_roi.max_y, width, height );
    CHECK( 0 <= old_roi.min_x );
    CHECK( old_roi.min_x <= old_roi.max_x );
    CHECK( old_roi.max_x < width );
    CHECK( 0 <= old_roi.min_y );
    CHECK( old_roi.min_y <= old_roi.max_y );
    CHECK( old_roi.max_y < height );

    region_of_interest roi{ width / 8, height / 8, width * 7 / 8, height * 7 / 8 };
    REQUIRE( roi.is_within( width, height ) );
    REQUIRE_NOTHROW( color.set_region_of_interest( roi ) );

    pipe.stop();
}
