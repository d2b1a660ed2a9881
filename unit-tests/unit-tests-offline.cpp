// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2015 Intel Corporation. All Rights Reserved.

/////////////////////////////////////////////////////////////////////
// Checks of the binding that need no camera attached to the host //
/////////////////////////////////////////////////////////////////////

#include "unit-tests-common.h"
#include "unit-tests-software.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <locale>
#include <stdexcept>
#include <vector>

using namespace rscam;

TEST_CASE( "kinds convert to the SDK names", "[offline][kinds]" )
{
    CHECK( std::string( to_string( stream_kind::color ) ) == "Color" );
    CHECK( std::string( to_string( stream_kind::depth ) ) == "Depth" );
    CHECK( std::string( to_string( format::z16 ) ) == "Z16" );
    CHECK( std::string( to_string( camera_info::serial_number ) ) == "Serial Number" );
    CHECK( std::string( to_string( option::global_time_enabled ) ) == "Global Time Enabled" );
    CHECK( std::string( to_string( product_line::d400 ) ) == "D400" );

    std::ostringstream ss;
    ss << stream_kind::infrared << " " << format::y8;
    CHECK( ss.str() == "Infrared Y8" );
}

TEST_CASE( "kinds convert losslessly to and from the SDK enums", "[offline][kinds]" )
{
    CHECK( to_rs2( stream_kind::depth ) == RS2_STREAM_DEPTH );
    CHECK( from_rs2( RS2_STREAM_DEPTH ) == stream_kind::depth );
    CHECK( to_rs2( format::rgba8 ) == RS2_FORMAT_RGBA8 );
    CHECK( from_rs2( RS2_FORMAT_RGBA8 ) == format::rgba8 );
    CHECK( to_rs2( option::enable_auto_exposure ) == RS2_OPTION_ENABLE_AUTO_EXPOSURE );
    CHECK( from_rs2( RS2_OPTION_ENABLE_AUTO_EXPOSURE ) == option::enable_auto_exposure );
}

TEST_CASE( "product line sets", "[offline][kinds]" )
{
    SECTION( "an empty set selects any product line" )
    {
        product_line_set lines;
        CHECK( lines.empty() );
        CHECK( lines.mask() == RS2_PRODUCT_LINE_ANY );
    }
    SECTION( "members are OR-ed into the mask" )
    {
        product_line_set lines{ product_line::d400, product_line::l500 };
        CHECK( lines.size() == 2 );
        CHECK( lines.contains( product_line::d400 ) );
        CHECK_FALSE( lines.contains( product_line::sr300 ) );
        CHECK( lines.mask() == ( RS2_PRODUCT_LINE_D400 | RS2_PRODUCT_LINE_L500 ) );
    }
    SECTION( "inserting twice keeps one member" )
    {
        product_line_set lines;
        lines.insert( product_line::t200 );
        lines.insert( product_line::t200 );
        CHECK( lines.size() == 1 );
        CHECK( lines.mask() == RS2_PRODUCT_LINE_T200 );
    }
}

TEST_CASE( "product line names parse back", "[offline][kinds]" )
{
    CHECK( parse_product_line( "D400" ) == product_line::d400 );
    CHECK( parse_product_line( "L500" ) == product_line::l500 );
    CHECK( parse_product_line( to_string( product_line::any_intel ) ) == product_line::any_intel );
    REQUIRE_THROWS_AS( parse_product_line( "D4xx" ), invalid_value_error );
}

TEST_CASE( "region of interest bounds", "[offline][types]" )
{
    region_of_interest roi{ 10, 20, 109, 59 };
    CHECK( roi.width() == 100 );
    CHECK( roi.height() == 40 );
    CHECK( roi.is_within( 640, 480 ) );
    CHECK_FALSE( roi.is_within( 100, 480 ) );
    CHECK_FALSE( roi.is_within( 640, 59 ) );

    region_of_interest inverted{ 50, 20, 10, 59 };
    CHECK_FALSE( inverted.is_within( 640, 480 ) );

    region_of_interest negative{ -1, 0, 10, 10 };
    CHECK_FALSE( negative.is_within( 640, 480 ) );

    CHECK( roi == region_of_interest{ 10, 20, 109, 59 } );
    CHECK( roi != inverted );

    std::ostringstream ss;
    ss << roi;
    CHECK( ss.str() == "[10,20 .. 109,59]" );
}

TEST_CASE( "option range containment", "[offline][types]" )
{
    option_range range{ 0.f, 1.f, 0.5f, 1.f };
    CHECK( range.step == 0.5f );
    CHECK( range.def == 1.f );
    CHECK( range.contains( 0.f ) );
    CHECK( range.contains( 1.f ) );
    CHECK_FALSE( range.contains( 2.f ) );
}

TEST_CASE( "intrinsics field of view", "[offline][types]" )
{
    rs2_intrinsics raw;
    std::memset( &raw, 0, sizeof( raw ) );
    raw.width = 640;
    raw.height = 480;
    raw.ppx = 319.5f;
    raw.ppy = 239.5f;
    raw.fx = 320.f;
    raw.fy = 240.f;

    intrinsics intr( raw );
    auto fov = intr.fov();
    CHECK( fov.first == Approx( 90.f ) );
    CHECK( fov.second == Approx( 90.f ) );
    CHECK( intr.coeffs().size() == 5 );
}

TEST_CASE( "errors carry the failed call", "[offline][errors]" )
{
    invalid_value_error err( "bad value", "rscam::sensor::set_option", "42" );
    CHECK( std::string( err.what() ) == "bad value" );
    CHECK( err.get_failed_function() == "rscam::sensor::set_option" );
    CHECK( err.get_failed_args() == "42" );
    CHECK( err.get_type() == RS2_EXCEPTION_TYPE_INVALID_VALUE );
    CHECK( invalid_value_error::type_id() == RS2_EXCEPTION_TYPE_INVALID_VALUE );
    CHECK( wrong_api_call_sequence_error::type_id() == RS2_EXCEPTION_TYPE_WRONG_API_CALL_SEQUENCE );
    CHECK( not_implemented_error::type_id() == RS2_EXCEPTION_TYPE_NOT_IMPLEMENTED );
    CHECK( camera_disconnected_error::type_id() == RS2_EXCEPTION_TYPE_CAMERA_DISCONNECTED );

    // a null error is not a failure
    REQUIRE_NOTHROW( error::handle( nullptr ) );
}

TEST_CASE( "context can be created without a camera", "[offline][context]" )
{
    context ctx;
    REQUIRE( ctx.get() );

    device_list devices;
    REQUIRE_NOTHROW( devices = ctx.query_devices() );
    REQUIRE_NOTHROW( ctx.query_devices( product_line_set{ product_line::d400 } ) );
    REQUIRE_THROWS_AS( devices[devices.size()], invalid_value_error );

    for( auto && dev : devices )
        CHECK( devices.contains( dev ) );
}

TEST_CASE( "config requests chain", "[offline][config]" )
{
    config cfg;
    config & same = cfg.disable_all_streams()
                        .enable_stream( stream_kind::depth, 0, 0, format::z16, 30 )
                        .enable_stream( stream_kind::infrared, 1, 0, 0, format::y8, 30 )
                        .disable_stream( stream_kind::infrared );
    CHECK( &same == &cfg );

    REQUIRE_THROWS_AS( cfg.enable_device( "" ), invalid_value_error );
}

TEST_CASE( "pipeline refuses frame calls before start", "[offline][pipeline]" )
{
    pipeline pipe;
    CHECK_FALSE( pipe.is_streaming() );

    frameset frames;
    REQUIRE_THROWS_AS( pipe.wait_for_frames(), wrong_api_call_sequence_error );
    REQUIRE_THROWS_AS( pipe.poll_for_frames( &frames ), wrong_api_call_sequence_error );
    REQUIRE_THROWS_AS( pipe.try_wait_for_frames( &frames, 10 ), wrong_api_call_sequence_error );
    REQUIRE_THROWS_AS( pipe.get_active_profile(), wrong_api_call_sequence_error );
    REQUIRE_THROWS_AS( pipe.stop(), wrong_api_call_sequence_error );
    CHECK_FALSE( frames );
}

TEST_CASE( "empty handles", "[offline][types]" )
{
    device dev;
    CHECK_FALSE( dev );

    frame f;
    CHECK_FALSE( f );
    CHECK_FALSE( f.is< depth_frame >() );

    pipeline_profile profile;
    CHECK_FALSE( profile );
}

TEST_CASE( "sensor options are checked before reaching the device", "[offline][sensor]" )
{
    software_device sw;
    auto ss = sw.add_sensor( "Software Sensor" );
    ss.add_read_only_option( option::asic_temperature, 42.f );
    ss.add_option( option::exposure, option_range{ 1.f, 100.f, 1.f, 10.f } );

    auto s = sw.get().query_sensors().front();

    SECTION( "unsupported options can be neither read nor written" )
    {
        REQUIRE_FALSE( s.supports( option::gain ) );
        REQUIRE_THROWS_AS( s.get_option( option::gain ), invalid_value_error );
        REQUIRE_THROWS_AS( s.set_option( option::gain, 1.f ), invalid_value_error );
    }
    SECTION( "read-only options can be read but not written" )
    {
        REQUIRE( s.supports( option::asic_temperature ) );
        REQUIRE( s.is_option_read_only( option::asic_temperature ) );
        CHECK( s.get_option( option::asic_temperature ) == 42.f );
        REQUIRE_THROWS_AS( s.set_option( option::asic_temperature, 1.f ), invalid_value_error );
        CHECK( s.get_option( option::asic_temperature ) == 42.f );
    }
    SECTION( "writable options keep the written value" )
    {
        auto range = s.get_option_range( option::exposure );
        CHECK( range.min == 1.f );
        CHECK( range.max == 100.f );
        CHECK( range.step == 1.f );
        CHECK( range.def == 10.f );

        REQUIRE_NOTHROW( s.set_option( option::exposure, 20.f ) );
        CHECK( s.get_option( option::exposure ) == 20.f );

        auto supported = s.get_supported_options();
        CHECK( std::find( supported.begin(), supported.end(), option::exposure ) != supported.end() );
        CHECK( std::find( supported.begin(), supported.end(), option::gain ) == supported.end() );
    }
}

TEST_CASE( "region of interest needs the roi extension", "[offline][sensor]" )
{
    software_device sw;
    sw.add_sensor( "Software Sensor" );
    auto s = sw.get().query_sensors().front();

    REQUIRE_FALSE( s.is_extendable_to( extension::roi ) );
    REQUIRE_THROWS_AS( s.get_region_of_interest(), not_implemented_error );
    REQUIRE_THROWS_AS( s.set_region_of_interest( region_of_interest{ 0, 0, 10, 10 } ), not_implemented_error );
    CHECK_FALSE( s.is< color_sensor >() );
    CHECK( s.extension() == extension::software_sensor );
}

TEST_CASE( "device info must be reported before it is read", "[offline][device]" )
{
    software_device sw;
    sw.add_sensor( "Software Sensor" );
    auto dev = sw.get();

    REQUIRE_FALSE( dev.supports( camera_info::usb_type_descriptor ) );
    REQUIRE_THROWS_AS( dev.get_info( camera_info::usb_type_descriptor ), invalid_value_error );
    REQUIRE_THROWS_AS( dev.usb_type(), invalid_value_error );
    REQUIRE_THROWS_AS( dev.first< depth_sensor >(), invalid_value_error );
}

TEST_CASE( "usb type descriptor parsing", "[offline][device]" )
{
    SECTION( "a dotted version parses" )
    {
        software_device sw;
        sw.register_info( camera_info::usb_type_descriptor, "3.2" );
        CHECK( sw.get().usb_type() == Approx( 3.2f ) );
        CHECK( is_usb3( sw.get() ) );
    }
    SECTION( "usb 2 is not usb 3" )
    {
        software_device sw;
        sw.register_info( camera_info::usb_type_descriptor, "2.1" );
        CHECK_FALSE( is_usb3( sw.get() ) );
    }
    SECTION( "anything else is malformed" )
    {
        for( auto descriptor : { "USB3", "3.2x", "" } )
        {
            CAPTURE( descriptor );
            software_device sw;
            sw.register_info( camera_info::usb_type_descriptor, descriptor );
            REQUIRE_THROWS_AS( sw.get().usb_type(), invalid_value_error );
        }
    }
    SECTION( "the host locale does not change the decimal separator" )
    {
        std::locale previous;
        try
        {
            std::locale::global( std::locale( "de_DE.UTF-8" ) );
        }
        catch( const std::runtime_error & )
        {
            test::log.i( "de_DE.UTF-8 locale not installed; parsing under the current locale only" );
        }

        software_device sw;
        sw.register_info( camera_info::usb_type_descriptor, "3.2" );
        float usb = 0.f;
        CHECK_NOTHROW( usb = sw.get().usb_type() );
        std::locale::global( previous );
        CHECK( usb == Approx( 3.2f ) );
    }
    SECTION( "product line is parsed from its info field" )
    {
        software_device sw;
        sw.register_info( camera_info::product_line, "D400" );
        CHECK( sw.get().product_line() == product_line::d400 );
    }
}

TEST_CASE( "frame views are selected by kind", "[offline][frame]" )
{
    const int width = 4, height = 2;

    software_device sw;
    auto ss = sw.add_sensor( "Software Sensor" );

    SECTION( "depth" )
    {
        auto profile = ss.add_video_stream( stream_kind::depth, format::z16, width, height, 2 );
        std::vector< uint16_t > pixels( width * height, 1000 );
        auto f = ss.capture_one( profile, pixels.data(), width * 2, 2 );
        REQUIRE( f );

        CHECK( f.is< video_frame >() );
        CHECK( f.is< depth_frame >() );
        CHECK_FALSE( f.is< disparity_frame >() );
        CHECK_FALSE( f.is< color_frame >() );
        CHECK_FALSE( f.is< infrared_frame >() );
        CHECK_FALSE( f.is< motion_frame >() );
        CHECK_FALSE( f.is< frameset >() );

        auto depth = f.as< depth_frame >();
        CHECK( depth.get_width() == width );
        CHECK( depth.get_height() == height );
        CHECK( depth.get_profile().stream_type() == stream_kind::depth );
        CHECK( depth.get_profile().format() == format::z16 );
    }
    SECTION( "color" )
    {
        auto profile = ss.add_video_stream( stream_kind::color, format::rgb8, width, height, 3 );
        std::vector< uint8_t > pixels( width * height * 3, 128 );
        auto f = ss.capture_one( profile, pixels.data(), width * 3, 3 );
        REQUIRE( f );

        CHECK( f.is< color_frame >() );
        CHECK_FALSE( f.is< depth_frame >() );
        CHECK_FALSE( f.is< disparity_frame >() );
        CHECK_FALSE( f.is< infrared_frame >() );
        CHECK( f.get_data_size() == width * height * 3 );
    }
}
