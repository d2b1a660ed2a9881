// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2021 Intel Corporation. All Rights Reserved.

#pragma once

#include "test.h"

#include <librealsense2/h/rs_internal.h>

#include <memory>
#include <string>


// Sensor of a software device: options and streams are declared by the test, and frames are
// injected instead of captured
class software_sensor
{
    std::shared_ptr< rs2_sensor > _sensor;

public:
    explicit software_sensor( std::shared_ptr< rs2_sensor > s )
        : _sensor( std::move( s ) )
    {
    }

    rscam::sensor get() const { return rscam::sensor( _sensor ); }

    void add_read_only_option( rscam::option option, float val )
    {
        rs2_error * e = nullptr;
        rs2_software_sensor_add_read_only_option( _sensor.get(), rscam::to_rs2( option ), val, &e );
        rscam::error::handle( e );
    }

    void add_option( rscam::option option, const rscam::option_range & range )
    {
        rs2_error * e = nullptr;
        rs2_software_sensor_add_option( _sensor.get(), rscam::to_rs2( option ),
                                        range.min, range.max, range.step, range.def, 1, &e );
        rscam::error::handle( e );
    }

    // the profile belongs to the sensor
    const rs2_stream_profile * add_video_stream( rscam::stream_kind kind, rscam::format fmt, int width, int height, int bpp )
    {
        rs2_video_stream vs = {};
        vs.type = rscam::to_rs2( kind );
        vs.index = 0;
        vs.uid = static_cast< int >( kind ) + 100;
        vs.width = width;
        vs.height = height;
        vs.fps = 30;
        vs.bpp = bpp;
        vs.fmt = rscam::to_rs2( fmt );
        vs.intrinsics.width = width;
        vs.intrinsics.height = height;

        rs2_error * e = nullptr;
        auto profile = rs2_software_sensor_add_video_stream_ex( _sensor.get(), vs, 1, &e );
        rscam::error::handle( e );
        return profile;
    }

    // Streams a single frame of the given profile and returns it as delivered by the SDK
    rscam::frame capture_one( const rs2_stream_profile * profile, void * pixels, int stride, int bpp )
    {
        rs2_error * e = nullptr;
        std::shared_ptr< rs2_frame_queue > queue( rs2_create_frame_queue( 1, &e ), rs2_delete_frame_queue );
        rscam::error::handle( e );

        rs2_open( _sensor.get(), profile, &e );
        rscam::error::handle( e );
        rs2_start_queue( _sensor.get(), queue.get(), &e );
        rscam::error::handle( e );

        rs2_software_video_frame sf = {};
        sf.pixels = pixels;
        sf.deleter = []( void * ) {};
        sf.stride = stride;
        sf.bpp = bpp;
        sf.timestamp = 1;
        sf.domain = RS2_TIMESTAMP_DOMAIN_HARDWARE_CLOCK;
        sf.frame_number = 1;
        sf.profile = profile;
        sf.depth_units = 0.001f;
        rs2_software_sensor_on_video_frame( _sensor.get(), sf, &e );
        rscam::error::handle( e );

        rscam::frame f( rs2_wait_for_frame( queue.get(), 5000, &e ) );
        rscam::error::handle( e );

        rs2_stop( _sensor.get(), &e );
        rscam::error::handle( e );
        rs2_close( _sensor.get(), &e );
        rscam::error::handle( e );
        return f;
    }
};


// Device with no hardware behind it, as used by the SDK's own offline tests
class software_device
{
    std::shared_ptr< rs2_device > _dev;

public:
    software_device()
    {
        rs2_error * e = nullptr;
        _dev = std::shared_ptr< rs2_device >( rs2_create_software_device( &e ), rs2_delete_device );
        rscam::error::handle( e );
    }

    software_sensor add_sensor( const std::string & name )
    {
        rs2_error * e = nullptr;
        std::shared_ptr< rs2_sensor > s( rs2_software_device_add_sensor( _dev.get(), name.c_str(), &e ),
                                         rs2_delete_sensor );
        rscam::error::handle( e );
        return software_sensor( s );
    }

    void register_info( rscam::camera_info info, const std::string & val )
    {
        rs2_error * e = nullptr;
        rs2_software_device_register_info( _dev.get(), rscam::to_rs2( info ), val.c_str(), &e );
        rscam::error::handle( e );
    }

    rscam::device get() const { return rscam::device( _dev ); }
};
