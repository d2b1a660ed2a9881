// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#ifndef RSCAM_HPP
#define RSCAM_HPP

#include <librealsense2/rs.h>
#include "hpp/rscam_types.hpp"
#include "hpp/rscam_kinds.hpp"
#include "hpp/rscam_context.hpp"
#include "hpp/rscam_device.hpp"
#include "hpp/rscam_frame.hpp"
#include "hpp/rscam_sensor.hpp"
#include "hpp/rscam_pipeline.hpp"

#include <ostream>

namespace rscam
{
    /**
    * librealsense version this binding is running against, as major * 10000 + minor * 100 + patch
    */
    int get_api_version();

    void log_to_console(log_severity min_severity);

    void log_to_file(log_severity min_severity, const char * file_path = nullptr);

    void reset_logger();

    void log(log_severity severity, const char* message);

    inline std::ostream & operator << (std::ostream & o, const region_of_interest& roi)
    {
        return o << "[" << roi.min_x << "," << roi.min_y << " .. " << roi.max_x << "," << roi.max_y << "]";
    }
    inline std::ostream & operator << (std::ostream & o, const stream_profile& profile)
    {
        return o << profile.stream_name() << " " << profile.format() << " @ " << profile.fps() << "Hz";
    }
}

#endif // RSCAM_HPP
