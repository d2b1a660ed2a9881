// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.
#pragma once

#include <librealsense2/rs.h>

#include <sstream>
#include <string>

namespace rscam
{
    // Forwards a message to the librealsense logger; a message the logger rejects is dropped
    void log_message(rs2_log_severity severity, const std::string& message) noexcept;
}

#define LOG_DEBUG(...)   do { std::ostringstream ss; ss << __VA_ARGS__; rscam::log_message( RS2_LOG_SEVERITY_DEBUG, ss.str() ); } while(false)
#define LOG_INFO(...)    do { std::ostringstream ss; ss << __VA_ARGS__; rscam::log_message( RS2_LOG_SEVERITY_INFO, ss.str() ); } while(false)
#define LOG_WARNING(...) do { std::ostringstream ss; ss << __VA_ARGS__; rscam::log_message( RS2_LOG_SEVERITY_WARN, ss.str() ); } while(false)
#define LOG_ERROR(...)   do { std::ostringstream ss; ss << __VA_ARGS__; rscam::log_message( RS2_LOG_SEVERITY_ERROR, ss.str() ); } while(false)
