// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#include "log.h"

#include <rscam/rscam.hpp>

namespace rscam
{
    void log_message(rs2_log_severity severity, const std::string& message) noexcept
    {
        rs2_error* e = nullptr;
        rs2_log(severity, message.c_str(), &e);
        if (e)
            rs2_free_error(e);
    }

    int get_api_version()
    {
        rs2_error* e = nullptr;
        auto version = rs2_get_api_version(&e);
        error::handle(e);
        return version;
    }

    void log_to_console(log_severity min_severity)
    {
        rs2_error* e = nullptr;
        rs2_log_to_console(to_rs2(min_severity), &e);
        error::handle(e);
    }

    void log_to_file(log_severity min_severity, const char * file_path)
    {
        rs2_error* e = nullptr;
        rs2_log_to_file(to_rs2(min_severity), file_path, &e);
        error::handle(e);
    }

    void reset_logger()
    {
        rs2_error* e = nullptr;
        rs2_reset_logger(&e);
        error::handle(e);
    }

    void log(log_severity severity, const char* message)
    {
        rs2_error* e = nullptr;
        rs2_log(to_rs2(severity), message, &e);
        error::handle(e);
    }
}
