// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#include <rscam/hpp/rscam_types.hpp>

#include <cmath>

namespace rscam
{
    error::error(rs2_error* err) : std::runtime_error(rs2_get_error_message(err))
    {
        function = (nullptr != rs2_get_failed_function(err)) ? rs2_get_failed_function(err) : std::string();
        args = (nullptr != rs2_get_failed_args(err)) ? rs2_get_failed_args(err) : std::string();
        type = rs2_get_librealsense_exception_type(err);
        rs2_free_error(err);
    }

    error::error(const std::string& message,
                 const std::string& function,
                 const std::string& args,
                 rs2_exception_type type)
        : std::runtime_error(message), function(function), args(args), type(type)
    {
    }

    void error::handle(rs2_error* e)
    {
        if (e)
        {
            auto h = rs2_get_librealsense_exception_type(e);
            switch (h) {
            case RS2_EXCEPTION_TYPE_CAMERA_DISCONNECTED:
                throw camera_disconnected_error(e);
            case RS2_EXCEPTION_TYPE_BACKEND:
                throw backend_error(e);
            case RS2_EXCEPTION_TYPE_INVALID_VALUE:
                throw invalid_value_error(e);
            case RS2_EXCEPTION_TYPE_WRONG_API_CALL_SEQUENCE:
                throw wrong_api_call_sequence_error(e);
            case RS2_EXCEPTION_TYPE_NOT_IMPLEMENTED:
                throw not_implemented_error(e);
            case RS2_EXCEPTION_TYPE_DEVICE_IN_RECOVERY_MODE:
                throw device_in_recovery_mode_error(e);
            case RS2_EXCEPTION_TYPE_IO:
                throw io_error(e);
            default:
                throw error(e);
            }
        }
    }

    rs2_exception_type camera_disconnected_error::type_id() { return RS2_EXCEPTION_TYPE_CAMERA_DISCONNECTED; }
    rs2_exception_type backend_error::type_id() { return RS2_EXCEPTION_TYPE_BACKEND; }
    rs2_exception_type invalid_value_error::type_id() { return RS2_EXCEPTION_TYPE_INVALID_VALUE; }
    rs2_exception_type wrong_api_call_sequence_error::type_id() { return RS2_EXCEPTION_TYPE_WRONG_API_CALL_SEQUENCE; }
    rs2_exception_type not_implemented_error::type_id() { return RS2_EXCEPTION_TYPE_NOT_IMPLEMENTED; }
    rs2_exception_type device_in_recovery_mode_error::type_id() { return RS2_EXCEPTION_TYPE_DEVICE_IN_RECOVERY_MODE; }
    rs2_exception_type io_error::type_id() { return RS2_EXCEPTION_TYPE_IO; }

    std::pair<float, float> intrinsics::fov() const
    {
        const float pi = 3.14159265358979323846f;
        auto to_degrees = [pi](float rad) { return rad * 180.f / pi; };
        float horizontal = std::atan2(_intrinsics.ppx + 0.5f, _intrinsics.fx)
                         + std::atan2(_intrinsics.width - (_intrinsics.ppx + 0.5f), _intrinsics.fx);
        float vertical = std::atan2(_intrinsics.ppy + 0.5f, _intrinsics.fy)
                       + std::atan2(_intrinsics.height - (_intrinsics.ppy + 0.5f), _intrinsics.fy);
        return std::make_pair(to_degrees(horizontal), to_degrees(vertical));
    }
}
