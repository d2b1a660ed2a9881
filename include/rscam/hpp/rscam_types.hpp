// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#ifndef RSCAM_TYPES_HPP
#define RSCAM_TYPES_HPP

#include <librealsense2/rs.h>

#include <stdexcept>
#include <string>
#include <iterator>
#include <utility>
#include <vector>

// Default time, in milliseconds, a pipeline waits for a frameset before reporting failure
#define RSCAM_DEFAULT_TIMEOUT 15000u

namespace rscam
{
    /**
    * base class of every error raised by the binding, either converted from an rs2_error
    * returned by librealsense or detected by the binding itself before calling into it
    */
    class error : public std::runtime_error
    {
        std::string function, args;
        rs2_exception_type type;
    public:
        explicit error(rs2_error* err);

        error(const std::string& message,
              const std::string& function,
              const std::string& args,
              rs2_exception_type type);

        const std::string& get_failed_function() const
        {
            return function;
        }

        const std::string& get_failed_args() const
        {
            return args;
        }

        rs2_exception_type get_type() const { return type; }

        /**
        * throw the most specific error matching the exception type carried by e, if e is set;
        * the rs2_error object is released in any case
        */
        static void handle(rs2_error* e);
    };

    #define RSCAM_ERROR_CLASS(name, base) \
    class name : public base\
    {\
    public:\
        explicit name(rs2_error* e) noexcept : base(e) {}\
        name(const std::string& message, const std::string& function, const std::string& args = "") \
            : base(message, function, args, type_id()) {}\
        static rs2_exception_type type_id();\
    }

    RSCAM_ERROR_CLASS(camera_disconnected_error, error);
    RSCAM_ERROR_CLASS(backend_error, error);
    RSCAM_ERROR_CLASS(invalid_value_error, error);
    RSCAM_ERROR_CLASS(wrong_api_call_sequence_error, error);
    RSCAM_ERROR_CLASS(not_implemented_error, error);
    RSCAM_ERROR_CLASS(device_in_recovery_mode_error, error);
    RSCAM_ERROR_CLASS(io_error, error);
    #undef RSCAM_ERROR_CLASS

    /**
    * rectangle in pixel coordinates used by sensors that meter auto-exposure over a sub-region
    * of the image; bounds are inclusive
    */
    struct region_of_interest
    {
        int min_x;
        int min_y;
        int max_x;
        int max_y;

        int width() const { return max_x - min_x + 1; }
        int height() const { return max_y - min_y + 1; }

        // true when the corners are ordered and the rectangle fits inside a width x height image
        bool is_within(int image_width, int image_height) const
        {
            return 0 <= min_x && min_x <= max_x && max_x < image_width &&
                   0 <= min_y && min_y <= max_y && max_y < image_height;
        }

        bool operator==(const region_of_interest& other) const
        {
            return min_x == other.min_x && min_y == other.min_y &&
                   max_x == other.max_x && max_y == other.max_y;
        }
        bool operator!=(const region_of_interest& other) const { return !(*this == other); }
    };

    // same field order as rs2_get_option_range reports them
    struct option_range
    {
        float min;
        float max;
        float step;
        float def;

        bool contains(float value) const { return min <= value && value <= max; }
    };

    /**
    * pinhole camera model of a video stream
    */
    class intrinsics
    {
    public:
        intrinsics() : _intrinsics() {}
        explicit intrinsics(const rs2_intrinsics& intr) : _intrinsics(intr) {}

        int width() const { return _intrinsics.width; }
        int height() const { return _intrinsics.height; }
        float ppx() const { return _intrinsics.ppx; }
        float ppy() const { return _intrinsics.ppy; }
        float fx() const { return _intrinsics.fx; }
        float fy() const { return _intrinsics.fy; }
        rs2_distortion model() const { return _intrinsics.model; }
        std::vector<float> coeffs() const
        {
            return std::vector<float>(std::begin(_intrinsics.coeffs), std::end(_intrinsics.coeffs));
        }

        // horizontal and vertical field of view, in degrees
        std::pair<float, float> fov() const;

        const rs2_intrinsics& get() const { return _intrinsics; }

    private:
        rs2_intrinsics _intrinsics;
    };

    class motion_intrinsics
    {
    public:
        motion_intrinsics() : _intrinsics() {}
        explicit motion_intrinsics(const rs2_motion_device_intrinsic& intr) : _intrinsics(intr) {}

        // 3x4 scale/bias matrix, row major
        float data(int row, int col) const { return _intrinsics.data[row][col]; }
        const float* noise_variances() const { return _intrinsics.noise_variances; }
        const float* bias_variances() const { return _intrinsics.bias_variances; }

        const rs2_motion_device_intrinsic& get() const { return _intrinsics; }

    private:
        rs2_motion_device_intrinsic _intrinsics;
    };

    class extrinsics
    {
    public:
        extrinsics() : _extrinsics() {}
        explicit extrinsics(const rs2_extrinsics& extr) : _extrinsics(extr) {}

        // column-major 3x3 rotation
        const float* rotation() const { return _extrinsics.rotation; }
        // translation in meters
        const float* translation() const { return _extrinsics.translation; }

        const rs2_extrinsics& get() const { return _extrinsics; }

    private:
        rs2_extrinsics _extrinsics;
    };
}

#endif // RSCAM_TYPES_HPP
