// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#include <rscam/hpp/rscam_sensor.hpp>
#include "log.h"

namespace rscam
{
    bool options::supports(rscam::option option) const
    {
        rs2_error* e = nullptr;
        auto res = rs2_supports_option(_options, to_rs2(option), &e);
        error::handle(e);
        return res > 0;
    }

    const char* options::get_option_description(rscam::option option) const
    {
        rs2_error* e = nullptr;
        auto res = rs2_get_option_description(_options, to_rs2(option), &e);
        error::handle(e);
        return res;
    }

    float options::get_option(rscam::option option) const
    {
        if (!supports(option))
            throw invalid_value_error(std::string("option ") + to_string(option) + " is not supported",
                                      "rscam::options::get_option", to_string(option));

        rs2_error* e = nullptr;
        auto res = rs2_get_option(_options, to_rs2(option), &e);
        error::handle(e);
        return res;
    }

    option_range options::get_option_range(rscam::option option) const
    {
        option_range result;
        rs2_error* e = nullptr;
        rs2_get_option_range(_options, to_rs2(option),
            &result.min, &result.max, &result.step, &result.def, &e);
        error::handle(e);
        return result;
    }

    void options::set_option(rscam::option option, float value) const
    {
        if (!supports(option))
            throw invalid_value_error(std::string("option ") + to_string(option) + " is not supported",
                                      "rscam::options::set_option", to_string(option));
        if (is_option_read_only(option))
            throw invalid_value_error(std::string("option ") + to_string(option) + " is read-only",
                                      "rscam::options::set_option", to_string(option));

        LOG_DEBUG("set_option " << option << " = " << value);

        rs2_error* e = nullptr;
        rs2_set_option(_options, to_rs2(option), value, &e);
        error::handle(e);
    }

    bool options::is_option_read_only(rscam::option option) const
    {
        rs2_error* e = nullptr;
        auto res = rs2_is_option_read_only(_options, to_rs2(option), &e);
        error::handle(e);
        return res > 0;
    }

    std::vector<rscam::option> options::get_supported_options() const
    {
        std::vector<rscam::option> res;
        rs2_error* e = nullptr;
        std::shared_ptr<rs2_options_list> options_list(
            rs2_get_options_list(_options, &e),
            rs2_delete_options_list);
        error::handle(e);

        auto size = rs2_get_options_list_size(options_list.get(), &e);
        error::handle(e);

        for (auto i = 0; i < size; i++)
        {
            auto opt = rs2_get_option_from_list(options_list.get(), i, &e);
            error::handle(e);
            res.push_back(from_rs2(opt));
        }
        return res;
    }

    sensor::sensor(const sensor& s, rscam::extension ext)
        : options(s), _sensor(s._sensor)
    {
        if (_sensor && !is_extendable_to(ext))
            invalidate();
    }

    bool sensor::supports(camera_info info) const
    {
        rs2_error* e = nullptr;
        auto is_supported = rs2_supports_sensor_info(_sensor.get(), to_rs2(info), &e);
        error::handle(e);
        return is_supported > 0;
    }

    const char* sensor::get_info(camera_info info) const
    {
        rs2_error* e = nullptr;
        auto result = rs2_get_sensor_info(_sensor.get(), to_rs2(info), &e);
        error::handle(e);
        return result;
    }

    bool sensor::is_extendable_to(rscam::extension ext) const
    {
        rs2_error* e = nullptr;
        auto res = rs2_is_sensor_extendable_to(_sensor.get(), to_rs2(ext), &e);
        error::handle(e);
        return res > 0;
    }

    rscam::extension sensor::extension() const
    {
        // most specific first: a depth stereo sensor is also a depth sensor
        static const rscam::extension sensor_kinds[] = {
            rscam::extension::color_sensor,
            rscam::extension::depth_stereo_sensor,
            rscam::extension::depth_sensor,
            rscam::extension::motion_sensor,
            rscam::extension::fisheye_sensor,
            rscam::extension::pose_sensor,
            rscam::extension::software_sensor,
            rscam::extension::l500_depth_sensor,
            rscam::extension::max_usable_range_sensor,
            rscam::extension::debug_stream_sensor,
        };

        for (auto kind : sensor_kinds)
            if (is_extendable_to(kind))
                return kind;
        return rscam::extension::unknown;
    }

    std::vector<stream_profile> sensor::get_stream_profiles() const
    {
        std::vector<stream_profile> results{};

        rs2_error* e = nullptr;
        std::shared_ptr<rs2_stream_profile_list> list(
            rs2_get_stream_profiles(_sensor.get(), &e),
            rs2_delete_stream_profiles_list);
        error::handle(e);

        auto size = rs2_get_stream_profiles_count(list.get(), &e);
        error::handle(e);

        for (auto i = 0; i < size; i++)
        {
            auto p = rs2_get_stream_profile(list.get(), i, &e);
            error::handle(e);
            results.push_back(stream_profile(p, list));
        }

        return results;
    }

    region_of_interest sensor::get_region_of_interest() const
    {
        if (!is_extendable_to(rscam::extension::roi))
            throw not_implemented_error("sensor does not support an auto-exposure region of interest",
                                        "rscam::sensor::get_region_of_interest");

        region_of_interest roi {};
        rs2_error* e = nullptr;
        rs2_get_region_of_interest(_sensor.get(), &roi.min_x, &roi.min_y, &roi.max_x, &roi.max_y, &e);
        error::handle(e);
        return roi;
    }

    void sensor::set_region_of_interest(const region_of_interest& roi)
    {
        if (!is_extendable_to(rscam::extension::roi))
            throw not_implemented_error("sensor does not support an auto-exposure region of interest",
                                        "rscam::sensor::set_region_of_interest");

        LOG_DEBUG("set_region_of_interest " << roi.min_x << "," << roi.min_y << " .. " << roi.max_x << "," << roi.max_y);

        rs2_error* e = nullptr;
        rs2_set_region_of_interest(_sensor.get(), roi.min_x, roi.min_y, roi.max_x, roi.max_y, &e);
        error::handle(e);
    }

    float depth_sensor::get_depth_scale() const
    {
        rs2_error* e = nullptr;
        auto res = rs2_get_depth_scale(_sensor.get(), &e);
        error::handle(e);
        return res;
    }

    depth_stereo_sensor::depth_stereo_sensor(const sensor& s)
        : depth_sensor(s)
    {
        if (_sensor && !is_extendable_to(rscam::extension::depth_stereo_sensor))
            invalidate();
    }

    float depth_stereo_sensor::get_stereo_baseline() const
    {
        rs2_error* e = nullptr;
        auto res = rs2_get_stereo_baseline(_sensor.get(), &e);
        error::handle(e);
        return res;
    }
}
