// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#ifndef RSCAM_SENSOR_HPP
#define RSCAM_SENSOR_HPP

#include "rscam_types.hpp"
#include "rscam_kinds.hpp"
#include "rscam_frame.hpp"

#include <memory>
#include <string>
#include <vector>

namespace rscam
{
    class options
    {
    public:
        /**
        * check if particular option is supported
        * \param[in] option     option id to be checked
        * \return true if option is supported
        */
        bool supports(rscam::option option) const;

        /**
        * get option description
        * \param[in] option     option id to be checked
        * \return human-readable option description
        */
        const char* get_option_description(rscam::option option) const;

        /**
        * read option value from the device
        * \param[in] option   option id to be queried
        * \return value of the option
        * throws invalid_value_error when the option is not supported
        */
        float get_option(rscam::option option) const;

        /**
        * retrieve the available range of values of a supported option
        * \return option range containing minimum and maximum values, step and default value
        */
        option_range get_option_range(rscam::option option) const;

        /**
        * write new value to device option
        * throws invalid_value_error when the option is not supported or read-only; errors the
        * device reports while applying the value are raised as they come
        */
        void set_option(rscam::option option, float value) const;

        /**
        * check if particular option is read-only
        */
        bool is_option_read_only(rscam::option option) const;

        // every option the object reports as supported
        std::vector<rscam::option> get_supported_options() const;

        virtual ~options() = default;

    protected:
        explicit options(rs2_options* o = nullptr) : _options(o) {}

        template<class T>
        options& operator=(const T& dev)
        {
            _options = (rs2_options*)(dev.get());
            return *this;
        }

        options(const options& other) : _options(other._options) {}
        options& operator=(const options& other) = default;

    private:
        rs2_options* _options;
    };

    class sensor : public options
    {
    public:
        using options::supports;

        sensor() : _sensor(nullptr) {}

        /**
        * check if specific camera info is supported
        * \param[in] info    the parameter to check for support
        * \return                true if the parameter both exist and well-defined for the specific sensor
        */
        bool supports(camera_info info) const;

        /**
        * retrieve camera specific information, like versions of various internal components
        * \param[in] info     camera info type to retrieve
        * \return             the requested camera info string, in a format specific to the sensor model
        */
        const char* get_info(camera_info info) const;

        /**
        * check if the sensor can be viewed as the given extension
        */
        bool is_extendable_to(rscam::extension ext) const;

        /**
        * most specific sensor kind this sensor supports (color, depth stereo, motion, ...)
        * \return extension::unknown when the sensor matches none of them
        */
        rscam::extension extension() const;

        /**
        * retrieves the list of stream profiles supported by the sensor
        */
        std::vector<stream_profile> get_stream_profiles() const;

        /**
        * region of the image that auto-exposure meters over
        * throws not_implemented_error when the sensor has no auto-exposure region
        */
        region_of_interest get_region_of_interest() const;

        void set_region_of_interest(const region_of_interest& roi);

        explicit operator bool() const { return _sensor != nullptr; }

        const std::shared_ptr<rs2_sensor>& get() const { return _sensor; }

        template<class T>
        bool is() const
        {
            T extension(*this);
            return static_cast<bool>(extension);
        }

        template<class T>
        T as() const
        {
            T extension(*this);
            return extension;
        }

        explicit sensor(std::shared_ptr<rs2_sensor> dev)
            : options((rs2_options*)dev.get()), _sensor(dev)
        {
        }

        bool operator==(const sensor& other) const
        {
            return _sensor == other._sensor;
        }

    protected:
        friend class device;
        friend class frame;

        // sensor view that is empty unless s supports ext
        sensor(const sensor& s, rscam::extension ext);

        void invalidate()
        {
            _sensor.reset();
            options::operator=(_sensor);
        }

        std::shared_ptr<rs2_sensor> _sensor;
    };

    class color_sensor : public sensor
    {
    public:
        explicit color_sensor(const sensor& s) : sensor(s, rscam::extension::color_sensor) {}
    };

    class depth_sensor : public sensor
    {
    public:
        explicit depth_sensor(const sensor& s) : sensor(s, rscam::extension::depth_sensor) {}

        /** Retrieves mapping between the units of the depth image and meters
        * \return depth in meters corresponding to a depth value of 1
        */
        float get_depth_scale() const;
    };

    class depth_stereo_sensor : public depth_sensor
    {
    public:
        explicit depth_stereo_sensor(const sensor& s);

        /** Retrieve the stereoscopic baseline value from the sensor, in millimeters
        */
        float get_stereo_baseline() const;
    };

    class motion_sensor : public sensor
    {
    public:
        explicit motion_sensor(const sensor& s) : sensor(s, rscam::extension::motion_sensor) {}
    };

    class fisheye_sensor : public sensor
    {
    public:
        explicit fisheye_sensor(const sensor& s) : sensor(s, rscam::extension::fisheye_sensor) {}
    };

    class pose_sensor : public sensor
    {
    public:
        explicit pose_sensor(const sensor& s) : sensor(s, rscam::extension::pose_sensor) {}
    };
}

#endif // RSCAM_SENSOR_HPP
