// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#ifndef RSCAM_CONTEXT_HPP
#define RSCAM_CONTEXT_HPP

#include "rscam_types.hpp"
#include "rscam_device.hpp"

#include <memory>
#include <string>
#include <vector>

namespace rscam
{
    /**
    * librealsense context, created for the API version this binding was compiled against
    */
    class context
    {
    public:
        context();

        /**
        * create a static snapshot of all connected devices at the time of the call
        * \return            the list of devices connected devices at the time of the call
        */
        device_list query_devices() const;

        /**
        * create a static snapshot of the connected devices belonging to the given product lines;
        * an empty set returns every device
        */
        device_list query_devices(const product_line_set& product_lines) const;

        /**
         * @brief Generate a flat list of all available sensors from all RealSense devices
         * @return List of sensors
         */
        std::vector<sensor> query_all_sensors() const;

        /**
         * Creates a device from a RealSense file
         *
         * On successful load, the device will be appended to the context and a devices_changed event triggered
         * @param file  Path to a RealSense File
         * @return A playback device matching the given file
         */
        device add_device(const std::string& file);

        void remove_device(const std::string& file);

        const std::shared_ptr<rs2_context>& get() const { return _context; }

    protected:
        friend class pipeline;
        std::shared_ptr<rs2_context> _context;
    };
}

#endif // RSCAM_CONTEXT_HPP
