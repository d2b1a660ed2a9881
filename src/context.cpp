// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#include <rscam/hpp/rscam_context.hpp>
#include "log.h"

#include <algorithm>
#include <iterator>

namespace rscam
{
    context::context()
    {
        rs2_error* e = nullptr;
        _context = std::shared_ptr<rs2_context>(
            rs2_create_context(RS2_API_VERSION, &e),
            rs2_delete_context);
        error::handle(e);
    }

    device_list context::query_devices() const
    {
        rs2_error* e = nullptr;
        std::shared_ptr<rs2_device_list> list(
            rs2_query_devices(_context.get(), &e),
            rs2_delete_device_list);
        error::handle(e);

        return device_list(list);
    }

    device_list context::query_devices(const product_line_set& product_lines) const
    {
        rs2_error* e = nullptr;
        std::shared_ptr<rs2_device_list> list(
            rs2_query_devices_ex(_context.get(), product_lines.mask(), &e),
            rs2_delete_device_list);
        error::handle(e);

        device_list devices(list);
        LOG_DEBUG("query_devices mask 0x" << std::hex << product_lines.mask() << std::dec
                  << " found " << devices.size() << " device(s)");
        return devices;
    }

    std::vector<sensor> context::query_all_sensors() const
    {
        std::vector<sensor> results;
        for (auto&& dev : query_devices())
        {
            auto sensors = dev.query_sensors();
            std::copy(sensors.begin(), sensors.end(), std::back_inserter(results));
        }
        return results;
    }

    device context::add_device(const std::string& file)
    {
        rs2_error* e = nullptr;
        auto dev = std::shared_ptr<rs2_device>(
            rs2_context_add_device(_context.get(), file.c_str(), &e),
            rs2_delete_device);
        error::handle(e);

        LOG_INFO("loaded playback device from " << file);
        return device(dev);
    }

    void context::remove_device(const std::string& file)
    {
        rs2_error* e = nullptr;
        rs2_context_remove_device(_context.get(), file.c_str(), &e);
        error::handle(e);
    }
}
