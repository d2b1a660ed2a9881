// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#include <rscam/hpp/rscam_device.hpp>

#include <locale>
#include <sstream>
#include <string>
#include <utility>

namespace rscam
{
    std::vector<sensor> device::query_sensors() const
    {
        rs2_error* e = nullptr;
        std::shared_ptr<rs2_sensor_list> list(
            rs2_query_sensors(_dev.get(), &e),
            rs2_delete_sensor_list);
        error::handle(e);

        auto size = rs2_get_sensors_count(list.get(), &e);
        error::handle(e);

        std::vector<sensor> results;
        for (auto i = 0; i < size; i++)
        {
            std::shared_ptr<rs2_sensor> dev(
                rs2_create_sensor(list.get(), i, &e),
                rs2_delete_sensor);
            error::handle(e);

            sensor rs2_dev(dev);
            results.push_back(rs2_dev);
        }

        return results;
    }

    bool device::supports(camera_info info) const
    {
        rs2_error* e = nullptr;
        auto is_supported = rs2_supports_device_info(_dev.get(), to_rs2(info), &e);
        error::handle(e);
        return is_supported > 0;
    }

    const char* device::get_info(camera_info info) const
    {
        if (!supports(info))
            throw invalid_value_error(std::string("device does not report ") + to_string(info),
                                      "rscam::device::get_info", to_string(info));

        rs2_error* e = nullptr;
        auto result = rs2_get_device_info(_dev.get(), to_rs2(info), &e);
        error::handle(e);
        return result;
    }

    void device::hardware_reset()
    {
        rs2_error* e = nullptr;

        rs2_hardware_reset(_dev.get(), &e);
        error::handle(e);
    }

    rscam::product_line device::product_line() const
    {
        return parse_product_line(get_info(camera_info::product_line));
    }

    float device::usb_type() const
    {
        std::string descriptor = get_info(camera_info::usb_type_descriptor);

        // the descriptor always uses '.', whatever the process locale says
        std::istringstream ss(descriptor);
        ss.imbue(std::locale::classic());
        float value = 0.f;
        ss >> value;
        if (ss.fail() || !ss.eof())
            throw invalid_value_error("malformed USB type descriptor \"" + descriptor + "\"",
                                      "rscam::device::usb_type", descriptor);
        return value;
    }

    device_list::device_list(std::shared_ptr<rs2_device_list> list)
        : _list(std::move(list))
    {
        rs2_error* e = nullptr;
        _size = rs2_get_device_count(_list.get(), &e);
        error::handle(e);
    }

    bool device_list::contains(const device& dev) const
    {
        rs2_error* e = nullptr;
        auto res = !!(rs2_device_list_contains(_list.get(), dev.get().get(), &e));
        error::handle(e);
        return res;
    }

    device device_list::operator[](size_t index) const
    {
        if (index >= _size)
            throw invalid_value_error("device index out of range", "rscam::device_list::operator[]",
                                      std::to_string(index));

        rs2_error* e = nullptr;
        std::shared_ptr<rs2_device> dev(
            rs2_create_device(_list.get(), static_cast<int>(index), &e),
            rs2_delete_device);
        error::handle(e);

        return device(dev);
    }
}
