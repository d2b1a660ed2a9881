// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#ifndef RSCAM_DEVICE_HPP
#define RSCAM_DEVICE_HPP

#include "rscam_types.hpp"
#include "rscam_sensor.hpp"

#include <memory>
#include <vector>

namespace rscam
{
    class context;
    class device_list;
    class pipeline_profile;

    class device
    {
    public:
        /**
        * returns the list of adjacent devices, sharing the same physical parent composite device
        * \return            the list of adjacent devices
        */
        std::vector<sensor> query_sensors() const;

        template<class T>
        T first() const
        {
            for (auto&& s : query_sensors())
            {
                if (auto t = s.as<T>()) return t;
            }
            throw invalid_value_error("Could not find requested sensor type!", "rscam::device::first");
        }

        /**
        * check if specific camera info is supported
        * \param[in] info    the parameter to check for support
        * \return                true if the parameter both exist and well-defined for the specific device
        */
        bool supports(camera_info info) const;

        /**
        * retrieve camera specific information, like versions of various internal components
        * \param[in] info     camera info type to retrieve
        * \return             the requested camera info string, in a format specific to the device model
        * throws invalid_value_error when the device does not report info
        */
        const char* get_info(camera_info info) const;

        /**
        * send hardware reset request to the device
        */
        void hardware_reset();

        // product line the device reports under camera_info::product_line
        rscam::product_line product_line() const;

        /**
        * USB type descriptor as a number, 2.1 or 3.2 for example
        * throws invalid_value_error when the descriptor is missing or malformed
        */
        float usb_type() const;

        device() : _dev(nullptr) {}
        explicit device(std::shared_ptr<rs2_device> dev) : _dev(dev) {}

        explicit operator bool() const { return _dev != nullptr; }
        const std::shared_ptr<rs2_device>& get() const { return _dev; }

        bool operator==(const device& other) const { return _dev == other._dev; }

    protected:
        friend class context;
        friend class device_list;
        friend class pipeline_profile;

        std::shared_ptr<rs2_device> _dev;
    };

    class device_list
    {
    public:
        explicit device_list(std::shared_ptr<rs2_device_list> list);

        device_list() : _list(nullptr), _size(0) {}

        bool contains(const device& dev) const;

        // throws invalid_value_error when index is past the end of the list
        device operator[](size_t index) const;

        size_t size() const { return _size; }
        bool empty() const { return _size == 0; }

        device front() const { return (*this)[0]; }
        device back() const
        {
            return (*this)[size() - 1];
        }

        class device_list_iterator
        {
            device_list_iterator(
                const device_list& device_list,
                size_t index)
                : _list(device_list),
                  _index(index)
            {
            }

        public:
            device operator*() const
            {
                return _list[_index];
            }
            bool operator!=(const device_list_iterator& other) const
            {
                return other._index != _index || &other._list != &_list;
            }
            bool operator==(const device_list_iterator& other) const
            {
                return !(*this != other);
            }
            device_list_iterator& operator++()
            {
                _index++;
                return *this;
            }
        private:
            friend device_list;
            const device_list& _list;
            size_t _index;
        };

        device_list_iterator begin() const
        {
            return device_list_iterator(*this, 0);
        }
        device_list_iterator end() const
        {
            return device_list_iterator(*this, size());
        }
        const rs2_device_list* get_list() const
        {
            return _list.get();
        }

        operator std::shared_ptr<rs2_device_list>() { return _list; };

    private:
        std::shared_ptr<rs2_device_list> _list;
        size_t _size;
    };
}

#endif // RSCAM_DEVICE_HPP
