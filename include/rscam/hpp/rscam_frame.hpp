// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#ifndef RSCAM_FRAME_HPP
#define RSCAM_FRAME_HPP

#include "rscam_types.hpp"
#include "rscam_kinds.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rscam
{
    class sensor;
    class frame;
    class pipeline_profile;

    class stream_profile
    {
    public:
        stream_profile() : _profile(nullptr) {}

        int stream_index() const { return _index; }
        stream_kind stream_type() const { return _type; }
        rscam::format format() const { return _format; }

        int fps() const { return _framerate; }

        int unique_id() const { return _uid; }

        bool operator==(const stream_profile& rhs) const
        {
            return  stream_index() == rhs.stream_index() &&
                    stream_type() == rhs.stream_type() &&
                    format() == rhs.format() &&
                    fps() == rhs.fps();
        }
        bool operator!=(const stream_profile& rhs) const { return !(*this == rhs); }

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

        // "Infrared 1", "Depth", ...
        std::string stream_name() const;

        bool is_default() const { return _default; }

        explicit operator bool() const { return _profile != nullptr; }

        const rs2_stream_profile* get() const { return _profile; }

        rscam::extrinsics get_extrinsics_to(const stream_profile& to) const;

    protected:
        friend class rscam::sensor;
        friend class rscam::frame;
        friend class rscam::pipeline_profile;

        // owner keeps alive whatever SDK object the profile pointer belongs to (list, frame)
        stream_profile(const rs2_stream_profile* profile, std::shared_ptr<const void> owner);

        const rs2_stream_profile* _profile;
        std::shared_ptr<const void> _owner;

        int _index = 0;
        int _uid = 0;
        int _framerate = 0;
        rscam::format _format = rscam::format::any;
        stream_kind _type = stream_kind::any;

        bool _default = false;
    };

    class video_stream_profile : public stream_profile
    {
    public:
        explicit video_stream_profile(const stream_profile& sp);

        int width() const { return _width; }
        int height() const { return _height; }

        rscam::intrinsics get_intrinsics() const;

    private:
        int _width = 0;
        int _height = 0;
    };

    class motion_stream_profile : public stream_profile
    {
    public:
        explicit motion_stream_profile(const stream_profile& sp);

        /**
        * returns scale and bias of the motion stream profile
        */
        rscam::motion_intrinsics get_motion_intrinsics() const;
    };

    class frame
    {
    public:
        frame() : frame_ref(nullptr) {}
        // takes ownership of one reference to frame_ref
        explicit frame(rs2_frame* frame_ref) : frame_ref(frame_ref) {}

        frame(frame&& other) noexcept : frame_ref(other.frame_ref)
        {
            other.frame_ref = nullptr;
        }
        frame& operator=(frame other)
        {
            swap(other);
            return *this;
        }
        frame(const frame& other);

        void swap(frame& other)
        {
            std::swap(frame_ref, other.frame_ref);
        }

        /**
        * releases the frame handle
        */
        ~frame()
        {
            if (frame_ref)
            {
                rs2_release_frame(frame_ref);
            }
        }

        explicit operator bool() const { return frame_ref != nullptr; }

        /**
        * retrieve the time at which the frame was captured
        * \return            the timestamp of the frame, in milliseconds, in the frame's timestamp domain
        */
        double get_timestamp() const;

        timestamp_domain get_frame_timestamp_domain() const;

        rs2_metadata_type get_frame_metadata(rs2_frame_metadata_value frame_metadata) const;

        bool supports_frame_metadata(rs2_frame_metadata_value frame_metadata) const;

        /**
        * retrieve frame number, as counted by the device since the stream was started
        */
        unsigned long long get_frame_number() const;

        /**
        * retrieve data size from frame handle
        * \return               the number of bytes in frame
        */
        int get_data_size() const;

        const void* get_data() const;

        stream_profile get_profile() const;

        // sensor that produced the frame
        sensor get_sensor() const;

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

        rs2_frame* get() const { return frame_ref; }

    protected:
        void reset()
        {
            if (frame_ref)
            {
                rs2_release_frame(frame_ref);
            }
            frame_ref = nullptr;
        }

        bool is_extendable_to(rs2_extension ext) const;

    private:
        rs2_frame* frame_ref;
    };

    class video_frame : public frame
    {
    public:
        explicit video_frame(const frame& f);

        int get_width() const;
        int get_height() const;
        int get_stride_in_bytes() const;
        int get_bits_per_pixel() const;
        int get_bytes_per_pixel() const { return get_bits_per_pixel() / 8; }
    };

    class color_frame : public video_frame
    {
    public:
        explicit color_frame(const frame& f);
    };

    class infrared_frame : public video_frame
    {
    public:
        explicit infrared_frame(const frame& f);
    };

    class fisheye_frame : public video_frame
    {
    public:
        explicit fisheye_frame(const frame& f);
    };

    class depth_frame : public video_frame
    {
    public:
        explicit depth_frame(const frame& f);

        /**
        * distance, in meters, from the camera to the object seen at pixel (x, y)
        */
        float get_distance(int x, int y) const;

        // meters per depth unit
        float get_units() const;

    protected:
        struct unchecked {};
        depth_frame(const frame& f, unchecked);
    };

    class disparity_frame : public depth_frame
    {
    public:
        explicit disparity_frame(const frame& f);

        // stereo baseline, in millimeters, used to derive depth from disparity
        float get_baseline() const;
    };

    class motion_frame : public frame
    {
    public:
        explicit motion_frame(const frame& f);

        rs2_vector get_motion_data() const;
    };

    class accel_frame : public motion_frame
    {
    public:
        explicit accel_frame(const frame& f);
    };

    class gyro_frame : public motion_frame
    {
    public:
        explicit gyro_frame(const frame& f);
    };

    class pose_frame : public frame
    {
    public:
        explicit pose_frame(const frame& f);

        rs2_pose get_pose_data() const;
    };

    /**
    * the set of synchronized frames returned by a single pipeline wait
    */
    class frameset : public frame
    {
    public:
        frameset() : _size(0) {}
        explicit frameset(const frame& f);

        size_t size() const { return _size; }

        frame operator[](size_t index) const;

        // first embedded frame of the given stream kind, or an empty frame
        frame first(stream_kind kind) const;

        // first embedded frame of the given stream kind; throws when there is none
        frame first_or_throw(stream_kind kind) const;

        template<class T>
        std::vector<T> frames_of_type() const
        {
            std::vector<T> result;
            for (size_t i = 0; i < size(); i++)
            {
                T f((*this)[i]);
                if (f)
                    result.push_back(f);
            }
            return result;
        }

        class iterator
        {
        public:
            iterator(const frameset* owner, size_t index = 0) : _index(index), _owner(owner) {}
            iterator& operator++() { ++_index; return *this; }
            bool operator==(const iterator& other) const { return _index == other._index; }
            bool operator!=(const iterator& other) const { return !(*this == other); }

            frame operator*() { return (*_owner)[_index]; }
        private:
            size_t _index = 0;
            const frameset* _owner;
        };

        iterator begin() const { return iterator(this); }
        iterator end() const { return iterator(this, size()); }

    private:
        size_t _size;
    };
}

#endif // RSCAM_FRAME_HPP
