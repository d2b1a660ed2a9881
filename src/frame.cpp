// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#include <rscam/hpp/rscam_frame.hpp>
#include <rscam/hpp/rscam_sensor.hpp>

#include <sstream>

namespace rscam
{
    stream_profile::stream_profile(const rs2_stream_profile* profile, std::shared_ptr<const void> owner)
        : _profile(profile), _owner(std::move(owner))
    {
        rs2_error* e = nullptr;
        rs2_stream type = RS2_STREAM_ANY;
        rs2_format fmt = RS2_FORMAT_ANY;
        rs2_get_stream_profile_data(_profile, &type, &fmt, &_index, &_uid, &_framerate, &e);
        error::handle(e);
        _type = from_rs2(type);
        _format = from_rs2(fmt);

        _default = !!(rs2_is_stream_profile_default(_profile, &e));
        error::handle(e);
    }

    std::string stream_profile::stream_name() const
    {
        std::stringstream ss;
        ss << to_string(stream_type());
        if (stream_index() != 0) ss << " " << stream_index();
        return ss.str();
    }

    rscam::extrinsics stream_profile::get_extrinsics_to(const stream_profile& to) const
    {
        rs2_error* e = nullptr;
        rs2_extrinsics res;
        rs2_get_extrinsics(get(), to.get(), &res, &e);
        error::handle(e);
        return rscam::extrinsics(res);
    }

    video_stream_profile::video_stream_profile(const stream_profile& sp)
        : stream_profile(sp)
    {
        rs2_error* e = nullptr;
        if (_profile && rs2_stream_profile_is(_profile, RS2_EXTENSION_VIDEO_PROFILE, &e) == 0 && !e)
        {
            _profile = nullptr;
        }
        error::handle(e);

        if (_profile)
        {
            rs2_get_video_stream_resolution(_profile, &_width, &_height, &e);
            error::handle(e);
        }
    }

    rscam::intrinsics video_stream_profile::get_intrinsics() const
    {
        rs2_error* e = nullptr;
        rs2_intrinsics intr;
        rs2_get_video_stream_intrinsics(_profile, &intr, &e);
        error::handle(e);
        return rscam::intrinsics(intr);
    }

    motion_stream_profile::motion_stream_profile(const stream_profile& sp)
        : stream_profile(sp)
    {
        rs2_error* e = nullptr;
        if (_profile && rs2_stream_profile_is(_profile, RS2_EXTENSION_MOTION_PROFILE, &e) == 0 && !e)
        {
            _profile = nullptr;
        }
        error::handle(e);
    }

    rscam::motion_intrinsics motion_stream_profile::get_motion_intrinsics() const
    {
        rs2_error* e = nullptr;
        rs2_motion_device_intrinsic intrin;
        rs2_get_motion_intrinsics(_profile, &intrin, &e);
        error::handle(e);
        return rscam::motion_intrinsics(intrin);
    }

    frame::frame(const frame& other)
        : frame_ref(other.frame_ref)
    {
        if (frame_ref)
        {
            rs2_error* e = nullptr;
            rs2_frame_add_ref(frame_ref, &e);
            error::handle(e);
        }
    }

    double frame::get_timestamp() const
    {
        rs2_error* e = nullptr;
        auto r = rs2_get_frame_timestamp(frame_ref, &e);
        error::handle(e);
        return r;
    }

    timestamp_domain frame::get_frame_timestamp_domain() const
    {
        rs2_error* e = nullptr;
        auto r = rs2_get_frame_timestamp_domain(frame_ref, &e);
        error::handle(e);
        return from_rs2(r);
    }

    rs2_metadata_type frame::get_frame_metadata(rs2_frame_metadata_value frame_metadata) const
    {
        rs2_error* e = nullptr;
        auto r = rs2_get_frame_metadata(frame_ref, frame_metadata, &e);
        error::handle(e);
        return r;
    }

    bool frame::supports_frame_metadata(rs2_frame_metadata_value frame_metadata) const
    {
        rs2_error* e = nullptr;
        auto r = rs2_supports_frame_metadata(frame_ref, frame_metadata, &e);
        error::handle(e);
        return r != 0;
    }

    unsigned long long frame::get_frame_number() const
    {
        rs2_error* e = nullptr;
        auto r = rs2_get_frame_number(frame_ref, &e);
        error::handle(e);
        return r;
    }

    int frame::get_data_size() const
    {
        rs2_error* e = nullptr;
        auto r = rs2_get_frame_data_size(frame_ref, &e);
        error::handle(e);
        return r;
    }

    const void* frame::get_data() const
    {
        rs2_error* e = nullptr;
        auto r = rs2_get_frame_data(frame_ref, &e);
        error::handle(e);
        return r;
    }

    stream_profile frame::get_profile() const
    {
        rs2_error* e = nullptr;
        auto s = rs2_get_frame_stream_profile(frame_ref, &e);
        error::handle(e);

        // the profile belongs to the frame; hold a frame reference for as long as the profile lives
        auto owner = std::make_shared<frame>(*this);
        return stream_profile(s, owner);
    }

    sensor frame::get_sensor() const
    {
        rs2_error* e = nullptr;
        std::shared_ptr<rs2_sensor> s(
            rs2_get_frame_sensor(frame_ref, &e),
            rs2_delete_sensor);
        error::handle(e);
        return sensor(s);
    }

    bool frame::is_extendable_to(rs2_extension ext) const
    {
        rs2_error* e = nullptr;
        auto r = rs2_is_frame_extendable_to(frame_ref, ext, &e);
        error::handle(e);
        return r != 0;
    }

    video_frame::video_frame(const frame& f)
        : frame(f)
    {
        if (get() && !is_extendable_to(RS2_EXTENSION_VIDEO_FRAME))
            reset();
    }

    int video_frame::get_width() const
    {
        rs2_error* e = nullptr;
        auto r = rs2_get_frame_width(get(), &e);
        error::handle(e);
        return r;
    }

    int video_frame::get_height() const
    {
        rs2_error* e = nullptr;
        auto r = rs2_get_frame_height(get(), &e);
        error::handle(e);
        return r;
    }

    int video_frame::get_stride_in_bytes() const
    {
        rs2_error* e = nullptr;
        auto r = rs2_get_frame_stride_in_bytes(get(), &e);
        error::handle(e);
        return r;
    }

    int video_frame::get_bits_per_pixel() const
    {
        rs2_error* e = nullptr;
        auto r = rs2_get_frame_bits_per_pixel(get(), &e);
        error::handle(e);
        return r;
    }

    color_frame::color_frame(const frame& f)
        : video_frame(f)
    {
        if (get() && get_profile().stream_type() != stream_kind::color)
            reset();
    }

    infrared_frame::infrared_frame(const frame& f)
        : video_frame(f)
    {
        if (get() && get_profile().stream_type() != stream_kind::infrared)
            reset();
    }

    fisheye_frame::fisheye_frame(const frame& f)
        : video_frame(f)
    {
        if (get() && get_profile().stream_type() != stream_kind::fisheye)
            reset();
    }

    depth_frame::depth_frame(const frame& f)
        : video_frame(f)
    {
        // disparity frames carry the depth extension too, but hold disparity values
        if (get() && (!is_extendable_to(RS2_EXTENSION_DEPTH_FRAME) || is_extendable_to(RS2_EXTENSION_DISPARITY_FRAME)))
            reset();
    }

    depth_frame::depth_frame(const frame& f, unchecked)
        : video_frame(f)
    {
    }

    float depth_frame::get_distance(int x, int y) const
    {
        rs2_error* e = nullptr;
        auto r = rs2_depth_frame_get_distance(get(), x, y, &e);
        error::handle(e);
        return r;
    }

    float depth_frame::get_units() const
    {
        rs2_error* e = nullptr;
        auto r = rs2_depth_frame_get_units(get(), &e);
        error::handle(e);
        return r;
    }

    disparity_frame::disparity_frame(const frame& f)
        : depth_frame(f, unchecked())
    {
        if (get() && !is_extendable_to(RS2_EXTENSION_DISPARITY_FRAME))
            reset();
    }

    float disparity_frame::get_baseline() const
    {
        rs2_error* e = nullptr;
        auto r = rs2_depth_stereo_frame_get_baseline(get(), &e);
        error::handle(e);
        return r;
    }

    motion_frame::motion_frame(const frame& f)
        : frame(f)
    {
        if (get() && !is_extendable_to(RS2_EXTENSION_MOTION_FRAME))
            reset();
    }

    rs2_vector motion_frame::get_motion_data() const
    {
        auto data = reinterpret_cast<const float*>(get_data());
        return rs2_vector{ data[0], data[1], data[2] };
    }

    accel_frame::accel_frame(const frame& f)
        : motion_frame(f)
    {
        if (get() && get_profile().stream_type() != stream_kind::accel)
            reset();
    }

    gyro_frame::gyro_frame(const frame& f)
        : motion_frame(f)
    {
        if (get() && get_profile().stream_type() != stream_kind::gyro)
            reset();
    }

    pose_frame::pose_frame(const frame& f)
        : frame(f)
    {
        if (get() && !is_extendable_to(RS2_EXTENSION_POSE_FRAME))
            reset();
    }

    rs2_pose pose_frame::get_pose_data() const
    {
        rs2_pose pose_data;
        rs2_error* e = nullptr;
        rs2_pose_frame_get_pose_data(get(), &pose_data, &e);
        error::handle(e);
        return pose_data;
    }

    frameset::frameset(const frame& f)
        : frame(f), _size(0)
    {
        if (!get())
            return;

        if (!is_extendable_to(RS2_EXTENSION_COMPOSITE_FRAME))
        {
            reset();
            return;
        }

        rs2_error* e = nullptr;
        _size = rs2_embedded_frames_count(get(), &e);
        error::handle(e);
    }

    frame frameset::operator[](size_t index) const
    {
        if (index >= size())
            throw invalid_value_error("frameset index out of range", "rscam::frameset::operator[]",
                                      std::to_string(index));

        rs2_error* e = nullptr;
        frame f(rs2_extract_frame(get(), static_cast<int>(index), &e));
        error::handle(e);
        return f;
    }

    frame frameset::first(stream_kind kind) const
    {
        for (size_t i = 0; i < size(); i++)
        {
            auto f = (*this)[i];
            if (f.get_profile().stream_type() == kind)
                return f;
        }
        return frame();
    }

    frame frameset::first_or_throw(stream_kind kind) const
    {
        auto f = first(kind);
        if (!f)
            throw invalid_value_error(std::string("frameset has no ") + to_string(kind) + " frame",
                                      "rscam::frameset::first_or_throw");
        return f;
    }
}
