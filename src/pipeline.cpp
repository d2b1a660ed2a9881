// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#include <rscam/hpp/rscam_pipeline.hpp>
#include "log.h"

namespace rscam
{
    std::vector<stream_profile> pipeline_profile::get_streams() const
    {
        std::vector<stream_profile> results;

        rs2_error* e = nullptr;
        std::shared_ptr<rs2_stream_profile_list> list(
            rs2_pipeline_profile_get_streams(_pipeline_profile.get(), &e),
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

    stream_profile pipeline_profile::get_stream(stream_kind stream_type, int stream_index) const
    {
        for (auto&& s : get_streams())
        {
            if (s.stream_type() == stream_type && (stream_index == -1 || s.stream_index() == stream_index))
            {
                return s;
            }
        }
        throw invalid_value_error("Profile does not contain the requested stream",
                                  "rscam::pipeline_profile::get_stream");
    }

    device pipeline_profile::get_device() const
    {
        rs2_error* e = nullptr;
        std::shared_ptr<rs2_device> dev(
            rs2_pipeline_profile_get_device(_pipeline_profile.get(), &e),
            rs2_delete_device);

        error::handle(e);

        return device(dev);
    }

    config::config()
    {
        rs2_error* e = nullptr;
        _config = std::shared_ptr<rs2_config>(
            rs2_create_config(&e),
            rs2_delete_config);
        error::handle(e);
    }

    config& config::enable_stream(stream_kind stream_type, int stream_index, int width, int height,
                                  rscam::format format, int framerate)
    {
        rs2_error* e = nullptr;
        rs2_config_enable_stream(_config.get(), to_rs2(stream_type), stream_index, width, height,
                                 to_rs2(format), framerate, &e);
        error::handle(e);
        return *this;
    }

    config& config::enable_stream(stream_kind stream_type, int width, int height,
                                  rscam::format format, int framerate)
    {
        return enable_stream(stream_type, -1, width, height, format, framerate);
    }

    config& config::enable_stream(stream_kind stream_type, int stream_index)
    {
        return enable_stream(stream_type, stream_index, 0, 0, rscam::format::any, 0);
    }

    config& config::enable_all_streams()
    {
        rs2_error* e = nullptr;
        rs2_config_enable_all_stream(_config.get(), &e);
        error::handle(e);
        return *this;
    }

    config& config::enable_device(const std::string& serial)
    {
        if (serial.empty())
            throw invalid_value_error("device serial number is empty", "rscam::config::enable_device");

        LOG_DEBUG("config requests device " << serial);

        rs2_error* e = nullptr;
        rs2_config_enable_device(_config.get(), serial.c_str(), &e);
        error::handle(e);
        return *this;
    }

    config& config::enable_device_from_file(const std::string& file_name, bool repeat_playback)
    {
        rs2_error* e = nullptr;
        rs2_config_enable_device_from_file_repeat_option(_config.get(), file_name.c_str(), repeat_playback, &e);
        error::handle(e);
        return *this;
    }

    config& config::enable_record_to_file(const std::string& file_name)
    {
        rs2_error* e = nullptr;
        rs2_config_enable_record_to_file(_config.get(), file_name.c_str(), &e);
        error::handle(e);
        return *this;
    }

    config& config::disable_stream(stream_kind stream, int index)
    {
        rs2_error* e = nullptr;
        if (index == -1)
            rs2_config_disable_stream(_config.get(), to_rs2(stream), &e);
        else
            rs2_config_disable_indexed_stream(_config.get(), to_rs2(stream), index, &e);
        error::handle(e);
        return *this;
    }

    config& config::disable_all_streams()
    {
        rs2_error* e = nullptr;
        rs2_config_disable_all_streams(_config.get(), &e);
        error::handle(e);
        return *this;
    }

    pipeline_profile config::resolve(const pipeline& p) const
    {
        rs2_error* e = nullptr;
        auto profile = std::shared_ptr<rs2_pipeline_profile>(
            rs2_config_resolve(_config.get(), p._pipeline.get(), &e),
            rs2_delete_pipeline_profile);

        error::handle(e);
        return pipeline_profile(profile);
    }

    bool config::can_resolve(const pipeline& p) const
    {
        rs2_error* e = nullptr;
        int res = rs2_config_can_resolve(_config.get(), p._pipeline.get(), &e);
        error::handle(e);
        return res != 0;
    }

    pipeline::pipeline(context ctx)
        : _ctx(ctx), _state(std::make_shared<state>())
    {
        rs2_error* e = nullptr;
        _pipeline = std::shared_ptr<rs2_pipeline>(
            rs2_create_pipeline(ctx._context.get(), &e),
            rs2_delete_pipeline);
        error::handle(e);
    }

    pipeline_profile pipeline::start()
    {
        rs2_error* e = nullptr;
        auto p = std::shared_ptr<rs2_pipeline_profile>(
            rs2_pipeline_start(_pipeline.get(), &e),
            rs2_delete_pipeline_profile);

        error::handle(e);
        _state->streaming = true;
        LOG_INFO("pipeline started with default configuration");
        return pipeline_profile(p);
    }

    pipeline_profile pipeline::start(const config& config)
    {
        rs2_error* e = nullptr;
        auto p = std::shared_ptr<rs2_pipeline_profile>(
            rs2_pipeline_start_with_config(_pipeline.get(), config.get().get(), &e),
            rs2_delete_pipeline_profile);

        error::handle(e);
        _state->streaming = true;
        LOG_INFO("pipeline started");
        return pipeline_profile(p);
    }

    void pipeline::stop()
    {
        ensure_streaming("rscam::pipeline::stop");

        rs2_error* e = nullptr;
        rs2_pipeline_stop(_pipeline.get(), &e);
        error::handle(e);
        _state->streaming = false;
        LOG_INFO("pipeline stopped");
    }

    frameset pipeline::wait_for_frames(unsigned int timeout_ms) const
    {
        ensure_streaming("rscam::pipeline::wait_for_frames");

        rs2_error* e = nullptr;
        frame f(rs2_pipeline_wait_for_frames(_pipeline.get(), timeout_ms, &e));
        error::handle(e);

        return frameset(f);
    }

    bool pipeline::poll_for_frames(frameset* f) const
    {
        ensure_streaming("rscam::pipeline::poll_for_frames");

        rs2_error* e = nullptr;
        rs2_frame* frame_ref = nullptr;
        auto res = rs2_pipeline_poll_for_frames(_pipeline.get(), &frame_ref, &e);
        error::handle(e);

        if (res) *f = frameset(frame(frame_ref));
        return res > 0;
    }

    bool pipeline::try_wait_for_frames(frameset* f, unsigned int timeout_ms) const
    {
        ensure_streaming("rscam::pipeline::try_wait_for_frames");

        rs2_error* e = nullptr;
        rs2_frame* frame_ref = nullptr;
        auto res = rs2_pipeline_try_wait_for_frames(_pipeline.get(), &frame_ref, timeout_ms, &e);
        error::handle(e);
        if (res) *f = frameset(frame(frame_ref));
        return res > 0;
    }

    pipeline_profile pipeline::get_active_profile() const
    {
        ensure_streaming("rscam::pipeline::get_active_profile");

        rs2_error* e = nullptr;
        auto p = std::shared_ptr<rs2_pipeline_profile>(
            rs2_pipeline_get_active_profile(_pipeline.get(), &e),
            rs2_delete_pipeline_profile);

        error::handle(e);
        return pipeline_profile(p);
    }

    void pipeline::ensure_streaming(const char* function) const
    {
        if (!_state->streaming)
            throw wrong_api_call_sequence_error("pipeline is not streaming; call start() first", function);
    }
}
