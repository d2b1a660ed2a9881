// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#ifndef RSCAM_PIPELINE_HPP
#define RSCAM_PIPELINE_HPP

#include "rscam_types.hpp"
#include "rscam_frame.hpp"
#include "rscam_context.hpp"

#include <memory>
#include <string>
#include <vector>

namespace rscam
{
    /**
    * The pipeline profile includes a device and a selection of active streams, with specific profiles.
    * The profile is a selection of the above under filters and conditions defined by the pipeline.
    * Streams may belong to more than one sensor of the device.
    */
    class pipeline_profile
    {
    public:
        pipeline_profile() : _pipeline_profile(nullptr) {}

        /**
        * Return the selected streams profiles, which are enabled in this profile.
        * \return   Vector of stream profiles
        */
        std::vector<stream_profile> get_streams() const;

        /**
        * Return the stream profile that is enabled for the specified stream in this profile.
        * \param[in] stream_type     Stream type of the desired profile
        * \param[in] stream_index    Stream index of the desired profile. -1 for any matching.
        * \return   The first matching stream profile
        * throws invalid_value_error when no enabled stream matches
        */
        stream_profile get_stream(stream_kind stream_type, int stream_index = -1) const;

        /**
        * Retrieve the device used by the pipeline.
        * The device class provides the application access to control camera additional settings -
        * get device information, sensor options information, options value query and set, sensor specific extensions.
        * \return   The pipeline selected device
        */
        device get_device() const;

        explicit operator bool() const { return _pipeline_profile != nullptr; }

        explicit pipeline_profile(std::shared_ptr<rs2_pipeline_profile> profile) :
            _pipeline_profile(profile)
        {
        }
    private:
        std::shared_ptr<rs2_pipeline_profile> _pipeline_profile;
    };

    class pipeline;

    /**
    * The config allows pipeline users to request filters for the pipeline streams and device selection and configuration.
    * Every mutator returns the config itself so requests can be chained:
    *     cfg.enable_device(serial).disable_all_streams().enable_stream(stream_kind::depth, 0, 0, format::z16, 30);
    */
    class config
    {
    public:
        config();

        /**
        * Enable a device stream explicitly, with selected stream parameters.
        * Zero width, height or framerate, and format::any, leave the choice to the pipeline.
        * \param[in] stream_type    Stream type to be enabled
        * \param[in] stream_index   Stream index, used for multiple streams of the same type. -1 indicates any.
        */
        config& enable_stream(stream_kind stream_type, int stream_index, int width, int height,
                              rscam::format format = rscam::format::any, int framerate = 0);

        // as above, for any stream index
        config& enable_stream(stream_kind stream_type, int width, int height,
                              rscam::format format = rscam::format::any, int framerate = 0);

        config& enable_stream(stream_kind stream_type, int stream_index = -1);

        /**
        * Enable all device streams explicitly.
        */
        config& enable_all_streams();

        /**
        * Select a specific device explicitly by its serial number, to be used by the pipeline.
        * throws invalid_value_error for an empty serial
        */
        config& enable_device(const std::string& serial);

        /**
        * Select a recorded device from a file, to be used by the pipeline through playback.
        * \param[in] file_name      The playback file of the device
        * \param[in] repeat_playback  if true, when file ends the playback starts again, in an infinite loop;
                                    if false, when file ends playback does not start again, and should by stopped manually by the user.
        */
        config& enable_device_from_file(const std::string& file_name, bool repeat_playback = true);

        /**
        * Requires that the resolved device would be recorded to file
        */
        config& enable_record_to_file(const std::string& file_name);

        /**
        * Disable a device stream explicitly, to remove any requests on this stream profile.
        * \param[in] stream_index   Stream index; -1 disables every index of the stream type
        */
        config& disable_stream(stream_kind stream, int index = -1);

        /**
        * Disable all device stream explicitly, to remove any requests on the streams profiles.
        */
        config& disable_all_streams();

        /**
        * Resolve the configuration filters, to find a matching device and streams profiles.
        * throws when no device and stream combination satisfies the requests
        */
        pipeline_profile resolve(const pipeline& p) const;

        /**
        * Check if the config can resolve the configuration filters, to find a matching device and streams profiles.
        */
        bool can_resolve(const pipeline& p) const;

        std::shared_ptr<rs2_config> get() const { return _config; }

    private:
        std::shared_ptr<rs2_config> _config;
    };

    /**
    * The pipeline simplifies the user interaction with the device and computer vision processing modules.
    * The pipeline owns the streaming device; frames are retrieved with blocking waits or non-blocking polls.
    */
    class pipeline
    {
    public:
        explicit pipeline(context ctx = context());

        /**
        * Start the pipeline streaming with its default configuration.
        * \return  The actual pipeline device and streams profile, which was successfully configured to the streaming device.
        */
        pipeline_profile start();

        /**
        * Start the pipeline streaming according to the configuraion.
        * \param[in] config   A rscam::config with requested filters on the pipeline configuration.
        * \return             The actual pipeline device and streams profile, which was successfully configured to the streaming device on start.
        */
        pipeline_profile start(const config& config);

        /**
        * Stop the pipeline streaming.
        * throws wrong_api_call_sequence_error when the pipeline was not started
        */
        void stop();

        /**
        * Wait until a new set of frames becomes available.
        * \param[in] timeout_ms   Max time in milliseconds to wait until an exception will be thrown
        * \return                 Set of time synchronized frames, one from each active stream
        */
        frameset wait_for_frames(unsigned int timeout_ms = RSCAM_DEFAULT_TIMEOUT) const;

        /**
        * Check if a new set of frames is available and retrieve the latest undelivered set.
        * \param[out] f     Frames set, from the time synchronized frames of each active stream
        * \return           True if new set of time synchronized frames was stored to f, false if no new frames set is available
        */
        bool poll_for_frames(frameset* f) const;

        // same as wait_for_frames, reporting a timeout through the return value
        bool try_wait_for_frames(frameset* f, unsigned int timeout_ms = RSCAM_DEFAULT_TIMEOUT) const;

        /**
        * Return the active device and streams profiles, used by the pipeline.
        * throws wrong_api_call_sequence_error when the pipeline is not streaming
        */
        pipeline_profile get_active_profile() const;

        bool is_streaming() const { return _state->streaming; }

        const std::shared_ptr<rs2_pipeline>& get() const { return _pipeline; }

    private:
        struct state
        {
            bool streaming = false;
        };

        void ensure_streaming(const char* function) const;

        context _ctx;
        std::shared_ptr<rs2_pipeline> _pipeline;
        std::shared_ptr<state> _state;
        friend class config;
    };
}

#endif // RSCAM_PIPELINE_HPP
