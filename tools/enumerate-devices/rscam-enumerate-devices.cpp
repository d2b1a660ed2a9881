// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2015 Intel Corporation. All Rights Reserved.

#include <rscam/rscam.hpp>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cstdlib>
#include <algorithm>
#include <vector>

#include "tclap/CmdLine.h"

using namespace std;
using namespace TCLAP;
using namespace rscam;

void print(const intrinsics& intr)
{
    stringstream ss;
    ss << left << setw(14) << "  Width: " << "\t" << intr.width() << endl <<
        left << setw(14) << "  Height: " << "\t" << intr.height() << endl <<
        left << setw(14) << "  PPX: " << "\t" << setprecision(15) << intr.ppx() << endl <<
        left << setw(14) << "  PPY: " << "\t" << setprecision(15) << intr.ppy() << endl <<
        left << setw(14) << "  Fx: " << "\t" << setprecision(15) << intr.fx() << endl <<
        left << setw(14) << "  Fy: " << "\t" << setprecision(15) << intr.fy() << endl <<
        left << setw(14) << "  Distortion: " << "\t" << rs2_distortion_to_string(intr.model()) << endl <<
        left << setw(14) << "  Coeffs: ";

    for (auto c : intr.coeffs())
        ss << "\t" << setprecision(15) << c << "  ";

    auto fov = intr.fov();
    ss << endl << left << setw(14) << "  FOV (deg): " << "\t" << setprecision(4) << fov.first << " x " << fov.second;

    cout << ss.str() << endl << endl;
}

void print_device_info(const device& dev)
{
    cout << "Device info: \n";
    for (auto j = 0; j < RS2_CAMERA_INFO_COUNT; ++j)
    {
        auto param = from_rs2(static_cast<rs2_camera_info>(j));
        if (dev.supports(param))
            cout << "    " << left << setw(30) << param << ": \t" << dev.get_info(param) << endl;
    }
    cout << endl;
}

void print_options(const device& dev)
{
    for (auto&& s : dev.query_sensors())
    {
        cout << "Options for " << s.get_info(camera_info::name) << endl;

        cout << setw(35) << " Supported options:" << setw(10) << "value" << setw(10) << "min" << setw(10)
            << " max" << setw(6) << " step" << setw(10) << " default" << endl;
        for (auto opt : s.get_supported_options())
        {
            try
            {
                auto range = s.get_option_range(opt);
                cout << "    " << left << setw(30) << opt << " : "
                    << setw(10) << s.get_option(opt)
                    << setw(5) << range.min << "... " << setw(12) << range.max
                    << setw(6) << range.step << setw(10) << range.def
                    << (s.is_option_read_only(opt) ? " (read-only)" : "") << "\n";
            }
            catch (const error & e)
            {
                cerr << "RealSense error calling " << e.get_failed_function() << "(" << e.get_failed_args() << "):\n    " << e.what() << endl;
            }
        }
        cout << endl;
    }
}

void print_modes(const device& dev)
{
    for (auto&& s : dev.query_sensors())
    {
        cout << "Stream Profiles supported by " << s.get_info(camera_info::name)
            << " (" << s.extension() << ")" << endl;

        cout << " Supported modes:\n" << setw(16) << "    stream" << setw(16)
            << " resolution" << setw(10) << " fps" << setw(10) << " format" << endl;
        for (auto&& profile : s.get_stream_profiles())
        {
            if (auto video = profile.as<video_stream_profile>())
            {
                cout << "    " << profile.stream_name() << "\t  " << video.width() << "x"
                    << video.height() << "\t@ " << profile.fps() << setw(6) << "Hz\t" << profile.format() << endl;
            }
            else
            {
                cout << "    " << profile.stream_name() << "\t N/A\t\t@ " << profile.fps()
                    << setw(6) << "Hz\t" << profile.format() << endl;
            }
        }

        cout << endl;
    }
}

void print_defaults(const device& dev)
{
    if (!dev.supports(camera_info::serial_number))
    {
        cout << "Cannot list default streams since the device does not provide a serial number!" << endl << endl;
        return;
    }

    cout << "Default streams:" << endl;
    config cfg;
    cfg.enable_device(dev.get_info(camera_info::serial_number));
    pipeline p;
    auto profile = cfg.resolve(p);
    for (auto&& sp : profile.get_streams())
    {
        cout << "    " << sp.stream_name() << " as " << sp.format() << " at " << sp.fps() << " Hz";
        if (auto vp = sp.as<video_stream_profile>())
            cout << "; Resolution: " << vp.width() << "x" << vp.height();
        cout << endl;
    }
    cout << endl;
}

// one entry per distinct stream and resolution; the first profile's intrinsics stand for all its formats
void print_calibration(const device& dev)
{
    cout << "Intrinsic Parameters:\n" << endl;
    for (auto&& s : dev.query_sensors())
    {
        std::vector<std::pair<std::string, std::pair<int, int>>> seen;
        for (auto&& profile : s.get_stream_profiles())
        {
            auto video = profile.as<video_stream_profile>();
            if (!video)
                continue;

            auto key = std::make_pair(profile.stream_name(), std::make_pair(video.width(), video.height()));
            if (std::find(seen.begin(), seen.end(), key) != seen.end())
                continue;
            seen.push_back(key);

            cout << " Intrinsic of \"" << profile.stream_name() << "\" / " << video.width() << "x" << video.height() << endl;
            try
            {
                print(video.get_intrinsics());
            }
            catch (const error &)
            {
                cout << "Intrinsic NOT available!\n\n";
            }
        }
    }
}

int main(int argc, char** argv) try
{
    CmdLine cmd("rscam enumerate-devices tool", ' ', RS2_API_VERSION_STR);

    SwitchArg short_view_arg("s", "short", "Provide a one-line summary of the devices");
    SwitchArg show_options_arg("o", "option", "Show all the supported options per subdevice");
    SwitchArg show_calibration_data_arg("c", "calib_data", "Show intrinsics of all video streams");
    SwitchArg show_defaults("d", "defaults", "Show the default streams configuration");
    ValueArg<string> show_playback_device_arg("p", "playback_device", "Inspect and enumerate playback device (from file)",
        false, "", "Playback device - ROSBag record full path");
    ValueArg<string> product_line_arg("", "product-line", "Only list devices of this product line (D400, L500, SR300, ...)",
        false, "", "Product line");
    cmd.add(short_view_arg);
    cmd.add(show_options_arg);
    cmd.add(show_calibration_data_arg);
    cmd.add(show_defaults);
    cmd.add(show_playback_device_arg);
    cmd.add(product_line_arg);

    cmd.parse(argc, argv);

    log_to_console(log_severity::error);

    bool short_view = short_view_arg.getValue();
    bool show_options = show_options_arg.getValue();
    bool show_calibration_data = show_calibration_data_arg.getValue();
    auto playback_dev_file = show_playback_device_arg.getValue();

    if (short_view && (show_options || show_calibration_data))
    {
        cout << "Warning: the flag \"-s\" is compatible with \"-p\" and \"--product-line\" only,"
            << " other options will be ignored.\n" << endl;
    }

    product_line_set lines;
    if (!product_line_arg.getValue().empty())
        lines.insert(parse_product_line(product_line_arg.getValue()));

    context ctx;
    if (!playback_dev_file.empty())
        ctx.add_device(playback_dev_file);

    auto devices = ctx.query_devices(lines);
    if (devices.empty())
    {
        cout << "No device detected. Is it plugged in?\n";
        return EXIT_SUCCESS;
    }

    if (short_view)
    {
        cout << left << setw(30) << "Device Name"
            << setw(20) << "Serial Number"
            << setw(20) << "Firmware Version"
            << endl;

        for (auto&& dev : devices)
        {
            cout << left << setw(30) << dev.get_info(camera_info::name)
                << setw(20) << dev.get_info(camera_info::serial_number)
                << setw(20) << dev.get_info(camera_info::firmware_version)
                << endl;
        }
        return EXIT_SUCCESS;
    }

    for (auto&& dev : devices)
    {
        print_device_info(dev);

        if (show_defaults.getValue())
            print_defaults(dev);

        if (show_options)
            print_options(dev);

        print_modes(dev);

        if (show_calibration_data)
            print_calibration(dev);
    }

    return EXIT_SUCCESS;
}
catch (const ArgException& e)
{
    cerr << "error: " << e.error() << " for arg " << e.argId() << endl;
    return EXIT_FAILURE;
}
catch (const error & e)
{
    cerr << "RealSense error calling " << e.get_failed_function() << "(" << e.get_failed_args() << "):\n    " << e.what() << endl;
    return EXIT_FAILURE;
}
