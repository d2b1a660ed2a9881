// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#ifndef RSCAM_KINDS_HPP
#define RSCAM_KINDS_HPP

#include <librealsense2/rs.h>

#include <initializer_list>
#include <ostream>
#include <set>
#include <string>

namespace rscam
{
    // Product line bits as reported by RS2_CAMERA_INFO_PRODUCT_LINE and accepted by rs2_query_devices_ex
    enum class product_line : int
    {
        any       = 0xff,
        any_intel = 0xfe,
        non_intel = 0x01,
        d400      = 0x02,
        sr300     = 0x04,
        l500      = 0x08,
        t200      = 0x10,
        d500      = 0x20,
    };

    enum class camera_info
    {
        name                         = RS2_CAMERA_INFO_NAME,
        serial_number                = RS2_CAMERA_INFO_SERIAL_NUMBER,
        firmware_version             = RS2_CAMERA_INFO_FIRMWARE_VERSION,
        recommended_firmware_version = RS2_CAMERA_INFO_RECOMMENDED_FIRMWARE_VERSION,
        physical_port                = RS2_CAMERA_INFO_PHYSICAL_PORT,
        debug_op_code                = RS2_CAMERA_INFO_DEBUG_OP_CODE,
        advanced_mode                = RS2_CAMERA_INFO_ADVANCED_MODE,
        product_id                   = RS2_CAMERA_INFO_PRODUCT_ID,
        camera_locked                = RS2_CAMERA_INFO_CAMERA_LOCKED,
        usb_type_descriptor          = RS2_CAMERA_INFO_USB_TYPE_DESCRIPTOR,
        product_line                 = RS2_CAMERA_INFO_PRODUCT_LINE,
        asic_serial_number           = RS2_CAMERA_INFO_ASIC_SERIAL_NUMBER,
        firmware_update_id           = RS2_CAMERA_INFO_FIRMWARE_UPDATE_ID,
    };

    enum class extension
    {
        unknown                = RS2_EXTENSION_UNKNOWN,
        debug                  = RS2_EXTENSION_DEBUG,
        info                   = RS2_EXTENSION_INFO,
        motion                 = RS2_EXTENSION_MOTION,
        options                = RS2_EXTENSION_OPTIONS,
        video                  = RS2_EXTENSION_VIDEO,
        roi                    = RS2_EXTENSION_ROI,
        depth_sensor           = RS2_EXTENSION_DEPTH_SENSOR,
        video_frame            = RS2_EXTENSION_VIDEO_FRAME,
        motion_frame           = RS2_EXTENSION_MOTION_FRAME,
        composite_frame        = RS2_EXTENSION_COMPOSITE_FRAME,
        points                 = RS2_EXTENSION_POINTS,
        depth_frame            = RS2_EXTENSION_DEPTH_FRAME,
        advanced_mode          = RS2_EXTENSION_ADVANCED_MODE,
        record                 = RS2_EXTENSION_RECORD,
        video_profile          = RS2_EXTENSION_VIDEO_PROFILE,
        playback               = RS2_EXTENSION_PLAYBACK,
        depth_stereo_sensor    = RS2_EXTENSION_DEPTH_STEREO_SENSOR,
        disparity_frame        = RS2_EXTENSION_DISPARITY_FRAME,
        motion_profile         = RS2_EXTENSION_MOTION_PROFILE,
        pose_frame             = RS2_EXTENSION_POSE_FRAME,
        pose_profile           = RS2_EXTENSION_POSE_PROFILE,
        tm2                    = RS2_EXTENSION_TM2,
        software_device        = RS2_EXTENSION_SOFTWARE_DEVICE,
        software_sensor        = RS2_EXTENSION_SOFTWARE_SENSOR,
        pose                   = RS2_EXTENSION_POSE,
        pose_sensor            = RS2_EXTENSION_POSE_SENSOR,
        updatable              = RS2_EXTENSION_UPDATABLE,
        l500_depth_sensor      = RS2_EXTENSION_L500_DEPTH_SENSOR,
        auto_calibrated_device = RS2_EXTENSION_AUTO_CALIBRATED_DEVICE,
        color_sensor           = RS2_EXTENSION_COLOR_SENSOR,
        motion_sensor          = RS2_EXTENSION_MOTION_SENSOR,
        fisheye_sensor         = RS2_EXTENSION_FISHEYE_SENSOR,
        max_usable_range_sensor= RS2_EXTENSION_MAX_USABLE_RANGE_SENSOR,
        debug_stream_sensor    = RS2_EXTENSION_DEBUG_STREAM_SENSOR,
    };

    enum class stream_kind
    {
        any        = RS2_STREAM_ANY,
        depth      = RS2_STREAM_DEPTH,
        color      = RS2_STREAM_COLOR,
        infrared   = RS2_STREAM_INFRARED,
        fisheye    = RS2_STREAM_FISHEYE,
        gyro       = RS2_STREAM_GYRO,
        accel      = RS2_STREAM_ACCEL,
        gpio       = RS2_STREAM_GPIO,
        pose       = RS2_STREAM_POSE,
        confidence = RS2_STREAM_CONFIDENCE,
    };

    enum class format
    {
        any           = RS2_FORMAT_ANY,
        z16           = RS2_FORMAT_Z16,
        disparity16   = RS2_FORMAT_DISPARITY16,
        xyz32f        = RS2_FORMAT_XYZ32F,
        yuyv          = RS2_FORMAT_YUYV,
        rgb8          = RS2_FORMAT_RGB8,
        bgr8          = RS2_FORMAT_BGR8,
        rgba8         = RS2_FORMAT_RGBA8,
        bgra8         = RS2_FORMAT_BGRA8,
        y8            = RS2_FORMAT_Y8,
        y16           = RS2_FORMAT_Y16,
        raw10         = RS2_FORMAT_RAW10,
        raw16         = RS2_FORMAT_RAW16,
        raw8          = RS2_FORMAT_RAW8,
        uyvy          = RS2_FORMAT_UYVY,
        motion_raw    = RS2_FORMAT_MOTION_RAW,
        motion_xyz32f = RS2_FORMAT_MOTION_XYZ32F,
        gpio_raw      = RS2_FORMAT_GPIO_RAW,
        six_dof       = RS2_FORMAT_6DOF,
        disparity32   = RS2_FORMAT_DISPARITY32,
        y10bpack      = RS2_FORMAT_Y10BPACK,
        distance      = RS2_FORMAT_DISTANCE,
        mjpeg         = RS2_FORMAT_MJPEG,
        y8i           = RS2_FORMAT_Y8I,
        y12i          = RS2_FORMAT_Y12I,
        inzi          = RS2_FORMAT_INZI,
        invi          = RS2_FORMAT_INVI,
        w10           = RS2_FORMAT_W10,
        z16h          = RS2_FORMAT_Z16H,
        fg            = RS2_FORMAT_FG,
        y411          = RS2_FORMAT_Y411,
    };

    enum class option
    {
        backlight_compensation    = RS2_OPTION_BACKLIGHT_COMPENSATION,
        brightness                = RS2_OPTION_BRIGHTNESS,
        contrast                  = RS2_OPTION_CONTRAST,
        exposure                  = RS2_OPTION_EXPOSURE,
        gain                      = RS2_OPTION_GAIN,
        gamma                     = RS2_OPTION_GAMMA,
        hue                       = RS2_OPTION_HUE,
        saturation                = RS2_OPTION_SATURATION,
        sharpness                 = RS2_OPTION_SHARPNESS,
        white_balance             = RS2_OPTION_WHITE_BALANCE,
        enable_auto_exposure      = RS2_OPTION_ENABLE_AUTO_EXPOSURE,
        enable_auto_white_balance = RS2_OPTION_ENABLE_AUTO_WHITE_BALANCE,
        visual_preset             = RS2_OPTION_VISUAL_PRESET,
        laser_power               = RS2_OPTION_LASER_POWER,
        accuracy                  = RS2_OPTION_ACCURACY,
        motion_range              = RS2_OPTION_MOTION_RANGE,
        filter_option             = RS2_OPTION_FILTER_OPTION,
        confidence_threshold      = RS2_OPTION_CONFIDENCE_THRESHOLD,
        emitter_enabled           = RS2_OPTION_EMITTER_ENABLED,
        frames_queue_size         = RS2_OPTION_FRAMES_QUEUE_SIZE,
        total_frame_drops         = RS2_OPTION_TOTAL_FRAME_DROPS,
        auto_exposure_mode        = RS2_OPTION_AUTO_EXPOSURE_MODE,
        power_line_frequency      = RS2_OPTION_POWER_LINE_FREQUENCY,
        asic_temperature          = RS2_OPTION_ASIC_TEMPERATURE,
        error_polling_enabled     = RS2_OPTION_ERROR_POLLING_ENABLED,
        projector_temperature     = RS2_OPTION_PROJECTOR_TEMPERATURE,
        output_trigger_enabled    = RS2_OPTION_OUTPUT_TRIGGER_ENABLED,
        motion_module_temperature = RS2_OPTION_MOTION_MODULE_TEMPERATURE,
        depth_units               = RS2_OPTION_DEPTH_UNITS,
        enable_motion_correction  = RS2_OPTION_ENABLE_MOTION_CORRECTION,
        auto_exposure_priority    = RS2_OPTION_AUTO_EXPOSURE_PRIORITY,
        min_distance              = RS2_OPTION_MIN_DISTANCE,
        max_distance              = RS2_OPTION_MAX_DISTANCE,
        texture_source            = RS2_OPTION_TEXTURE_SOURCE,
        filter_magnitude          = RS2_OPTION_FILTER_MAGNITUDE,
        filter_smooth_alpha       = RS2_OPTION_FILTER_SMOOTH_ALPHA,
        filter_smooth_delta       = RS2_OPTION_FILTER_SMOOTH_DELTA,
        holes_fill                = RS2_OPTION_HOLES_FILL,
        stereo_baseline           = RS2_OPTION_STEREO_BASELINE,
        auto_exposure_converge_step = RS2_OPTION_AUTO_EXPOSURE_CONVERGE_STEP,
        inter_cam_sync_mode       = RS2_OPTION_INTER_CAM_SYNC_MODE,
        stream_filter             = RS2_OPTION_STREAM_FILTER,
        stream_format_filter      = RS2_OPTION_STREAM_FORMAT_FILTER,
        stream_index_filter       = RS2_OPTION_STREAM_INDEX_FILTER,
        emitter_on_off            = RS2_OPTION_EMITTER_ON_OFF,
        global_time_enabled       = RS2_OPTION_GLOBAL_TIME_ENABLED,
        enable_mapping            = RS2_OPTION_ENABLE_MAPPING,
        enable_relocalization     = RS2_OPTION_ENABLE_RELOCALIZATION,
        enable_pose_jumping       = RS2_OPTION_ENABLE_POSE_JUMPING,
        depth_offset              = RS2_OPTION_DEPTH_OFFSET,
        led_power                 = RS2_OPTION_LED_POWER,
        enable_map_preservation   = RS2_OPTION_ENABLE_MAP_PRESERVATION,
        emitter_always_on         = RS2_OPTION_EMITTER_ALWAYS_ON,
        thermal_compensation      = RS2_OPTION_THERMAL_COMPENSATION,
        hdr_enabled               = RS2_OPTION_HDR_ENABLED,
        sequence_name             = RS2_OPTION_SEQUENCE_NAME,
        sequence_size             = RS2_OPTION_SEQUENCE_SIZE,
        sequence_id               = RS2_OPTION_SEQUENCE_ID,
        auto_exposure_limit       = RS2_OPTION_AUTO_EXPOSURE_LIMIT,
        auto_gain_limit           = RS2_OPTION_AUTO_GAIN_LIMIT,
        auto_exposure_limit_toggle= RS2_OPTION_AUTO_EXPOSURE_LIMIT_TOGGLE,
        auto_gain_limit_toggle    = RS2_OPTION_AUTO_GAIN_LIMIT_TOGGLE,
    };

    enum class timestamp_domain
    {
        hardware_clock = RS2_TIMESTAMP_DOMAIN_HARDWARE_CLOCK,
        system_time    = RS2_TIMESTAMP_DOMAIN_SYSTEM_TIME,
        global_time    = RS2_TIMESTAMP_DOMAIN_GLOBAL_TIME,
    };

    enum class log_severity
    {
        debug = RS2_LOG_SEVERITY_DEBUG,
        info  = RS2_LOG_SEVERITY_INFO,
        warn  = RS2_LOG_SEVERITY_WARN,
        error = RS2_LOG_SEVERITY_ERROR,
        fatal = RS2_LOG_SEVERITY_FATAL,
        none  = RS2_LOG_SEVERITY_NONE,
    };

    inline rs2_camera_info to_rs2(camera_info v) { return static_cast<rs2_camera_info>(v); }
    inline rs2_extension to_rs2(extension v) { return static_cast<rs2_extension>(v); }
    inline rs2_stream to_rs2(stream_kind v) { return static_cast<rs2_stream>(v); }
    inline rs2_format to_rs2(format v) { return static_cast<rs2_format>(v); }
    inline rs2_option to_rs2(option v) { return static_cast<rs2_option>(v); }
    inline rs2_timestamp_domain to_rs2(timestamp_domain v) { return static_cast<rs2_timestamp_domain>(v); }
    inline rs2_log_severity to_rs2(log_severity v) { return static_cast<rs2_log_severity>(v); }

    inline camera_info from_rs2(rs2_camera_info v) { return static_cast<camera_info>(v); }
    inline extension from_rs2(rs2_extension v) { return static_cast<extension>(v); }
    inline stream_kind from_rs2(rs2_stream v) { return static_cast<stream_kind>(v); }
    inline format from_rs2(rs2_format v) { return static_cast<format>(v); }
    inline option from_rs2(rs2_option v) { return static_cast<option>(v); }
    inline timestamp_domain from_rs2(rs2_timestamp_domain v) { return static_cast<timestamp_domain>(v); }
    inline log_severity from_rs2(rs2_log_severity v) { return static_cast<log_severity>(v); }

    const char* to_string(product_line v);
    const char* to_string(camera_info v);
    const char* to_string(extension v);
    const char* to_string(stream_kind v);
    const char* to_string(format v);
    const char* to_string(option v);
    const char* to_string(timestamp_domain v);
    const char* to_string(log_severity v);

    /**
    * parse the value reported under camera_info::product_line ("D400", "L500", ...)
    * throws invalid_value_error for an unrecognized name
    */
    product_line parse_product_line(const std::string& name);

    /**
    * set of product lines to restrict device queries to; an empty set matches every device
    */
    class product_line_set
    {
    public:
        product_line_set() = default;
        product_line_set(std::initializer_list<product_line> lines) : _lines(lines) {}

        product_line_set& insert(product_line line)
        {
            _lines.insert(line);
            return *this;
        }

        bool contains(product_line line) const { return _lines.count(line) > 0; }
        bool empty() const { return _lines.empty(); }
        size_t size() const { return _lines.size(); }

        // bitwise OR of the members, suitable for rs2_query_devices_ex
        int mask() const;

    private:
        std::set<product_line> _lines;
    };

    inline std::ostream& operator<<(std::ostream& o, product_line v) { return o << to_string(v); }
    inline std::ostream& operator<<(std::ostream& o, camera_info v) { return o << to_string(v); }
    inline std::ostream& operator<<(std::ostream& o, extension v) { return o << to_string(v); }
    inline std::ostream& operator<<(std::ostream& o, stream_kind v) { return o << to_string(v); }
    inline std::ostream& operator<<(std::ostream& o, format v) { return o << to_string(v); }
    inline std::ostream& operator<<(std::ostream& o, option v) { return o << to_string(v); }
    inline std::ostream& operator<<(std::ostream& o, timestamp_domain v) { return o << to_string(v); }
    inline std::ostream& operator<<(std::ostream& o, log_severity v) { return o << to_string(v); }
}

#endif // RSCAM_KINDS_HPP
