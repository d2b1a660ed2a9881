// License: Apache 2.0. See LICENSE file in root directory.
// Copyright(c) 2017 Intel Corporation. All Rights Reserved.

#include <rscam/hpp/rscam_kinds.hpp>
#include <rscam/hpp/rscam_types.hpp>

#include <cstring>

namespace rscam
{
    namespace
    {
        struct product_line_name
        {
            product_line line;
            const char* name;
        };

        const product_line_name product_line_names[] = {
            { product_line::any,       "Any" },
            { product_line::any_intel, "AnyIntel" },
            { product_line::non_intel, "NonIntel" },
            { product_line::d400,      "D400" },
            { product_line::sr300,     "SR300" },
            { product_line::l500,      "L500" },
            { product_line::t200,      "T200" },
            { product_line::d500,      "D500" },
        };
    }

    const char* to_string(product_line v)
    {
        for (auto&& entry : product_line_names)
            if (entry.line == v)
                return entry.name;
        return "UNKNOWN";
    }

    product_line parse_product_line(const std::string& name)
    {
        for (auto&& entry : product_line_names)
            if (name == entry.name)
                return entry.line;
        throw invalid_value_error("unrecognized product line \"" + name + "\"",
                                  "rscam::parse_product_line", name);
    }

    const char* to_string(camera_info v) { return rs2_camera_info_to_string(to_rs2(v)); }
    const char* to_string(extension v) { return rs2_extension_to_string(to_rs2(v)); }
    const char* to_string(stream_kind v) { return rs2_stream_to_string(to_rs2(v)); }
    const char* to_string(format v) { return rs2_format_to_string(to_rs2(v)); }
    const char* to_string(option v) { return rs2_option_to_string(to_rs2(v)); }
    const char* to_string(timestamp_domain v) { return rs2_timestamp_domain_to_string(to_rs2(v)); }
    const char* to_string(log_severity v) { return rs2_log_severity_to_string(to_rs2(v)); }

    int product_line_set::mask() const
    {
        if (_lines.empty())
            return static_cast<int>(product_line::any);

        int mask = 0;
        for (auto line : _lines)
            mask |= static_cast<int>(line);
        return mask;
    }
}
