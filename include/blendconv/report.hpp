#pragma once

#include "blender.hpp"
#include "config.hpp"
#include "convert.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace blendconv {

    struct conversion_summary {
        blender_executable blender{};
        output_format format{output_format::glb};
        std::vector<conversion_record> records{};
    };

    void render_summary_table(const conversion_summary& summary, std::ostream& os);
    std::string render_summary_json(const conversion_summary& summary);
    void render_summary(const conversion_summary& summary, report_mode mode, std::ostream& os);

    // Command line and captured Blender output of one conversion, for --verbose
    void render_record_details(const conversion_record& record, std::ostream& os);

}  // namespace blendconv
