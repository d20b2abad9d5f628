#include "blendconv/report.hpp"

#include "blendconv/process.hpp"
#include "blendconv/utils.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <vector>

namespace blendconv::detail {

    struct conversion_output_record {
        std::string input{};
        std::string output{};
        int exit_code{};
        int64_t elapsed_ms{};
    };

    struct summary_output_record {
        int schema_version{1};
        std::string blender{};
        std::string format{};
        std::vector<conversion_output_record> conversions{};
    };

}  // namespace blendconv::detail

namespace glz {

    template <>
    struct meta<blendconv::detail::conversion_output_record> {
        using T = blendconv::detail::conversion_output_record;
        static constexpr auto value = object(
                "input", &T::input, "output", &T::output, "exit_code", &T::exit_code, "elapsed_ms", &T::elapsed_ms);
    };

    template <>
    struct meta<blendconv::detail::summary_output_record> {
        using T = blendconv::detail::summary_output_record;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "blender",
                       &T::blender,
                       "format",
                       &T::format,
                       "conversions",
                       &T::conversions);
    };

}  // namespace glz

namespace blendconv {

    void render_summary_table(const conversion_summary& summary, std::ostream& os) {
        if (summary.records.empty()) {
            os << "no blend files converted\n";
            return;
        }
        for (const auto& record : summary.records) {
            os << std::format(
                    "ok {} -> {} ({} ms)\n", record.input.string(), record.output.string(), record.elapsed_ms);
        }
        os << std::format(
                "converted {} file{} to {} using {}\n",
                summary.records.size(),
                summary.records.size() == 1U ? "" : "s",
                to_string(summary.format),
                summary.blender.display());
    }

    std::string render_summary_json(const conversion_summary& summary) {
        detail::summary_output_record payload{};
        payload.blender = summary.blender.display();
        payload.format = std::string{to_string(summary.format)};
        payload.conversions.reserve(summary.records.size());
        for (const auto& record : summary.records) {
            payload.conversions.push_back(
                    {record.input.string(), record.output.string(), record.exit_code, record.elapsed_ms});
        }

        std::string json{};
        auto ec = glz::write_json(payload, json);
        if (ec) {
            throw std::runtime_error("failed to serialize conversion report");
        }
        return json;
    }

    void render_summary(const conversion_summary& summary, report_mode mode, std::ostream& os) {
        if (mode == report_mode::json) {
            os << render_summary_json(summary) << '\n';
            return;
        }
        render_summary_table(summary, os);
    }

    void render_record_details(const conversion_record& record, std::ostream& os) {
        os << "$ " << format_command(record.command) << '\n';
        auto out = utils::trim_view(record.stdout_output);
        if (!out.empty()) {
            os << "blender stdout:\n" << out << '\n';
        }
        auto err = utils::trim_view(record.stderr_output);
        if (!err.empty()) {
            os << "blender stderr:\n" << err << '\n';
        }
    }

}  // namespace blendconv
