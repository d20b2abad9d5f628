#pragma once

#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace blendconv {

    using namespace std::string_view_literals;

    /*
     * blendconv configuration
     *
     * Conversion
     * - format: glTF flavour handed to Blender's exporter.
     *     glb            single binary .glb with all data packed
     *     gltf-embedded  single .gltf with all data packed in JSON
     *     gltf-separate  .gltf + .bin + textures
     * - blender_path: explicit Blender executable; when set no search is performed.
     * - discovery: which locations the executable search may look at (see blender.hpp).
     *
     * Front end (startup_config only)
     * - inputs: .blend files and/or directories to convert.
     * - output: output file (single input) or output directory.
     * - config_file: JSON file providing defaults for blender/format/output/report.
     *     A relative "output" there is resolved against the config file's directory.
     * - report: stdout rendering of conversion results ("table" or "json").
     * - build_script: take the output directory from OUT_DIR.
     * - quiet/verbose: coarse output verbosity knobs.
     *
     * Introspection flags (one-shot startup actions)
     * - find_blender: print the discovered executable and exit.
     * - print_config: print the resolved configuration and exit.
     */

    enum class output_format : uint8_t { glb, gltf_embedded, gltf_separate };
    enum class report_mode : uint8_t { table, json };

    inline constexpr std::string_view to_string(output_format format) {
        switch (format) {
            case output_format::glb:
                return "glb"sv;
            case output_format::gltf_embedded:
                return "gltf-embedded"sv;
            case output_format::gltf_separate:
                return "gltf-separate"sv;
        }
        return "glb"sv;
    }

    // token understood by bpy.ops.export_scene.gltf(export_format=...)
    inline constexpr std::string_view exporter_token(output_format format) {
        switch (format) {
            case output_format::glb:
                return "GLB"sv;
            case output_format::gltf_embedded:
                return "GLTF_EMBEDDED"sv;
            case output_format::gltf_separate:
                return "GLTF_SEPARATE"sv;
        }
        return "GLB"sv;
    }

    inline constexpr std::string_view file_extension(output_format format) {
        return format == output_format::glb ? ".glb"sv : ".gltf"sv;
    }

    inline constexpr bool try_parse_output_format(std::string_view text, output_format& out) {
        if (utils::str_case_eq(text, "glb"sv)) {
            out = output_format::glb;
            return true;
        }
        if (utils::str_case_eq(text, "gltf-embedded"sv) || utils::str_case_eq(text, "gltf_embedded"sv)) {
            out = output_format::gltf_embedded;
            return true;
        }
        if (utils::str_case_eq(text, "gltf-separate"sv) || utils::str_case_eq(text, "gltf_separate"sv)) {
            out = output_format::gltf_separate;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(report_mode mode) {
        switch (mode) {
            case report_mode::table:
                return "table"sv;
            case report_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_report_mode(std::string_view text, report_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = report_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = report_mode::json;
            return true;
        }
        return false;
    }

    std::vector<std::filesystem::path> default_install_locations();

    struct discovery_options {
        bool use_environment{true};
        bool use_path{true};
        bool use_flatpak{true};
        std::vector<std::filesystem::path> install_locations{default_install_locations()};
    };

    struct conversion_options {
        output_format format{output_format::glb};
        std::optional<std::filesystem::path> blender_path{};
        discovery_options discovery{};
    };

    struct startup_config {
        std::vector<std::filesystem::path> inputs{};
        std::optional<std::filesystem::path> output{};
        std::optional<std::filesystem::path> config_file{};
        report_mode report{report_mode::table};
        bool build_script{false};
        bool quiet{false};
        bool verbose{false};

        conversion_options conversion{};

        bool find_blender{false};
        bool print_config{false};
    };

}  // namespace blendconv
