#include "blendconv/cli.hpp"

#include "blendconv/blender.hpp"
#include "blendconv/convert.hpp"
#include "blendconv/error.hpp"
#include "blendconv/report.hpp"
#include "blendconv/utils.hpp"

#include "internal/platform.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace blendconv::cli { namespace detail {

    using namespace std::string_view_literals;
    namespace fs = std::filesystem;

    struct persisted_config {
        int schema_version{1};
        std::optional<std::string> blender{};
        std::optional<std::string> format{};
        std::optional<std::string> output{};
        std::optional<std::string> report{};
    };

}}  // namespace blendconv::cli::detail

namespace glz {

    template <>
    struct meta<blendconv::cli::detail::persisted_config> {
        using T = blendconv::cli::detail::persisted_config;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "blender",
                       &T::blender,
                       "format",
                       &T::format,
                       "output",
                       &T::output,
                       "report",
                       &T::report);
    };

}  // namespace glz

namespace blendconv::cli {

    namespace detail {

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw std::runtime_error("failed to open " + path.string());
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw std::runtime_error("failed to read " + path.string());
            }
            return ss.str();
        }

        static void validate_supported_schema_version(int schema_version, const fs::path& path) {
            constexpr int supported_schema_version = 1;
            if (schema_version > supported_schema_version) {
                throw std::runtime_error(std::format(
                        "unsupported schema_version in {}: {} > {}",
                        path.string(),
                        schema_version,
                        supported_schema_version));
            }
        }

        static bool names_directory(const fs::path& path) {
            std::error_code ec{};
            if (fs::is_directory(path, ec) && !ec) {
                return true;
            }
            auto text = path.native();
            return !text.empty() && text.back() == fs::path::preferred_separator;
        }

        static std::optional<fs::path> out_dir_from_env() {
            const char* value = std::getenv(internal::platform::env::out_dir);
            if (value == nullptr || *value == '\0') {
                return std::nullopt;
            }
            return fs::path{value};
        }

        static int exit_code_for(error_kind kind) {
            switch (kind) {
                case error_kind::missing_blender_executable:
                    return exit_blender_not_found;
                case error_kind::missing_environment:
                    return exit_usage;
                default:
                    return exit_conversion_failed;
            }
        }

        static int report_failure(
                const error& e, const conversion_summary& summary, const startup_config& cfg, std::ostream& err) {
            err << "error: " << e.what() << '\n';
            if (cfg.verbose && !summary.records.empty()) {
                err << "converted " << summary.records.size() << " file(s) before the failure\n";
            }
            return exit_code_for(e.kind());
        }

    }  // namespace detail

    void load_config_file(const std::filesystem::path& path, startup_config& cfg) {
        detail::persisted_config data{};
        auto json = detail::read_text_file(path);
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(data, json);
        if (ec) {
            throw std::runtime_error(std::format("failed to parse json file {}", path.string()));
        }
        detail::validate_supported_schema_version(data.schema_version, path);

        if (data.blender && !utils::trim_view(*data.blender).empty()) {
            cfg.conversion.blender_path = std::filesystem::path{*data.blender};
        }
        if (data.format && !try_parse_output_format(*data.format, cfg.conversion.format)) {
            throw std::runtime_error(std::format("invalid format in {}: {}", path.string(), *data.format));
        }
        if (data.output && !utils::trim_view(*data.output).empty()) {
            std::filesystem::path output{*data.output};
            // relative to the config file, so a project config works from any directory
            cfg.output = output.is_relative() ? path.parent_path() / output : output;
        }
        if (data.report && !try_parse_report_mode(*data.report, cfg.report)) {
            throw std::runtime_error(std::format("invalid report in {}: {}", path.string(), *data.report));
        }
        cfg.config_file = path;
    }

    void print_config(const startup_config& cfg, std::ostream& os) {
        os << "format=" << to_string(cfg.conversion.format) << '\n';
        os << "blender="
           << (cfg.conversion.blender_path ? cfg.conversion.blender_path->string() : std::string{"<search>"}) << '\n';
        os << "flatpak=" << (cfg.conversion.discovery.use_flatpak ? "on" : "off") << '\n';
        os << "output=" << (cfg.output ? cfg.output->string() : std::string{"<beside input>"}) << '\n';
        os << "config=" << (cfg.config_file ? cfg.config_file->string() : std::string{"<none>"}) << '\n';
        os << "report=" << to_string(cfg.report) << '\n';
        os << "build_script=" << (cfg.build_script ? "true" : "false") << '\n';
        for (const auto& input : cfg.inputs) {
            os << "input=" << input.string() << '\n';
        }
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"blendconv: convert .blend files to glTF using Blender"};

        bool show_version = false;
        std::string format_arg{};
        std::string report_arg{};
        std::string blender_arg{};
        std::string output_arg{};
        std::string config_arg{};
        std::vector<std::string> input_args{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("inputs", input_args, ".blend files or directories to convert");
        app.add_option("-o,--output", output_arg, "Output file (single input) or output directory");
        app.add_option("-f,--format", format_arg, "Output format: glb|gltf-embedded|gltf-separate");
        app.add_option("--blender", blender_arg, "Blender executable path (disables search)");
        app.add_option("--config", config_arg, "JSON configuration file");
        app.add_option("--report", report_arg, "Report mode: table|json");
        app.add_flag("--build-script", cfg.build_script, "Write outputs to $OUT_DIR");
        app.add_flag("--no-flatpak", "Do not look for the Flatpak Blender");
        app.add_flag("--find-blender", cfg.find_blender, "Print the discovered Blender executable and exit");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Echo Blender command lines and output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "blendconv 0.1.0\n";
            return std::optional<int>{exit_ok};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{exit_usage};
        }

        if (!config_arg.empty()) {
            try {
                load_config_file(config_arg, cfg);
            } catch (const std::runtime_error& e) {
                std::cerr << "invalid --config: " << e.what() << '\n';
                return std::optional<int>{exit_usage};
            }
        }

        if (!format_arg.empty() && !try_parse_output_format(format_arg, cfg.conversion.format)) {
            std::cerr << "invalid --format value: " << format_arg << " (expected glb|gltf-embedded|gltf-separate)\n";
            return std::optional<int>{exit_usage};
        }
        if (!report_arg.empty() && !try_parse_report_mode(report_arg, cfg.report)) {
            std::cerr << "invalid --report value: " << report_arg << " (expected table|json)\n";
            return std::optional<int>{exit_usage};
        }
        if (!blender_arg.empty()) {
            cfg.conversion.blender_path = std::filesystem::path{blender_arg};
        }
        if (!output_arg.empty()) {
            cfg.output = std::filesystem::path{output_arg};
        }
        if (app.get_option("--no-flatpak")->count() > 0U) {
            cfg.conversion.discovery.use_flatpak = false;
        }
        for (const auto& input : input_args) {
            cfg.inputs.emplace_back(input);
        }

        if (cfg.build_script && !output_arg.empty()) {
            std::cerr << "--build-script and --output are mutually exclusive\n";
            return std::optional<int>{exit_usage};
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{exit_ok};
        }

        if (!cfg.find_blender && cfg.inputs.empty()) {
            std::cerr << "no inputs given\n" << app.help();
            return std::optional<int>{exit_usage};
        }

        return std::nullopt;
    }

    int run(const startup_config& cfg, std::ostream& out, std::ostream& err) {
        namespace fs = std::filesystem;

        conversion_summary summary{};
        summary.format = cfg.conversion.format;

        try {
            summary.blender = find_blender(cfg.conversion);
            if (cfg.find_blender) {
                out << summary.blender.display() << '\n';
                return exit_ok;
            }

            std::optional<fs::path> output_dir{};
            if (cfg.build_script) {
                output_dir = detail::out_dir_from_env();
                if (!output_dir) {
                    throw error{
                            error_kind::missing_environment,
                            "OUT_DIR is not set, --build-script must be used from a build script"};
                }
            }
            else if (cfg.output && (cfg.inputs.size() > 1U || detail::names_directory(*cfg.output))) {
                output_dir = cfg.output;
            }

            auto emit_details = [&](const conversion_record& record) {
                if (cfg.verbose) {
                    render_record_details(record, err);
                }
            };

            output_registry outputs{};

            for (const auto& input : cfg.inputs) {
                std::error_code ec{};
                if (fs::is_directory(input, ec) && !ec) {
                    auto dir_out = output_dir ? *output_dir : cfg.output.value_or(fs::path{"."});
                    for (auto& record : convert_dir_with(summary.blender, cfg.conversion, input, dir_out, outputs)) {
                        emit_details(record);
                        summary.records.push_back(std::move(record));
                    }
                    continue;
                }

                fs::path target{};
                if (output_dir) {
                    target = *output_dir / input.stem();
                }
                else if (cfg.output) {
                    target = *cfg.output;
                }
                else {
                    target = input.parent_path() / input.stem();
                }

                outputs.claim(input, output_path_for(cfg.conversion.format, target));
                auto record = convert_with(summary.blender, cfg.conversion, input, target);
                emit_details(record);
                summary.records.push_back(std::move(record));
            }
        } catch (const export_error& e) {
            if (cfg.verbose) {
                render_record_details(e.record(), err);
            }
            return detail::report_failure(e, summary, cfg, err);
        } catch (const error& e) {
            return detail::report_failure(e, summary, cfg, err);
        }

        if (cfg.report == report_mode::json || !cfg.quiet) {
            render_summary(summary, cfg.report, out);
        }
        return exit_ok;
    }

}  // namespace blendconv::cli
