#include "blendconv/convert.hpp"

#include "blendconv/process.hpp"
#include "blendconv/utils.hpp"

#include "internal/platform.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace blendconv {

    namespace detail {

        namespace arg_tokens {
            static constexpr auto background = "-b"sv;
            static constexpr auto python_exit_code = "--python-exit-code"sv;
            static constexpr auto python_exit_code_value = "1"sv;
            static constexpr auto python_expr = "--python-expr"sv;
            static constexpr auto blend_extension = ".blend"sv;
        }  // namespace arg_tokens

        static void ensure_dir(const fs::path& path) {
            if (path.empty()) {
                return;
            }
            std::error_code ec{};
            fs::create_directories(path, ec);
            if (ec) {
                throw error{
                        error_kind::io,
                        std::format("failed to create directory {}: {}", path.string(), ec.message())};
            }
        }

        static bool has_blend_extension(const fs::path& path) {
            return path.extension() == fs::path{arg_tokens::blend_extension};
        }

        static fs::path canonical_input(const fs::path& input) {
            std::error_code ec{};
            auto resolved = fs::canonical(input, ec);
            if (ec) {
                throw error{
                        error_kind::invalid_input_file,
                        std::format("invalid input path {}: {}", input.string(), ec.message())};
            }
            return resolved;
        }

        static bool output_exists(const fs::path& path) {
            std::error_code ec{};
            return fs::exists(path, ec) && !ec;
        }

        static std::string failure_details(const conversion_record& record) {
            auto details = utils::tail_excerpt(record.stderr_output);
            if (details.empty()) {
                details = utils::tail_excerpt(record.stdout_output);
            }
            return details;
        }

        static std::vector<fs::path> collect_blend_files(const fs::path& input_dir) {
            std::vector<fs::path> files{};
            std::error_code ec{};
            fs::recursive_directory_iterator it{input_dir, fs::directory_options::skip_permission_denied, ec};
            if (ec) {
                throw error{
                        error_kind::io, std::format("failed to walk {}: {}", input_dir.string(), ec.message())};
            }

            for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
                if (ec) {
                    throw error{
                            error_kind::io, std::format("failed to walk {}: {}", input_dir.string(), ec.message())};
                }
                std::error_code status_ec{};
                if (!it->is_regular_file(status_ec) || status_ec) {
                    continue;
                }
                if (!has_blend_extension(it->path())) {
                    debug_log("skipping non-blend file ", it->path().string());
                    continue;
                }
                files.push_back(it->path());
            }
            if (ec) {
                throw error{error_kind::io, std::format("failed to walk {}: {}", input_dir.string(), ec.message())};
            }

            std::ranges::sort(files);
            return files;
        }

    }  // namespace detail

    std::string python_string_literal(std::string_view text) {
        std::string out{"\""};
        out.reserve(text.size() + 2U);
        for (unsigned char c : text) {
            switch (c) {
                case '\\':
                    out += "\\\\";
                    break;
                case '"':
                    out += "\\\"";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\r':
                    out += "\\r";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                default:
                    if (c < 0x20U || c == 0x7fU) {
                        out += std::format("\\x{:02x}", static_cast<unsigned>(c));
                    }
                    else {
                        out.push_back(static_cast<char>(c));
                    }
                    break;
            }
        }
        out.push_back('"');
        return out;
    }

    std::string export_script(output_format format, const fs::path& output) {
        return std::format(
                "import bpy; bpy.ops.export_scene.gltf(filepath={}, check_existing=False, export_format={})",
                python_string_literal(output.string()),
                python_string_literal(exporter_token(format)));
    }

    fs::path output_path_for(output_format format, const fs::path& output) {
        auto ext = file_extension(format);
        if (utils::str_case_eq(output.extension().string(), ext)) {
            return output;
        }
        auto with_ext = output;
        with_ext += fs::path{ext};
        return with_ext;
    }

    std::vector<std::string> conversion_command(
            const blender_executable& exe, output_format format, const fs::path& input, const fs::path& output) {
        auto args = exe.command_prefix();
        args.emplace_back(detail::arg_tokens::background);
        args.push_back(input.string());
        args.emplace_back(detail::arg_tokens::python_exit_code);
        args.emplace_back(detail::arg_tokens::python_exit_code_value);
        args.emplace_back(detail::arg_tokens::python_expr);
        args.push_back(export_script(format, output));
        return args;
    }

    conversion_record convert(const conversion_options& options, const fs::path& input, const fs::path& output) {
        auto exe = find_blender(options);
        return convert_with(exe, options, input, output);
    }

    conversion_record convert_with(
            const blender_executable& exe,
            const conversion_options& options,
            const fs::path& input,
            const fs::path& output) {
        auto input_path = detail::canonical_input(input);
        if (!detail::has_blend_extension(input_path)) {
            throw error{error_kind::invalid_input_file, std::format("invalid input path {}", input_path.string())};
        }

        auto output_path = fs::absolute(output_path_for(options.format, output));
        detail::ensure_dir(output_path.parent_path());

        conversion_record record{};
        record.input = input_path;
        record.output = output_path;
        record.command = conversion_command(exe, options.format, input_path, output_path);

        auto started = std::chrono::steady_clock::now();
        auto result = run_process(record.command);
        record.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started)
                                    .count();
        record.exit_code = result.exit_code;
        record.stdout_output = std::move(result.stdout_output);
        record.stderr_output = std::move(result.stderr_output);

        if (record.exit_code != 0) {
            auto details = detail::failure_details(record);
            auto exit_code = record.exit_code;
            throw export_error{
                    std::format(
                            "export of {} failed with exit code {}{}{}",
                            input_path.string(),
                            exit_code,
                            details.empty() ? "" : ": ",
                            details),
                    std::move(record),
                    exit_code};
        }

        if (!detail::output_exists(output_path)) {
            throw export_error{
                    std::format(
                            "export of {} reported success but {} was not written",
                            input_path.string(),
                            output_path.string()),
                    std::move(record),
                    std::nullopt};
        }

        debug_log("converted ", input_path.string(), " -> ", output_path.string());
        return record;
    }

    void output_registry::claim(const fs::path& input, const fs::path& output) {
        auto key = fs::absolute(output).lexically_normal();
        auto [it, inserted] = claimed_.emplace(key, input);
        if (!inserted) {
            throw error{
                    error_kind::invalid_input_file,
                    std::format(
                            "{} would overwrite {}, already converted from {}",
                            input.string(),
                            key.string(),
                            it->second.string())};
        }
    }

    std::vector<conversion_record> convert_dir(
            const conversion_options& options, const fs::path& input_dir, const fs::path& output_dir) {
        std::error_code ec{};
        if (!fs::is_directory(input_dir, ec) || ec) {
            throw error{error_kind::invalid_input_file, std::format("invalid input directory {}", input_dir.string())};
        }
        auto exe = find_blender(options);
        return convert_dir_with(exe, options, input_dir, output_dir);
    }

    std::vector<conversion_record> convert_dir_with(
            const blender_executable& exe,
            const conversion_options& options,
            const fs::path& input_dir,
            const fs::path& output_dir) {
        output_registry outputs{};
        return convert_dir_with(exe, options, input_dir, output_dir, outputs);
    }

    std::vector<conversion_record> convert_dir_with(
            const blender_executable& exe,
            const conversion_options& options,
            const fs::path& input_dir,
            const fs::path& output_dir,
            output_registry& outputs) {
        std::error_code ec{};
        if (!fs::is_directory(input_dir, ec) || ec) {
            throw error{error_kind::invalid_input_file, std::format("invalid input directory {}", input_dir.string())};
        }

        auto root = detail::canonical_input(input_dir);
        // the input directory's own name is kept, so blends/a.blend lands in <output_dir>/blends/a.glb
        auto base = output_dir / root.filename();

        std::vector<conversion_record> records{};
        for (const auto& file : detail::collect_blend_files(root)) {
            auto relative_parent = file.parent_path().lexically_relative(root);
            auto target_dir = relative_parent.empty() || relative_parent == fs::path{"."} ? base : base / relative_parent;
            auto target = target_dir / file.stem();
            outputs.claim(file, output_path_for(options.format, target));
            detail::ensure_dir(target_dir);

            records.push_back(convert_with(exe, options, file, target));
        }
        return records;
    }

    std::vector<conversion_record> convert_dir_build_script(
            const conversion_options& options, const fs::path& input_dir) {
        const char* out_dir = std::getenv(internal::platform::env::out_dir);
        if (out_dir == nullptr || *out_dir == '\0') {
            throw error{error_kind::missing_environment, "OUT_DIR is not set, this must be called from a build script"};
        }
        return convert_dir(options, input_dir, fs::path{out_dir});
    }

}  // namespace blendconv
