#pragma once

#include "blender.hpp"
#include "config.hpp"
#include "error.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace blendconv {

    struct conversion_record {
        std::filesystem::path input{};
        std::filesystem::path output{};
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};
        std::vector<std::string> command{};
        int64_t elapsed_ms{};
    };

    // export_failed raised after Blender ran; keeps the command and captured output.
    class export_error : public error {
      public:
        export_error(const std::string& message, conversion_record record, std::optional<int> exit_code)
                : error{error_kind::export_failed, message, exit_code}, record_{std::move(record)} {}

        const conversion_record& record() const noexcept { return record_; }

      private:
        conversion_record record_;
    };

    // Output files handed out during one run. Claiming a path twice is an invalid_input_file
    // error, raised before the second conversion can overwrite the first.
    class output_registry {
      public:
        void claim(const std::filesystem::path& input, const std::filesystem::path& output);

      private:
        std::map<std::filesystem::path, std::filesystem::path> claimed_{};
    };

    std::string python_string_literal(std::string_view text);
    std::string export_script(output_format format, const std::filesystem::path& output);
    std::filesystem::path output_path_for(output_format format, const std::filesystem::path& output);

    std::vector<std::string> conversion_command(
            const blender_executable& exe,
            output_format format,
            const std::filesystem::path& input,
            const std::filesystem::path& output);

    // Converts a single .blend file; discovers Blender first.
    conversion_record convert(
            const conversion_options& options,
            const std::filesystem::path& input,
            const std::filesystem::path& output);

    conversion_record convert_with(
            const blender_executable& exe,
            const conversion_options& options,
            const std::filesystem::path& input,
            const std::filesystem::path& output);

    // Walks input_dir and converts every .blend file, mirroring the directory structure
    // under output_dir/<input_dir name>/. Stops at the first failure.
    std::vector<conversion_record> convert_dir(
            const conversion_options& options,
            const std::filesystem::path& input_dir,
            const std::filesystem::path& output_dir);

    std::vector<conversion_record> convert_dir_with(
            const blender_executable& exe,
            const conversion_options& options,
            const std::filesystem::path& input_dir,
            const std::filesystem::path& output_dir);

    std::vector<conversion_record> convert_dir_with(
            const blender_executable& exe,
            const conversion_options& options,
            const std::filesystem::path& input_dir,
            const std::filesystem::path& output_dir,
            output_registry& outputs);

    // convert_dir into $OUT_DIR, for build scripts.
    std::vector<conversion_record> convert_dir_build_script(
            const conversion_options& options, const std::filesystem::path& input_dir);

}  // namespace blendconv
