#pragma once

#include "config.hpp"

#include <filesystem>
#include <optional>
#include <ostream>

namespace blendconv::cli {

    inline constexpr int exit_ok = 0;
    inline constexpr int exit_conversion_failed = 1;
    inline constexpr int exit_usage = 2;
    inline constexpr int exit_blender_not_found = 3;

    // Returns an exit code when startup should stop (help, version, usage errors).
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    // Merges a JSON config file into cfg. Throws std::runtime_error on unreadable or invalid files.
    void load_config_file(const std::filesystem::path& path, startup_config& cfg);

    void print_config(const startup_config& cfg, std::ostream& os);

    int run(const startup_config& cfg, std::ostream& out, std::ostream& err);

}  // namespace blendconv::cli
