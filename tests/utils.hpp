#pragma once

#include "blendconv.hpp"

#include <catch2/catch_test_macros.hpp>

#include "../src/internal/platform.hpp"

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace blendconv::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    // Sets (or unsets, for nullopt) an environment variable for the lifetime of the guard.
    struct scoped_env {
        std::string name{};
        std::optional<std::string> previous{};

        scoped_env(std::string env_name, std::optional<std::string> value) : name{std::move(env_name)} {
            if (const char* old = std::getenv(name.c_str())) {
                previous = old;
            }
            if (value) {
                ::setenv(name.c_str(), value->c_str(), 1);
            }
            else {
                ::unsetenv(name.c_str());
            }
        }

        ~scoped_env() {
            if (previous) {
                ::setenv(name.c_str(), previous->c_str(), 1);
            }
            else {
                ::unsetenv(name.c_str());
            }
        }

        scoped_env(const scoped_env&) = delete;
        scoped_env& operator=(const scoped_env&) = delete;
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline std::vector<std::string> read_lines(const fs::path& path) {
        std::ifstream in{path};
        REQUIRE(in.good());

        std::vector<std::string> lines{};
        std::string line{};
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    inline bool has_exact_arg(const std::vector<std::string>& args, std::string_view token) {
        return std::find(args.begin(), args.end(), token) != args.end();
    }

    struct fake_blender_spec {
        // exit code of the `-b -v` probe
        int probe_exit{0};
        // exit code of a conversion run
        int convert_exit{0};
        // write the file named by filepath="..." in the export script
        bool write_output{true};
        std::string stderr_text{};
        // leading arguments to drop before Blender's own (flatpak: "run org.blender.Blender")
        int skip_args{0};
    };

    // Stub Blender: records the probe in <marker>, the conversion argv in <args_log> (one per
    // line) and writes the requested output file. Only shell builtins are used so PATH can be
    // restricted to the test's own bin directory.
    inline std::string make_fake_blender_script(
            const fake_blender_spec& spec, const fs::path& marker, const fs::path& args_log) {
        std::ostringstream script{};
        script << "#!/bin/sh\n";
        for (int i = 0; i < spec.skip_args; ++i) {
            script << "shift\n";
        }
        script << "if [ \"${1:-}\" = \"-b\" ] && [ \"${2:-}\" = \"-v\" ]; then\n";
        script << "    : > \"" << marker.string() << "\"\n";
        script << "    echo 'Blender 4.2.0'\n";
        script << "    exit " << spec.probe_exit << "\n";
        script << "fi\n";
        script << ": > \"" << args_log.string() << "\"\n";
        script << "expr=''\n";
        script << "while [ $# -gt 0 ]; do\n";
        script << "    printf '%s\\n' \"$1\" >> \"" << args_log.string() << "\"\n";
        script << "    if [ \"$1\" = \"--python-expr\" ]; then expr=\"$2\"; fi\n";
        script << "    shift\n";
        script << "done\n";
        script << "echo 'Info: Finished glTF 2.0 export'\n";
        if (!spec.stderr_text.empty()) {
            script << "echo '" << spec.stderr_text << "' >&2\n";
        }
        if (spec.write_output) {
            script << "out=${expr#*filepath=\\\"}\n";
            script << "out=${out%%\\\"*}\n";
            script << "printf 'glTF' > \"$out\"\n";
        }
        script << "exit " << spec.convert_exit << "\n";
        return script.str();
    }

    struct fake_toolchain {
        fs::path bin_dir{};
        fs::path marker{};
        fs::path args_log{};

        explicit fake_toolchain(const fs::path& root) :
                bin_dir{root / "bin"}, marker{root / "probed.marker"}, args_log{root / "blender.args"} {
            fs::create_directories(bin_dir);
        }

        fs::path install_blender(std::string_view name, const fake_blender_spec& spec = {}) const {
            auto path = bin_dir / name;
            make_executable_file(path, make_fake_blender_script(spec, marker, args_log));
            return path;
        }

        fs::path install_flatpak(fake_blender_spec spec = {}) const {
            spec.skip_args = 2;
            auto path = bin_dir / "flatpak";
            make_executable_file(path, make_fake_blender_script(spec, marker, args_log));
            return path;
        }

        std::vector<std::string> last_args() const { return read_lines(args_log); }
    };

    // discovery limited to the stub toolchain: no environment, no install locations
    inline conversion_options isolated_options() {
        conversion_options options{};
        options.discovery.use_environment = false;
        options.discovery.install_locations.clear();
        return options;
    }

}  // namespace blendconv::test::detail
