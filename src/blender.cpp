#include "blendconv/blender.hpp"

#include "blendconv/error.hpp"
#include "blendconv/process.hpp"
#include "blendconv/utils.hpp"

#include "internal/platform.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace blendconv {

    namespace detail {

        namespace arg_tokens {
            static constexpr auto background = "-b"sv;
            static constexpr auto version = "-v"sv;
            static constexpr auto flatpak_run = "run"sv;
        }  // namespace arg_tokens

        static std::optional<fs::path> env_blender_path() {
            const char* value = std::getenv(internal::platform::env::blender_executable);
            if (value == nullptr) {
                return std::nullopt;
            }
            auto trimmed = utils::trim_view(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return fs::path{std::string{trimmed}};
        }

        static bool is_regular_file(const fs::path& path) {
            std::error_code ec{};
            return fs::is_regular_file(path, ec) && !ec;
        }

    }  // namespace detail

    std::vector<fs::path> default_install_locations() {
        std::vector<fs::path> locations{};
        if constexpr (internal::platform::is_linux) {
            for (auto location : internal::platform::linux_install_locations) {
                locations.emplace_back(location);
            }
        }
        if constexpr (internal::platform::is_macos) {
            for (auto location : internal::platform::macos_install_locations) {
                locations.emplace_back(location);
            }
        }
        return locations;
    }

    std::vector<std::string> blender_executable::command_prefix() const {
        switch (kind) {
            case blender_kind::normal:
                return {std::string{internal::platform::tool::blender}};
            case blender_kind::flatpak:
                return {std::string{internal::platform::tool::flatpak},
                        std::string{detail::arg_tokens::flatpak_run},
                        std::string{internal::platform::tool::flatpak_app_id}};
            case blender_kind::path:
                return {path.string()};
        }
        return {std::string{internal::platform::tool::blender}};
    }

    std::string blender_executable::display() const {
        return format_command(command_prefix());
    }

    bool probe(const blender_executable& exe) {
        auto args = exe.command_prefix();
        args.emplace_back(detail::arg_tokens::background);
        args.emplace_back(detail::arg_tokens::version);

        try {
            auto result = run_process(args);
            debug_log("probe ", exe.display(), " exited with ", result.exit_code);
            return result.success();
        } catch (const error& e) {
            if (e.kind() != error_kind::spawn_failed) {
                throw;
            }
            debug_log("probe ", exe.display(), " did not start: ", e.what());
            return false;
        }
    }

    blender_executable find_blender(const discovery_options& discovery) {
        std::vector<blender_executable> candidates{};

        if (discovery.use_environment) {
            if (auto from_env = detail::env_blender_path()) {
                candidates.push_back(blender_executable::at(*from_env));
            }
        }
        if (discovery.use_path) {
            candidates.push_back(blender_executable::normal());
        }
        if (discovery.use_flatpak) {
            candidates.push_back(blender_executable::flatpak());
        }
        for (const auto& location : discovery.install_locations) {
            if (detail::is_regular_file(location)) {
                candidates.push_back(blender_executable::at(location));
            }
        }

        for (const auto& candidate : candidates) {
            if (probe(candidate)) {
                debug_log("using blender: ", candidate.display());
                return candidate;
            }
        }

        throw error{
                error_kind::missing_blender_executable,
                "could not locate blender executable, is blender in your path? (set BLENDER_EXECUTABLE or "
                "pass an explicit path)"};
    }

    blender_executable find_blender_at(const fs::path& path) {
        auto exe = blender_executable::at(path);
        if (probe(exe)) {
            return exe;
        }
        throw error{
                error_kind::missing_blender_executable,
                "could not run blender executable at " + path.string()};
    }

    blender_executable find_blender(const conversion_options& options) {
        if (options.blender_path) {
            return find_blender_at(*options.blender_path);
        }
        return find_blender(options.discovery);
    }

}  // namespace blendconv
