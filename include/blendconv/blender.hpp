#pragma once

#include "config.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace blendconv {

    /*
     * Blender executable search strategy
     *
     * find_blender(discovery) probes, in order, and returns the first candidate whose
     * `-b -v` invocation exits 0:
     *   1. $BLENDER_EXECUTABLE                     (kind::path)
     *   2. `blender` resolved through $PATH        (kind::normal)
     *   3. `flatpak run org.blender.Blender`      (kind::flatpak)
     *   4. existing entries of install_locations   (kind::path)
     *
     * An explicit conversion_options::blender_path disables the search: only that path is
     * tried.
     */

    enum class blender_kind : uint8_t { normal, flatpak, path };

    inline constexpr std::string_view to_string(blender_kind kind) {
        switch (kind) {
            case blender_kind::normal:
                return "normal"sv;
            case blender_kind::flatpak:
                return "flatpak"sv;
            case blender_kind::path:
                return "path"sv;
        }
        return "normal"sv;
    }

    struct blender_executable {
        blender_kind kind{blender_kind::normal};
        std::filesystem::path path{};

        static blender_executable normal() { return {}; }
        static blender_executable flatpak() { return {blender_kind::flatpak, {}}; }
        static blender_executable at(std::filesystem::path p) { return {blender_kind::path, std::move(p)}; }

        std::vector<std::string> command_prefix() const;
        std::string display() const;
    };

    bool probe(const blender_executable& exe);

    blender_executable find_blender(const discovery_options& discovery);
    blender_executable find_blender_at(const std::filesystem::path& path);
    blender_executable find_blender(const conversion_options& options);

}  // namespace blendconv
