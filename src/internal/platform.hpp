#pragma once

#include <array>
#include <string_view>

namespace blendconv::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = BLENDCONV_PLATFORM_LINUX != 0;
    inline constexpr bool is_macos = BLENDCONV_PLATFORM_MACOS != 0;

    namespace tool {
        inline constexpr auto blender = "blender"sv;
        inline constexpr auto flatpak = "flatpak"sv;
        inline constexpr auto flatpak_app_id = "org.blender.Blender"sv;
    }  // namespace tool

    namespace env {
        inline constexpr auto blender_executable = "BLENDER_EXECUTABLE";
        inline constexpr auto out_dir = "OUT_DIR";
    }  // namespace env

    inline constexpr std::array linux_install_locations{
            "/usr/bin/blender"sv,
            "/usr/local/bin/blender"sv,
            "/snap/bin/blender"sv,
            "/opt/blender/blender"sv,
    };

    inline constexpr std::array macos_install_locations{
            "/Applications/Blender.app/Contents/MacOS/Blender"sv,
    };

}  // namespace blendconv::internal::platform
