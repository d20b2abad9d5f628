#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace blendconv {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        missing_blender_executable,
        spawn_failed,
        export_failed,
        invalid_input_file,
        missing_environment,
        io,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::missing_blender_executable:
                return "missing_blender_executable"sv;
            case error_kind::spawn_failed:
                return "spawn_failed"sv;
            case error_kind::export_failed:
                return "export_failed"sv;
            case error_kind::invalid_input_file:
                return "invalid_input_file"sv;
            case error_kind::missing_environment:
                return "missing_environment"sv;
            case error_kind::io:
                return "io"sv;
        }
        return "io"sv;
    }

    class error : public std::runtime_error {
      public:
        error(error_kind kind, const std::string& message, std::optional<int> exit_code = std::nullopt)
                : std::runtime_error{message}, kind_{kind}, exit_code_{exit_code} {}

        error_kind kind() const noexcept { return kind_; }

        // set for export_failed when Blender ran and exited non-zero
        std::optional<int> exit_code() const noexcept { return exit_code_; }

      private:
        error_kind kind_;
        std::optional<int> exit_code_;
    };

}  // namespace blendconv
