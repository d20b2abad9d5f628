#pragma once

#include <string>
#include <vector>

namespace blendconv {

    struct process_result {
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};

        bool success() const { return exit_code == 0; }
    };

    // Runs args[0] (resolved through PATH) to completion, capturing stdout and stderr.
    // Signalled children report 128 + signal number. Throws error{spawn_failed} when the
    // child could not be started at all.
    process_result run_process(const std::vector<std::string>& args);

    std::string format_command(const std::vector<std::string>& args);

}  // namespace blendconv
