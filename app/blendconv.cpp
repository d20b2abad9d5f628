#include "blendconv/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        blendconv::startup_config cfg{};
        if (auto cli_result = blendconv::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return blendconv::cli::run(cfg, std::cout, std::cerr);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
