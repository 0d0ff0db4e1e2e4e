#include "patchscript/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        patchscript::startup_config cfg{};
        if (auto cli_result = patchscript::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        return patchscript::cli::run(cfg);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
