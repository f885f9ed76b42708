#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        cpgslice::run_config cfg{};
        cpgslice::cli::command_request request{};
        if (auto cli_result = cpgslice::cli::parse_cli(argc, argv, cfg, request)) {
            return *cli_result;
        }

        return cpgslice::cli::run_command(cfg, request);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
