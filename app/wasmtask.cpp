#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        wasmtask::cli::driver_config cfg{};
        if (auto cli_result = wasmtask::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        switch (cfg.command) {
            case wasmtask::cli::command_kind::dist:
                return wasmtask::cli::run_dist(cfg);
            case wasmtask::cli::command_kind::watch:
                return wasmtask::cli::run_watch(cfg);
        }
        return 2;
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
