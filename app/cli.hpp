#pragma once

#include "wasmtask/config.hpp"
#include "wasmtask/log.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace wasmtask::cli {

    enum class command_kind : uint8_t { dist, watch };

    struct driver_config {
        command_kind command{command_kind::dist};
        pipeline_config pipeline{};
        watch_config watch{};
        command_spec watch_command{.args = {"cargo", "xtask", "dist"}};
        output_mode output{output_mode::table};
        log::log_level level{log::log_level::info};
    };

    // returns an exit code when the process should end without running a command
    std::optional<int> parse_cli(int argc, char** argv, driver_config& cfg);

    int run_dist(driver_config& cfg);
    int run_watch(driver_config& cfg);

}  // namespace wasmtask::cli
