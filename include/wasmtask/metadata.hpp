#pragma once

#include "config.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace wasmtask {

    // the subset of `cargo metadata` the pipeline and the driver need
    struct workspace_metadata {
        std::filesystem::path workspace_root{};
        std::filesystem::path target_directory{};
    };

    // throws task_error(invalid_config) on malformed output
    workspace_metadata parse_workspace_metadata(std::string_view json);

    // ignores the target directory, and watches the workspace root when no root is configured
    void apply_workspace_metadata(const workspace_metadata& metadata, watch_config& config);

    // runs `cargo metadata --format-version 1 --no-deps`; throws task_error(toolchain)
    workspace_metadata query_workspace_metadata(const std::optional<std::filesystem::path>& cwd = std::nullopt);

}  // namespace wasmtask
