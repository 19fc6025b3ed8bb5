#include "wasmtask/metadata.hpp"

#include "wasmtask/errors.hpp"
#include "wasmtask/format.hpp"
#include "wasmtask/log.hpp"
#include "wasmtask/process.hpp"

#include "internal/platform.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>

using namespace wasmtask::literals;

namespace wasmtask::detail {

    struct cargo_metadata_doc {
        std::string workspace_root{};
        std::string target_directory{};
    };

}  // namespace wasmtask::detail

template <>
struct glz::meta<wasmtask::detail::cargo_metadata_doc> {
    using T = wasmtask::detail::cargo_metadata_doc;
    static constexpr auto value = object("workspace_root", &T::workspace_root, "target_directory", &T::target_directory);
};

namespace wasmtask {

    workspace_metadata parse_workspace_metadata(std::string_view json) {
        detail::cargo_metadata_doc doc{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(doc, json);
        if (ec) {
            throw task_error{
                    error_kind::invalid_config,
                    "failed to parse cargo metadata: {}"_format(glz::format_error(ec, json))};
        }
        if (doc.workspace_root.empty() || doc.target_directory.empty()) {
            throw task_error{error_kind::invalid_config, "cargo metadata is missing workspace_root or target_directory"};
        }
        return workspace_metadata{.workspace_root = doc.workspace_root, .target_directory = doc.target_directory};
    }

    void apply_workspace_metadata(const workspace_metadata& metadata, watch_config& config) {
        if (config.roots.empty()) {
            config.roots.push_back(metadata.workspace_root);
        }
        auto target = metadata.target_directory.string();
        if (std::ranges::find(config.ignore, target) == config.ignore.end()) {
            config.ignore.push_back(std::move(target));
        }
    }

    workspace_metadata query_workspace_metadata(const std::optional<std::filesystem::path>& cwd) {
        command_spec command{
                .args = {std::string{internal::platform::tool::cargo}, "metadata", "--format-version", "1", "--no-deps"},
                .cwd = cwd};

        log::trace("Getting package's metadata");
        subprocess_result result{};
        try {
            result = run_process(command);
        } catch (const task_error& e) {
            throw task_error{error_kind::toolchain, "cannot run cargo metadata: {}"_format(e.what())};
        }
        if (!result.success()) {
            throw task_error{
                    error_kind::toolchain,
                    "cargo metadata exited with {}"_format(result.exit_code),
                    result.diagnostics()};
        }
        return parse_workspace_metadata(result.stdout_output);
    }

}  // namespace wasmtask
