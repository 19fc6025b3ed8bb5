#pragma once

#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wasmtask {

    using namespace std::string_view_literals;

    /*
     * wasmtask configuration
     *
     * command_spec
     * - args: argv, args[0] resolved through PATH.
     * - cwd: working directory of the child, inherited when unset.
     * - env: variables set on top of the inherited environment.
     *
     * cargo_flags: pass-through flags appended to the toolchain command, in the order cargo
     * documents them. `example` switches the artifact lookup to examples/<name>.wasm.
     *
     * optimizer_options (wasm-opt)
     * - enabled: run the optimize stage.
     * - optimization_level/shrink_level: forwarded as `-ol N` and `-s N`.
     * - debug_info: forwarded as `-g`.
     * - extra_args: appended verbatim.
     * - version: binaryen release number used to resolve the binary.
     * - cache_dir: binary cache root, `<target_dir>/wasmtask-cache` when unset.
     *
     * pipeline_config
     * - output_dir: final package directory (required).
     * - static_dir: directory whose contents are copied into output_dir.
     * - package: cargo package to build (required).
     * - app_name: stem of the generated <app>.wasm/<app>.js/<app>.css.
     * - run_in_workspace: run the toolchain with the workspace root as cwd.
     * - style_entry: stylesheet compiled with style_compiler into <app>.css.
     * - loader_template: file copied as <app>.js with {{module}}/{{app_name}} substituted;
     *   a built-in loader is generated when unset.
     * - workspace_root/target_dir: taken from `cargo metadata` when unset.
     *
     * watch_config
     * - roots: watched directories (required).
     * - ignore: path prefixes or fnmatch globs.
     * - debounce: quiet period before a trigger (> 0).
     * - ignore_hidden: drop paths with a dot-prefixed component below a root.
     * - run_on_start: launch the command once before the first change.
     * - stop_grace: SIGTERM to SIGKILL escalation delay.
     */

    enum class output_mode : uint8_t { table, json };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr auto wasm_target_triple = "wasm32-unknown-unknown"sv;
    inline constexpr auto default_app_name = "app"sv;
    inline constexpr auto default_wasm_opt_version = "105"sv;
    inline constexpr auto default_debounce = std::chrono::milliseconds{2'000};
    inline constexpr auto default_stop_grace = std::chrono::milliseconds{2'000};

    struct command_spec {
        std::vector<std::string> args{};
        std::optional<std::filesystem::path> cwd{};
        std::vector<std::pair<std::string, std::string>> env{};

        std::string display() const { return utils::join_with_separator(args, " "sv); }
    };

    inline command_spec default_toolchain_command() {
        return command_spec{.args = {"cargo", "build", "--target", std::string{wasm_target_triple}}};
    }

    struct cargo_flags {
        bool quiet{false};
        std::optional<std::string> jobs{};
        std::optional<std::string> profile{};
        bool release{false};
        std::vector<std::string> features{};
        bool all_features{false};
        bool no_default_features{false};
        bool verbose{false};
        std::optional<std::string> color{};
        bool frozen{false};
        bool locked{false};
        bool offline{false};
        bool ignore_rust_version{false};
        std::optional<std::string> example{};
    };

    struct optimizer_options {
        bool enabled{false};
        unsigned optimization_level{1U};
        unsigned shrink_level{2U};
        bool debug_info{false};
        std::vector<std::string> extra_args{};
        std::string version{default_wasm_opt_version};
        std::optional<std::filesystem::path> cache_dir{};
    };

    struct pipeline_config {
        std::filesystem::path output_dir{};
        std::optional<std::filesystem::path> static_dir{};
        std::string package{};
        std::string app_name{default_app_name};
        bool run_in_workspace{true};
        std::optional<std::filesystem::path> style_entry{};
        std::optional<std::filesystem::path> loader_template{};
        optimizer_options optimizer{};
        command_spec toolchain_command{default_toolchain_command()};
        cargo_flags cargo{};
        command_spec style_compiler{.args = {"sass", "--no-source-map"}};
        std::optional<std::filesystem::path> workspace_root{};
        std::optional<std::filesystem::path> target_dir{};

        // throws task_error(invalid_config)
        void validate() const;

        // directory under <target>/wasm32-unknown-unknown/ cargo writes this profile to
        std::string profile_dir() const;
    };

    struct watch_config {
        std::vector<std::filesystem::path> roots{};
        std::vector<std::string> ignore{};
        std::chrono::milliseconds debounce{default_debounce};
        bool ignore_hidden{true};
        bool run_on_start{true};
        std::chrono::milliseconds stop_grace{default_stop_grace};

        // throws task_error(invalid_config)
        void validate() const;
    };

    /*
     * Optional JSON project file (wasmtask.json). Every field may be omitted; unknown keys
     * are ignored so the file can carry driver-specific settings.
     */
    struct project_file {
        int schema_version{1};
        std::optional<std::string> package{};
        std::optional<std::string> app_name{};
        std::optional<std::string> output_dir{};
        std::optional<std::string> static_dir{};
        std::optional<std::string> style_entry{};
        std::optional<std::string> loader_template{};
        std::optional<bool> run_in_workspace{};
        std::optional<bool> optimize{};
        std::optional<unsigned> optimization_level{};
        std::optional<unsigned> shrink_level{};
        std::optional<std::string> wasm_opt_version{};
        std::vector<std::string> watch{};
        std::vector<std::string> ignore{};
        std::optional<int> debounce_ms{};
    };

    project_file parse_project_file(std::string_view json, std::string_view origin = "<memory>"sv);
    project_file load_project_file(const std::filesystem::path& path);

    // fills the configs from a project file; relative paths resolve against `base_dir`
    void apply_project_file(
            const project_file& file, const std::filesystem::path& base_dir, pipeline_config& pipeline,
            watch_config& watch);

}  // namespace wasmtask
