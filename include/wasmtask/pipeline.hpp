#pragma once

#include "config.hpp"
#include "errors.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wasmtask {

    class artifact_fetcher;

    enum class pipeline_stage : uint8_t {
        setup,
        toolchain,
        locate_artifact,
        compile_styles,
        copy_assets,
        optimize,
        write_loader,
    };

    inline constexpr std::string_view to_string(pipeline_stage stage) {
        switch (stage) {
            case pipeline_stage::setup:
                return "setup"sv;
            case pipeline_stage::toolchain:
                return "toolchain"sv;
            case pipeline_stage::locate_artifact:
                return "locate_artifact"sv;
            case pipeline_stage::compile_styles:
                return "compile_styles"sv;
            case pipeline_stage::copy_assets:
                return "copy_assets"sv;
            case pipeline_stage::optimize:
                return "optimize"sv;
            case pipeline_stage::write_loader:
                return "write_loader"sv;
        }
        return "setup"sv;
    }

    enum class build_status : uint8_t { success, failed };

    inline constexpr std::string_view to_string(build_status status) {
        switch (status) {
            case build_status::success:
                return "success"sv;
            case build_status::failed:
                return "failed"sv;
        }
        return "failed"sv;
    }

    struct build_output {
        // every regular file under output_dir, sorted
        std::vector<std::filesystem::path> files{};
        build_status status{build_status::success};
        std::optional<pipeline_stage> failed_stage{};
        std::optional<error_kind> error{};
        std::string message{};
        std::string diagnostics{};

        std::filesystem::path output_dir{};
        std::filesystem::path module_path{};
        std::filesystem::path loader_path{};
        std::optional<std::filesystem::path> stylesheet_path{};

        bool success() const { return status == build_status::success; }
    };

    // stages that run for `config`, in execution order
    std::vector<pipeline_stage> plan_stages(const pipeline_config& config);

    // the toolchain command with cargo flags, --package and --example appended
    command_spec toolchain_invocation(const pipeline_config& config, const std::filesystem::path& workspace_root);

    // <target_dir>/wasm32-unknown-unknown/<profile>/[examples/]<stem>.wasm
    std::filesystem::path artifact_path(const pipeline_config& config, const std::filesystem::path& target_dir);

    // built-in <app>.js; `{{module}}` and `{{app_name}}` in `tmpl` are substituted
    std::string render_loader(std::string_view tmpl, std::string_view app_name);
    std::string default_loader_template(bool with_stylesheet);

    /*
     * Runs the distribution pipeline once. Stage failures are reported through the returned
     * build_output and never thrown; the first failing stage ends the run.
     */
    build_output run_pipeline(const pipeline_config& config, artifact_fetcher& fetcher);

    // as above, with a fetcher rooted at optimizer.cache_dir or <target_dir>/wasmtask-cache
    build_output run_pipeline(const pipeline_config& config);

}  // namespace wasmtask
