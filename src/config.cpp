#include "wasmtask/config.hpp"

#include "wasmtask/errors.hpp"
#include "wasmtask/format.hpp"

#include <glaze/glaze.hpp>

#include <fstream>
#include <sstream>

using namespace wasmtask::literals;
namespace fs = std::filesystem;

template <>
struct glz::meta<wasmtask::project_file> {
    using T = wasmtask::project_file;
    static constexpr auto value =
            object("schema_version",
                   &T::schema_version,
                   "package",
                   &T::package,
                   "app_name",
                   &T::app_name,
                   "output_dir",
                   &T::output_dir,
                   "static_dir",
                   &T::static_dir,
                   "style_entry",
                   &T::style_entry,
                   "loader_template",
                   &T::loader_template,
                   "run_in_workspace",
                   &T::run_in_workspace,
                   "optimize",
                   &T::optimize,
                   "optimization_level",
                   &T::optimization_level,
                   "shrink_level",
                   &T::shrink_level,
                   "wasm_opt_version",
                   &T::wasm_opt_version,
                   "watch",
                   &T::watch,
                   "ignore",
                   &T::ignore,
                   "debounce_ms",
                   &T::debounce_ms);
};

namespace wasmtask {

    namespace detail {

        static void require(bool condition, std::string_view message) {
            if (!condition) {
                throw task_error{error_kind::invalid_config, std::string{message}};
            }
        }

        static fs::path resolve_against(const fs::path& base_dir, const std::string& value) {
            fs::path path{value};
            if (path.is_absolute()) {
                return path;
            }
            return base_dir / path;
        }

    }  // namespace detail

    void pipeline_config::validate() const {
        detail::require(!output_dir.empty(), "output directory must not be empty");
        detail::require(!package.empty(), "package name must not be empty");
        detail::require(!app_name.empty(), "app name must not be empty");
        detail::require(
                app_name.find('/') == std::string::npos && app_name != "." && app_name != "..",
                "app name must be a plain file stem");
        detail::require(!toolchain_command.args.empty(), "toolchain command must not be empty");
        if (style_entry) {
            detail::require(!style_compiler.args.empty(), "style compiler command must not be empty");
        }
        if (optimizer.enabled) {
            detail::require(!optimizer.version.empty(), "wasm-opt version must not be empty");
        }
    }

    std::string pipeline_config::profile_dir() const {
        if (cargo.profile) {
            if (*cargo.profile == "dev"sv) {
                return "debug";
            }
            return *cargo.profile;
        }
        return cargo.release ? "release" : "debug";
    }

    void watch_config::validate() const {
        detail::require(!roots.empty(), "at least one watch root is required");
        detail::require(debounce.count() > 0, "debounce interval must be positive");
        detail::require(stop_grace.count() >= 0, "stop grace period must not be negative");
    }

    project_file parse_project_file(std::string_view json, std::string_view origin) {
        project_file file{};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(file, json);
        if (ec) {
            throw task_error{
                    error_kind::invalid_config,
                    "failed to parse project file {}: {}"_format(origin, glz::format_error(ec, json))};
        }
        constexpr int supported_schema_version = 1;
        if (file.schema_version > supported_schema_version) {
            throw task_error{
                    error_kind::invalid_config,
                    "unsupported schema_version in {}: {} > {}"_format(
                            origin, file.schema_version, supported_schema_version)};
        }
        return file;
    }

    project_file load_project_file(const fs::path& path) {
        std::ifstream in{path};
        if (!in) {
            throw task_error{error_kind::io, "failed to open {}"_format(path.string())};
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw task_error{error_kind::io, "failed to read {}"_format(path.string())};
        }
        return parse_project_file(ss.str(), path.string());
    }

    void apply_project_file(
            const project_file& file, const fs::path& base_dir, pipeline_config& pipeline, watch_config& watch) {
        if (file.package) {
            pipeline.package = *file.package;
        }
        if (file.app_name) {
            pipeline.app_name = *file.app_name;
        }
        if (file.output_dir) {
            pipeline.output_dir = detail::resolve_against(base_dir, *file.output_dir);
        }
        if (file.static_dir) {
            pipeline.static_dir = detail::resolve_against(base_dir, *file.static_dir);
        }
        if (file.style_entry) {
            pipeline.style_entry = detail::resolve_against(base_dir, *file.style_entry);
        }
        if (file.loader_template) {
            pipeline.loader_template = detail::resolve_against(base_dir, *file.loader_template);
        }
        if (file.run_in_workspace) {
            pipeline.run_in_workspace = *file.run_in_workspace;
        }
        if (file.optimize) {
            pipeline.optimizer.enabled = *file.optimize;
        }
        if (file.optimization_level) {
            pipeline.optimizer.optimization_level = *file.optimization_level;
        }
        if (file.shrink_level) {
            pipeline.optimizer.shrink_level = *file.shrink_level;
        }
        if (file.wasm_opt_version) {
            pipeline.optimizer.version = *file.wasm_opt_version;
        }

        for (const auto& root : file.watch) {
            watch.roots.push_back(detail::resolve_against(base_dir, root));
        }
        watch.ignore.insert(watch.ignore.end(), file.ignore.begin(), file.ignore.end());
        if (file.debounce_ms) {
            watch.debounce = std::chrono::milliseconds{*file.debounce_ms};
        }
    }

}  // namespace wasmtask
