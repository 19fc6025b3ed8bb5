#include "cli.hpp"

#include "wasmtask/errors.hpp"
#include "wasmtask/format.hpp"
#include "wasmtask/metadata.hpp"
#include "wasmtask/pipeline.hpp"
#include "wasmtask/rebuild.hpp"

#include <CLI/CLI.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <signal.h>
}

#include <atomic>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace wasmtask::literals;
namespace fs = std::filesystem;

namespace wasmtask::cli::detail {

    struct dist_report {
        std::string status{};
        std::optional<std::string> failed_stage{};
        std::optional<std::string> error{};
        std::string message{};
        std::string diagnostics{};
        std::string output_dir{};
        std::string module{};
        std::string loader{};
        std::optional<std::string> stylesheet{};
        std::vector<std::string> files{};
    };

}  // namespace wasmtask::cli::detail

namespace glz {

    template <>
    struct meta<wasmtask::cli::detail::dist_report> {
        using T = wasmtask::cli::detail::dist_report;
        static constexpr auto value = object(
                "status",
                &T::status,
                "failed_stage",
                &T::failed_stage,
                "error",
                &T::error,
                "message",
                &T::message,
                "diagnostics",
                &T::diagnostics,
                "output_dir",
                &T::output_dir,
                "module",
                &T::module,
                "loader",
                &T::loader,
                "stylesheet",
                &T::stylesheet,
                "files",
                &T::files);
    };

}  // namespace glz

namespace wasmtask::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static constexpr auto default_project_file = "wasmtask.json"sv;

        static std::atomic<rebuild_loop*> active_loop{nullptr};

        static void on_terminate_signal(int) {
            if (auto* loop = active_loop.load()) {
                loop->cancel();
            }
        }

        // SIGINT/SIGTERM cancel the loop for as long as this is alive
        struct cancel_on_signal {
            struct sigaction previous_int {};
            struct sigaction previous_term {};

            explicit cancel_on_signal(rebuild_loop& loop) {
                active_loop.store(&loop);
                struct sigaction action {};
                action.sa_handler = on_terminate_signal;
                sigemptyset(&action.sa_mask);
                ::sigaction(SIGINT, &action, &previous_int);
                ::sigaction(SIGTERM, &action, &previous_term);
            }

            ~cancel_on_signal() {
                ::sigaction(SIGINT, &previous_int, nullptr);
                ::sigaction(SIGTERM, &previous_term, nullptr);
                active_loop.store(nullptr);
            }

            cancel_on_signal(const cancel_on_signal&) = delete;
            cancel_on_signal& operator=(const cancel_on_signal&) = delete;
        };

        static dist_report make_report(const build_output& out) {
            dist_report report{
                    .status = std::string{to_string(out.status)},
                    .message = out.message,
                    .diagnostics = out.diagnostics,
                    .output_dir = out.output_dir.string(),
                    .module = out.module_path.string(),
                    .loader = out.loader_path.string()};
            if (out.failed_stage) {
                report.failed_stage = std::string{to_string(*out.failed_stage)};
            }
            if (out.error) {
                report.error = std::string{to_string(*out.error)};
            }
            if (out.stylesheet_path) {
                report.stylesheet = out.stylesheet_path->string();
            }
            for (const auto& file : out.files) {
                report.files.push_back(file.string());
            }
            return report;
        }

        static void print_table(const build_output& out, std::ostream& os) {
            os << "status      " << to_string(out.status) << '\n';
            os << "output_dir  " << out.output_dir.string() << '\n';
            os << "module      " << out.module_path.string() << '\n';
            os << "loader      " << out.loader_path.string() << '\n';
            if (out.stylesheet_path) {
                os << "stylesheet  " << out.stylesheet_path->string() << '\n';
            }
            os << "files       " << out.files.size() << '\n';
            for (const auto& file : out.files) {
                os << "  " << file.lexically_relative(out.output_dir).string() << '\n';
            }
        }

        static bool print_json(const build_output& out, std::ostream& os) {
            std::string json{};
            if (glz::write<glz::opts{.prettify = true}>(make_report(out), json)) {
                return false;
            }
            os << json << '\n';
            return true;
        }

        static void load_project(const std::optional<std::string>& config_arg, driver_config& cfg) {
            fs::path path{};
            if (config_arg) {
                path = *config_arg;
            }
            else {
                std::error_code ec{};
                if (!fs::exists(default_project_file, ec)) {
                    return;
                }
                path = default_project_file;
            }

            auto file = load_project_file(path);
            auto base_dir = fs::absolute(path).parent_path();
            apply_project_file(file, base_dir, cfg.pipeline, cfg.watch);
            log::debug("loaded project file {}"_format(path.string()));
        }

        // <target>/<release|debug>/dist
        static void resolve_dist_defaults(pipeline_config& pipeline) {
            if (!pipeline.output_dir.empty() && pipeline.workspace_root && pipeline.target_dir) {
                return;
            }
            auto metadata = query_workspace_metadata();
            if (!pipeline.workspace_root) {
                pipeline.workspace_root = metadata.workspace_root;
            }
            if (!pipeline.target_dir) {
                pipeline.target_dir = metadata.target_directory;
            }
            if (pipeline.output_dir.empty()) {
                pipeline.output_dir = *pipeline.target_dir / (pipeline.cargo.release ? "release" : "debug") / "dist";
            }
        }

        // without -w the whole workspace is watched; its target directory never is
        static void apply_workspace_defaults(watch_config& wcfg) {
            if (wcfg.roots.empty()) {
                apply_workspace_metadata(query_workspace_metadata(), wcfg);
                return;
            }
            try {
                apply_workspace_metadata(query_workspace_metadata(), wcfg);
            } catch (const task_error& e) {
                log::warn("cannot locate the target directory, it will not be ignored: {}"_format(e.what()));
            }
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, driver_config& cfg) {
        CLI::App app{"wasmtask: build cargo projects for Wasm and rerun commands on change"};
        app.require_subcommand(1);
        app.fallthrough();

        bool quiet = false;
        bool verbose = false;
        std::optional<std::string> log_level_arg{};
        std::optional<std::string> config_arg{};

        app.set_version_flag("--version", std::string{"wasmtask "} + WASMTASK_VERSION);
        app.add_flag("-q,--quiet", quiet, "Only print warnings and errors (passed on to cargo by dist)");
        app.add_flag("-v,--verbose", verbose, "Print debug output (passed on to cargo by dist)");
        app.add_option("--log-level", log_level_arg, "Log level: trace|debug|info|warn|error|off");
        app.add_option("-c,--config", config_arg, "Project file, wasmtask.json when present");

        // ── dist ────────────────────────────────────────────────────────
        auto* dist = app.add_subcommand("dist", "Build the package for Wasm and assemble the dist directory");

        std::optional<std::string> package_arg{};
        std::optional<std::string> app_name_arg{};
        std::optional<std::string> dist_dir_arg{};
        std::optional<std::string> static_dir_arg{};
        std::optional<std::string> style_arg{};
        std::optional<std::string> loader_arg{};
        std::optional<std::string> cache_dir_arg{};
        std::optional<std::string> wasm_opt_version_arg{};
        std::optional<unsigned> optimization_level_arg{};
        std::optional<unsigned> shrink_level_arg{};
        std::string output_arg{std::string{to_string(cfg.output)}};
        bool optimize = false;
        bool debug_info = false;
        bool no_workspace = false;
        auto& cargo = cfg.pipeline.cargo;

        dist->add_option("-p,--package", package_arg, "Package to build");
        dist->add_option("--app-name", app_name_arg, "Stem of the generated files (default: app)");
        dist->add_option("--dist-dir", dist_dir_arg, "Output directory (default: <target>/<profile>/dist)");
        dist->add_option("--static-dir", static_dir_arg, "Directory copied into the output directory");
        dist->add_option("--style", style_arg, "SASS/SCSS entry compiled to <app>.css");
        dist->add_option("--loader-template", loader_arg, "Template for <app>.js");
        dist->add_flag("--no-workspace", no_workspace, "Run cargo in the current directory");
        dist->add_option("-j,--jobs", cargo.jobs, "Number of parallel cargo jobs");
        dist->add_option("--profile", cargo.profile, "Build artifacts with the specified profile");
        dist->add_flag("-r,--release", cargo.release, "Build in release mode");
        dist->add_option("-F,--features", cargo.features, "Features to activate");
        dist->add_flag("--all-features", cargo.all_features, "Activate all available features");
        dist->add_flag("--no-default-features", cargo.no_default_features, "Do not activate default features");
        dist->add_option("--color", cargo.color, "Cargo coloring: auto|always|never");
        dist->add_flag("--frozen", cargo.frozen, "Require Cargo.lock and cache are up to date");
        dist->add_flag("--locked", cargo.locked, "Require Cargo.lock is up to date");
        dist->add_flag("--offline", cargo.offline, "Run cargo without accessing the network");
        dist->add_flag("--ignore-rust-version", cargo.ignore_rust_version, "Ignore rust-version of the package");
        dist->add_option("--example", cargo.example, "Build the given example");
        dist->add_flag("--optimize", optimize, "Run wasm-opt on the module");
        dist->add_option("--optimization-level", optimization_level_arg, "wasm-opt -ol level");
        dist->add_option("--shrink-level", shrink_level_arg, "wasm-opt -s level");
        dist->add_flag("--debug-info", debug_info, "Keep debug info (wasm-opt -g)");
        dist->add_option("--wasm-opt-version", wasm_opt_version_arg, "binaryen release to download");
        dist->add_option("--cache-dir", cache_dir_arg, "wasm-opt cache (default: <target>/wasmtask-cache)");
        dist->add_option("--output", output_arg, "Output mode: table|json");

        // ── watch ───────────────────────────────────────────────────────
        auto* watch = app.add_subcommand("watch", "Rerun a command whenever the project changes");

        std::vector<std::string> watch_paths{};
        std::vector<std::string> ignore_paths{};
        std::optional<int> debounce_ms_arg{};
        std::optional<int> stop_grace_ms_arg{};
        bool include_hidden = false;
        bool no_initial_run = false;
        std::vector<std::string> command_args{};

        watch->add_option("-w,--watch", watch_paths, "Watch specific files or folders (default: workspace root)");
        watch->add_option("-i,--ignore", ignore_paths, "Paths or globs that will be excluded");
        watch->add_option("--debounce-ms", debounce_ms_arg, "Quiet period before rerunning (default: 2000)");
        watch->add_option("--stop-grace-ms", stop_grace_ms_arg, "Delay before SIGKILL (default: 2000)");
        watch->add_flag("--include-hidden", include_hidden, "Also react to hidden paths");
        watch->add_flag("--no-initial-run", no_initial_run, "Wait for a change before the first run");
        watch->add_option("command", command_args, "Command to run, after -- (default: cargo xtask dist)");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (quiet && verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (quiet) {
            cfg.level = log::log_level::warn;
        }
        if (verbose) {
            cfg.level = log::log_level::debug;
        }
        if (log_level_arg && !log::try_parse_log_level(*log_level_arg, cfg.level)) {
            std::cerr << "invalid --log-level value: " << *log_level_arg
                      << " (expected trace|debug|info|warn|error|off)\n";
            return std::optional<int>{2};
        }
        log::set_level(cfg.level);

        try {
            detail::load_project(config_arg, cfg);
        } catch (const task_error& e) {
            std::cerr << e.what() << '\n';
            return std::optional<int>{2};
        }

        if (dist->parsed()) {
            cfg.command = command_kind::dist;
            auto& pipeline = cfg.pipeline;

            if (!try_parse_output_mode(output_arg, cfg.output)) {
                std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
                return std::optional<int>{2};
            }

            cargo.quiet = quiet;
            cargo.verbose = verbose;
            if (package_arg) {
                pipeline.package = *package_arg;
            }
            if (app_name_arg) {
                pipeline.app_name = *app_name_arg;
            }
            if (dist_dir_arg) {
                pipeline.output_dir = *dist_dir_arg;
            }
            if (static_dir_arg) {
                pipeline.static_dir = *static_dir_arg;
            }
            if (style_arg) {
                pipeline.style_entry = *style_arg;
            }
            if (loader_arg) {
                pipeline.loader_template = *loader_arg;
            }
            if (no_workspace) {
                pipeline.run_in_workspace = false;
            }
            if (optimize) {
                pipeline.optimizer.enabled = true;
            }
            if (debug_info) {
                pipeline.optimizer.debug_info = true;
            }
            if (optimization_level_arg) {
                pipeline.optimizer.optimization_level = *optimization_level_arg;
            }
            if (shrink_level_arg) {
                pipeline.optimizer.shrink_level = *shrink_level_arg;
            }
            if (wasm_opt_version_arg) {
                pipeline.optimizer.version = *wasm_opt_version_arg;
            }
            if (cache_dir_arg) {
                pipeline.optimizer.cache_dir = *cache_dir_arg;
            }

            if (pipeline.package.empty()) {
                std::cerr << "no package given, pass --package or set `package` in the project file\n";
                return std::optional<int>{2};
            }
            return std::nullopt;
        }

        cfg.command = command_kind::watch;
        auto& wcfg = cfg.watch;
        for (const auto& path : watch_paths) {
            wcfg.roots.emplace_back(path);
        }
        wcfg.ignore.insert(wcfg.ignore.end(), ignore_paths.begin(), ignore_paths.end());
        if (debounce_ms_arg) {
            wcfg.debounce = std::chrono::milliseconds{*debounce_ms_arg};
        }
        if (stop_grace_ms_arg) {
            wcfg.stop_grace = std::chrono::milliseconds{*stop_grace_ms_arg};
        }
        if (include_hidden) {
            wcfg.ignore_hidden = false;
        }
        if (no_initial_run) {
            wcfg.run_on_start = false;
        }
        if (!command_args.empty()) {
            cfg.watch_command = command_spec{.args = std::move(command_args)};
        }

        if (wcfg.debounce.count() <= 0) {
            std::cerr << "--debounce-ms must be positive\n";
            return std::optional<int>{2};
        }
        return std::nullopt;
    }

    int run_dist(driver_config& cfg) {
        try {
            detail::resolve_dist_defaults(cfg.pipeline);
        } catch (const task_error& e) {
            std::cerr << "setup: " << e.what() << '\n';
            if (!e.diagnostics().empty()) {
                std::cerr << e.diagnostics() << '\n';
            }
            return 1;
        }

        auto out = run_pipeline(cfg.pipeline);

        if (cfg.output == output_mode::json) {
            if (!detail::print_json(out, std::cout)) {
                std::cerr << "failed to serialize build output\n";
                return 1;
            }
        }
        else if (out.success()) {
            detail::print_table(out, std::cout);
        }

        if (!out.success()) {
            std::cerr << to_string(*out.failed_stage) << ": " << out.message << '\n';
            if (!out.diagnostics.empty()) {
                std::cerr << out.diagnostics;
                if (out.diagnostics.back() != '\n') {
                    std::cerr << '\n';
                }
            }
            return 1;
        }
        return 0;
    }

    int run_watch(driver_config& cfg) {
        auto& wcfg = cfg.watch;
        try {
            detail::apply_workspace_defaults(wcfg);

            rebuild_loop loop{};
            detail::cancel_on_signal guard{loop};

            log::info("Starting to watch, running `{}` on change"_format(cfg.watch_command.display()));
            loop.run(wcfg, cfg.watch_command);
            log::info("stopped after {} restarts"_format(loop.restart_count()));
        } catch (const task_error& e) {
            std::cerr << to_string(e.kind()) << ": " << e.what() << '\n';
            if (!e.diagnostics().empty()) {
                std::cerr << e.diagnostics() << '\n';
            }
            return 1;
        }
        return 0;
    }

}  // namespace wasmtask::cli
