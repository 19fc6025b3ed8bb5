#include "wasmtask/pipeline.hpp"

#include "wasmtask/fetcher.hpp"
#include "wasmtask/format.hpp"
#include "wasmtask/log.hpp"
#include "wasmtask/metadata.hpp"
#include "wasmtask/process.hpp"

#include "internal/platform.hpp"

#include <algorithm>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>
#include <variant>

using namespace wasmtask::literals;
namespace fs = std::filesystem;

namespace wasmtask {

    namespace detail {

        static constexpr auto cache_dir_name = "wasmtask-cache"sv;

        static constexpr auto loader_body = R"(// generated by wasmtask
const moduleUrl = new URL("{{module}}", import.meta.url);

export default async function init(imports = {}) {
    const response = await fetch(moduleUrl);
    const { instance } = await WebAssembly.instantiateStreaming(response, imports);
    return instance.exports;
}
)"sv;

        static constexpr auto loader_stylesheet = R"(
const stylesheet = document.createElement("link");
stylesheet.rel = "stylesheet";
stylesheet.href = new URL("{{app_name}}.css", import.meta.url).href;
document.head.appendChild(stylesheet);
)"sv;

        struct build_context {
            const pipeline_config& config;
            artifact_fetcher* fetcher;
            std::unique_ptr<artifact_fetcher> owned_fetcher{};

            fs::path workspace_root{};
            fs::path target_dir{};
            fs::path artifact{};
            std::optional<std::string> stylesheet{};

            build_output& out;
        };

        static std::string read_file(const fs::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                throw task_error{error_kind::io, "failed to open {}"_format(path.string())};
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        static void write_file(const fs::path& path, std::string_view contents) {
            std::ofstream out{path, std::ios::binary | std::ios::trunc};
            if (!out) {
                throw task_error{error_kind::io, "failed to open {} for write"_format(path.string())};
            }
            out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
            if (!out) {
                throw task_error{error_kind::io, "failed to write {}"_format(path.string())};
            }
        }

        static void clear_directory(const fs::path& dir) {
            std::error_code ec{};
            for (const auto& entry : fs::directory_iterator{dir, ec}) {
                fs::remove_all(entry.path(), ec);
                if (ec) {
                    throw task_error{
                            error_kind::io, "cannot remove {}: {}"_format(entry.path().string(), ec.message())};
                }
            }
            if (ec) {
                throw task_error{error_kind::io, "cannot list {}: {}"_format(dir.string(), ec.message())};
            }
        }

        static std::vector<fs::path> list_files(const fs::path& dir) {
            std::vector<fs::path> files{};
            std::error_code ec{};
            if (!fs::is_directory(dir, ec)) {
                return files;
            }
            for (auto it = fs::recursive_directory_iterator{dir, ec}; !ec && it != fs::recursive_directory_iterator{};
                 it.increment(ec)) {
                if (it->is_regular_file(ec)) {
                    files.push_back(it->path());
                }
            }
            std::ranges::sort(files);
            return files;
        }

        // ── Stages ──────────────────────────────────────────────────────

        struct setup_stage {
            static constexpr auto id = pipeline_stage::setup;

            void run(build_context& ctx) const {
                const auto& config = ctx.config;
                config.validate();

                if (config.workspace_root && config.target_dir) {
                    ctx.workspace_root = *config.workspace_root;
                    ctx.target_dir = *config.target_dir;
                }
                else {
                    auto metadata = query_workspace_metadata();
                    ctx.workspace_root = config.workspace_root.value_or(metadata.workspace_root);
                    ctx.target_dir = config.target_dir.value_or(metadata.target_directory);
                }

                std::error_code ec{};
                fs::create_directories(config.output_dir, ec);
                if (ec) {
                    throw task_error{
                            error_kind::io,
                            "cannot create build directory {}: {}"_format(config.output_dir.string(), ec.message())};
                }
            }
        };

        struct toolchain_stage {
            static constexpr auto id = pipeline_stage::toolchain;

            void run(build_context& ctx) const {
                ctx.artifact = artifact_path(ctx.config, ctx.target_dir);

                std::error_code ec{};
                if (fs::exists(ctx.artifact, ec)) {
                    log::trace("Removing existing target {}"_format(ctx.artifact.string()));
                    fs::remove(ctx.artifact, ec);
                    if (ec) {
                        throw task_error{
                                error_kind::toolchain,
                                "cannot remove existing target {}: {}"_format(ctx.artifact.string(), ec.message())};
                    }
                }

                auto command = toolchain_invocation(ctx.config, ctx.workspace_root);
                log::info("building `{}`"_format(command.display()));

                subprocess_result result{};
                try {
                    result = run_process(command);
                } catch (const task_error& e) {
                    throw task_error{error_kind::toolchain, "could not start {}: {}"_format(command.args[0], e.what())};
                }
                if (!result.success()) {
                    throw task_error{
                            error_kind::toolchain,
                            "`{}` exited with {}"_format(command.display(), result.exit_code),
                            result.diagnostics()};
                }
            }
        };

        struct locate_artifact_stage {
            static constexpr auto id = pipeline_stage::locate_artifact;

            void run(build_context& ctx) const {
                std::error_code ec{};
                auto size = fs::file_size(ctx.artifact, ec);
                if (ec) {
                    throw task_error{
                            error_kind::artifact_not_found, "no module at {}"_format(ctx.artifact.string())};
                }
                if (size == 0) {
                    throw task_error{error_kind::artifact_not_found, "{} is empty"_format(ctx.artifact.string())};
                }
                log::debug("found {} ({} bytes)"_format(ctx.artifact.string(), size));
            }
        };

        struct compile_styles_stage {
            static constexpr auto id = pipeline_stage::compile_styles;

            void run(build_context& ctx) const {
                auto command = ctx.config.style_compiler;
                command.args.push_back(ctx.config.style_entry->string());

                log::trace("Generating CSS from {}"_format(ctx.config.style_entry->string()));
                subprocess_result result{};
                try {
                    result = run_process(command);
                } catch (const task_error& e) {
                    throw task_error{
                            error_kind::style_compile, "could not start {}: {}"_format(command.args[0], e.what())};
                }
                if (!result.success()) {
                    throw task_error{
                            error_kind::style_compile,
                            "could not compile {}"_format(ctx.config.style_entry->string()),
                            result.diagnostics()};
                }
                ctx.stylesheet = std::move(result.stdout_output);
            }
        };

        struct copy_assets_stage {
            static constexpr auto id = pipeline_stage::copy_assets;

            void run(build_context& ctx) const {
                const auto& config = ctx.config;
                std::error_code ec{};
                fs::create_directories(config.output_dir, ec);
                if (ec) {
                    throw task_error{
                            error_kind::io, "cannot create {}: {}"_format(config.output_dir.string(), ec.message())};
                }

                log::trace("Removing already existing dist contents");
                clear_directory(config.output_dir);

                if (config.static_dir) {
                    log::trace("Copying static directory into dist directory");
                    fs::copy(
                            *config.static_dir,
                            config.output_dir,
                            fs::copy_options::recursive | fs::copy_options::overwrite_existing,
                            ec);
                    if (ec) {
                        throw task_error{
                                error_kind::io,
                                "cannot copy static directory {}: {}"_format(config.static_dir->string(), ec.message())};
                    }
                }

                auto& out = ctx.out;
                out.module_path = config.output_dir / "{}.wasm"_format(config.app_name);
                fs::copy_file(ctx.artifact, out.module_path, fs::copy_options::overwrite_existing, ec);
                if (ec) {
                    throw task_error{
                            error_kind::io,
                            "cannot copy {} to {}: {}"_format(
                                    ctx.artifact.string(), out.module_path.string(), ec.message())};
                }

                if (ctx.stylesheet) {
                    out.stylesheet_path = config.output_dir / "{}.css"_format(config.app_name);
                    write_file(*out.stylesheet_path, *ctx.stylesheet);
                }
            }
        };

        struct optimize_stage {
            static constexpr auto id = pipeline_stage::optimize;

            void run(build_context& ctx) const {
                const auto& options = ctx.config.optimizer;
                if (ctx.fetcher == nullptr) {
                    auto root = options.cache_dir.value_or(ctx.target_dir / cache_dir_name);
                    ctx.owned_fetcher = std::make_unique<artifact_fetcher>(root);
                    ctx.fetcher = ctx.owned_fetcher.get();
                }

                auto binary = ctx.fetcher->resolve(internal::platform::tool::wasm_opt, options.version, host_platform());

                const auto& module = ctx.out.module_path;
                auto optimized = fs::path{module.string() + ".opt"};

                command_spec command{
                        .args = {binary.path.string(),
                                 module.string(),
                                 "-o",
                                 optimized.string(),
                                 "-O",
                                 "-ol",
                                 std::to_string(options.optimization_level),
                                 "-s",
                                 std::to_string(options.shrink_level)}};
                if (options.debug_info) {
                    command.args.emplace_back("-g");
                }
                command.args.insert(command.args.end(), options.extra_args.begin(), options.extra_args.end());

                if constexpr (internal::platform::is_macos) {
                    command.env.emplace_back(
                            "DYLD_LIBRARY_PATH", (binary.path.parent_path().parent_path() / "lib").string());
                }

                log::info("Optimizing Wasm");
                subprocess_result result{};
                try {
                    result = run_process(command);
                } catch (const task_error& e) {
                    throw task_error{error_kind::optimization, "could not start wasm-opt: {}"_format(e.what())};
                }

                std::error_code ec{};
                if (!result.success()) {
                    fs::remove(optimized, ec);
                    throw task_error{
                            error_kind::optimization,
                            "wasm-opt exited with {}"_format(result.exit_code),
                            result.diagnostics()};
                }

                auto size = fs::file_size(optimized, ec);
                if (ec || size == 0) {
                    fs::remove(optimized, ec);
                    throw task_error{
                            error_kind::optimization, "wasm-opt produced no output at {}"_format(optimized.string())};
                }

                fs::rename(optimized, module, ec);
                if (ec) {
                    throw task_error{
                            error_kind::optimization,
                            "cannot replace {} with the optimized module: {}"_format(module.string(), ec.message())};
                }
                log::info("Wasm optimized ({} bytes)"_format(size));
            }
        };

        struct write_loader_stage {
            static constexpr auto id = pipeline_stage::write_loader;

            void run(build_context& ctx) const {
                const auto& config = ctx.config;
                std::string tmpl{};
                if (config.loader_template) {
                    tmpl = read_file(*config.loader_template);
                }
                else {
                    tmpl = default_loader_template(ctx.stylesheet.has_value());
                }

                ctx.out.loader_path = config.output_dir / "{}.js"_format(config.app_name);
                write_file(ctx.out.loader_path, render_loader(tmpl, config.app_name));
            }
        };

        using stage = std::variant<
                setup_stage,
                toolchain_stage,
                locate_artifact_stage,
                compile_styles_stage,
                copy_assets_stage,
                optimize_stage,
                write_loader_stage>;

        static std::vector<stage> make_plan(const pipeline_config& config) {
            std::vector<stage> plan{setup_stage{}, toolchain_stage{}, locate_artifact_stage{}};
            if (config.style_entry) {
                plan.emplace_back(compile_styles_stage{});
            }
            plan.emplace_back(copy_assets_stage{});
            if (config.optimizer.enabled) {
                plan.emplace_back(optimize_stage{});
            }
            plan.emplace_back(write_loader_stage{});
            return plan;
        }

        static pipeline_stage stage_id(const stage& s) {
            return std::visit([](const auto& st) { return st.id; }, s);
        }

        static void replace_all(std::string& text, std::string_view token, std::string_view value) {
            size_t pos = 0;
            while ((pos = text.find(token, pos)) != std::string::npos) {
                text.replace(pos, token.size(), value);
                pos += value.size();
            }
        }

        static build_output execute(const pipeline_config& config, artifact_fetcher* fetcher) {
            build_output out{.output_dir = config.output_dir};
            build_context ctx{.config = config, .fetcher = fetcher, .out = out};

            for (const auto& step : make_plan(config)) {
                auto id = stage_id(step);
                log::debug("stage {}"_format(id));
                try {
                    std::visit([&ctx](const auto& st) { st.run(ctx); }, step);
                } catch (const task_error& e) {
                    out.status = build_status::failed;
                    out.failed_stage = id;
                    out.error = e.kind();
                    out.message = e.what();
                    out.diagnostics = e.diagnostics();
                    break;
                } catch (const fs::filesystem_error& e) {
                    out.status = build_status::failed;
                    out.failed_stage = id;
                    out.error = error_kind::io;
                    out.message = e.what();
                    break;
                }
            }

            out.files = list_files(config.output_dir);
            if (out.success()) {
                log::info("Successfully built in {}"_format(config.output_dir.string()));
            }
            else {
                log::error("{}: {}"_format(*out.failed_stage, out.message));
            }
            return out;
        }

    }  // namespace detail

    std::vector<pipeline_stage> plan_stages(const pipeline_config& config) {
        return detail::make_plan(config) | std::views::transform(detail::stage_id) |
               std::ranges::to<std::vector>();
    }

    command_spec toolchain_invocation(const pipeline_config& config, const fs::path& workspace_root) {
        auto command = config.toolchain_command;
        auto& args = command.args;
        const auto& cargo = config.cargo;

        if (cargo.quiet) {
            args.emplace_back("--quiet");
        }
        if (cargo.jobs) {
            args.insert(args.end(), {"--jobs", *cargo.jobs});
        }
        if (cargo.profile) {
            args.insert(args.end(), {"--profile", *cargo.profile});
        }
        if (cargo.release) {
            args.emplace_back("--release");
        }
        for (const auto& feature : cargo.features) {
            args.insert(args.end(), {"--features", feature});
        }
        if (cargo.all_features) {
            args.emplace_back("--all-features");
        }
        if (cargo.no_default_features) {
            args.emplace_back("--no-default-features");
        }
        if (cargo.verbose) {
            args.emplace_back("--verbose");
        }
        if (cargo.color) {
            args.insert(args.end(), {"--color", *cargo.color});
        }
        if (cargo.frozen) {
            args.emplace_back("--frozen");
        }
        if (cargo.locked) {
            args.emplace_back("--locked");
        }
        if (cargo.offline) {
            args.emplace_back("--offline");
        }
        if (cargo.ignore_rust_version) {
            args.emplace_back("--ignore-rust-version");
        }

        args.insert(args.end(), {"--package", config.package});
        if (cargo.example) {
            args.insert(args.end(), {"--example", *cargo.example});
        }

        if (config.run_in_workspace && !workspace_root.empty()) {
            command.cwd = workspace_root;
        }
        return command;
    }

    fs::path artifact_path(const pipeline_config& config, const fs::path& target_dir) {
        auto dir = target_dir / wasm_target_triple / config.profile_dir();
        if (config.cargo.example) {
            return dir / "examples" / "{}.wasm"_format(utils::crate_file_stem(*config.cargo.example));
        }
        return dir / "{}.wasm"_format(utils::crate_file_stem(config.package));
    }

    std::string default_loader_template(bool with_stylesheet) {
        std::string tmpl{detail::loader_body};
        if (with_stylesheet) {
            tmpl += detail::loader_stylesheet;
        }
        return tmpl;
    }

    std::string render_loader(std::string_view tmpl, std::string_view app_name) {
        std::string text{tmpl};
        detail::replace_all(text, "{{module}}"sv, "{}.wasm"_format(app_name));
        detail::replace_all(text, "{{app_name}}"sv, app_name);
        return text;
    }

    build_output run_pipeline(const pipeline_config& config, artifact_fetcher& fetcher) {
        return detail::execute(config, &fetcher);
    }

    build_output run_pipeline(const pipeline_config& config) {
        return detail::execute(config, nullptr);
    }

}  // namespace wasmtask
