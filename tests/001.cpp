#include "utils.hpp"

#include "wasmtask/pipeline.hpp"
#include "wasmtask/process.hpp"
#include "wasmtask/watcher.hpp"

namespace wasmtask::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: output mode and log level parsing", "[001][config]") {
        output_mode mode = output_mode::table;

        REQUIRE(try_parse_output_mode("JSON"sv, mode));
        CHECK(mode == output_mode::json);
        REQUIRE(try_parse_output_mode("table"sv, mode));
        CHECK(mode == output_mode::table);
        CHECK_FALSE(try_parse_output_mode("yaml"sv, mode));
        CHECK(mode == output_mode::table);

        log::log_level level = log::log_level::info;
        REQUIRE(log::try_parse_log_level("DEBUG"sv, level));
        CHECK(level == log::log_level::debug);
        REQUIRE(log::try_parse_log_level("warning"sv, level));
        CHECK(level == log::log_level::warn);
        REQUIRE(log::try_parse_log_level("off"sv, level));
        CHECK(level == log::log_level::off);
        CHECK_FALSE(log::try_parse_log_level("loud"sv, level));
    }

    TEST_CASE("001: enum string conversion", "[001][config]") {
        CHECK(to_string(output_mode::json) == "json"sv);
        CHECK(to_string(error_kind::artifact_not_found) == "artifact_not_found"sv);
        CHECK(to_string(error_kind::unsupported_platform) == "unsupported_platform"sv);
        CHECK(to_string(pipeline_stage::toolchain) == "toolchain"sv);
        CHECK(to_string(pipeline_stage::write_loader) == "write_loader"sv);
        CHECK(to_string(process_state::killed) == "killed"sv);
        CHECK(to_string(change_kind::removed) == "removed"sv);
        CHECK(std::format("{}", pipeline_stage::copy_assets) == "copy_assets");
        CHECK(std::format("{}:{}", build_status::failed, error_kind::toolchain) == "failed:toolchain");
    }

    TEST_CASE("001: pipeline config defaults and validation", "[001][config]") {
        pipeline_config cfg{};
        CHECK(cfg.app_name == "app");
        CHECK(cfg.run_in_workspace);
        CHECK_FALSE(cfg.optimizer.enabled);
        CHECK(cfg.optimizer.optimization_level == 1U);
        CHECK(cfg.optimizer.shrink_level == 2U);
        CHECK(cfg.optimizer.version == "105");
        CHECK(cfg.toolchain_command.args ==
              std::vector<std::string>{"cargo", "build", "--target", "wasm32-unknown-unknown"});
        CHECK(cfg.style_compiler.args == std::vector<std::string>{"sass", "--no-source-map"});

        try {
            cfg.validate();
            FAIL("empty output directory accepted");
        } catch (const task_error& e) {
            CHECK(e.kind() == error_kind::invalid_config);
        }

        cfg.output_dir = "dist";
        try {
            cfg.validate();
            FAIL("empty package accepted");
        } catch (const task_error& e) {
            CHECK(e.kind() == error_kind::invalid_config);
            CHECK(std::string_view{e.what()}.find("package") != std::string_view::npos);
        }

        cfg.package = "webapp";
        CHECK_NOTHROW(cfg.validate());

        cfg.app_name = "../escape";
        CHECK_THROWS_AS(cfg.validate(), task_error);
    }

    TEST_CASE("001: profile directory follows cargo conventions", "[001][config]") {
        pipeline_config cfg{};
        CHECK(cfg.profile_dir() == "debug");

        cfg.cargo.release = true;
        CHECK(cfg.profile_dir() == "release");

        cfg.cargo.profile = "dev";
        CHECK(cfg.profile_dir() == "debug");

        cfg.cargo.profile = "release-lto";
        CHECK(cfg.profile_dir() == "release-lto");
    }

    TEST_CASE("001: watch config defaults and validation", "[001][config]") {
        watch_config cfg{};
        CHECK(cfg.debounce == std::chrono::milliseconds{2000});
        CHECK(cfg.stop_grace == std::chrono::milliseconds{2000});
        CHECK(cfg.ignore_hidden);
        CHECK(cfg.run_on_start);

        CHECK_THROWS_AS(cfg.validate(), task_error);

        cfg.roots.emplace_back("src");
        CHECK_NOTHROW(cfg.validate());

        cfg.debounce = std::chrono::milliseconds{0};
        try {
            cfg.validate();
            FAIL("zero debounce accepted");
        } catch (const task_error& e) {
            CHECK(e.kind() == error_kind::invalid_config);
        }
    }

    TEST_CASE("001: log level gates the sink", "[001][log]") {
        detail::log_capture capture{log::log_level::warn};

        log::info("hidden message");
        log::warn("shown warning");
        log::error("shown error");

        CHECK_FALSE(capture.contains("hidden message"));
        CHECK(capture.contains("shown warning"));
        CHECK(capture.contains("shown error"));
        CHECK(capture.lines.size() == 2U);
        CHECK(capture.lines.front().first == log::log_level::warn);

        log::set_level(log::log_level::off);
        log::error("suppressed");
        CHECK_FALSE(capture.contains("suppressed"));
    }

    TEST_CASE("001: utility helpers", "[001][utils]") {
        CHECK(utils::crate_file_stem("my-web-app") == "my_web_app");
        CHECK(utils::trim_view("  42 \n"sv) == "42"sv);
        CHECK(utils::parse_integer<int>("200"sv) == 200);
        CHECK_FALSE(utils::parse_integer<int>("20x"sv).has_value());

        CHECK(utils::path_starts_with("/ws/target/debug", "/ws/target"));
        CHECK_FALSE(utils::path_starts_with("/ws/targets", "/ws/target"));
        CHECK(utils::join_with_separator({"cargo", "build"}, " "sv) == "cargo build");
    }

}  // namespace wasmtask::test
