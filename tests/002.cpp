#include "utils.hpp"

namespace wasmtask::test {
    using namespace std::string_view_literals;

    TEST_CASE("002: project file fills pipeline and watch configs", "[002][config][project]") {
        constexpr auto json = R"({
            "schema_version": 1,
            "package": "webapp",
            "app_name": "site",
            "output_dir": "target/dist",
            "static_dir": "public",
            "style_entry": "styles/main.scss",
            "optimize": true,
            "optimization_level": 3,
            "shrink_level": 1,
            "wasm_opt_version": "110",
            "watch": ["src", "/abs/assets"],
            "ignore": ["dist", "*.tmp"],
            "debounce_ms": 250,
            "xtask_extra": {"anything": [1, 2, 3]}
        })"sv;

        auto file = parse_project_file(json);
        REQUIRE(file.package.has_value());
        CHECK(*file.package == "webapp");
        CHECK(file.watch.size() == 2U);

        pipeline_config pipeline{};
        watch_config watch{};
        apply_project_file(file, "/work/project", pipeline, watch);

        CHECK(pipeline.package == "webapp");
        CHECK(pipeline.app_name == "site");
        CHECK(pipeline.output_dir == std::filesystem::path{"/work/project/target/dist"});
        REQUIRE(pipeline.static_dir.has_value());
        CHECK(*pipeline.static_dir == std::filesystem::path{"/work/project/public"});
        REQUIRE(pipeline.style_entry.has_value());
        CHECK(*pipeline.style_entry == std::filesystem::path{"/work/project/styles/main.scss"});
        CHECK_FALSE(pipeline.loader_template.has_value());
        CHECK(pipeline.optimizer.enabled);
        CHECK(pipeline.optimizer.optimization_level == 3U);
        CHECK(pipeline.optimizer.shrink_level == 1U);
        CHECK(pipeline.optimizer.version == "110");

        REQUIRE(watch.roots.size() == 2U);
        CHECK(watch.roots[0] == std::filesystem::path{"/work/project/src"});
        CHECK(watch.roots[1] == std::filesystem::path{"/abs/assets"});
        CHECK(watch.ignore == std::vector<std::string>{"dist", "*.tmp"});
        CHECK(watch.debounce == std::chrono::milliseconds{250});
    }

    TEST_CASE("002: empty project file keeps defaults", "[002][config][project]") {
        auto file = parse_project_file("{}"sv);

        pipeline_config pipeline{};
        watch_config watch{};
        apply_project_file(file, "/work", pipeline, watch);

        CHECK(pipeline.package.empty());
        CHECK(pipeline.app_name == "app");
        CHECK(pipeline.output_dir.empty());
        CHECK_FALSE(pipeline.optimizer.enabled);
        CHECK(watch.roots.empty());
        CHECK(watch.debounce == default_debounce);
    }

    TEST_CASE("002: malformed or newer project files are rejected", "[002][config][project]") {
        try {
            (void)parse_project_file(R"({"package": 12})"sv, "bad.json"sv);
            FAIL("type mismatch accepted");
        } catch (const task_error& e) {
            CHECK(e.kind() == error_kind::invalid_config);
            CHECK(std::string_view{e.what()}.find("bad.json") != std::string_view::npos);
        }

        try {
            (void)parse_project_file(R"({"schema_version": 2})"sv);
            FAIL("future schema accepted");
        } catch (const task_error& e) {
            CHECK(e.kind() == error_kind::invalid_config);
            CHECK(std::string_view{e.what()}.find("schema_version") != std::string_view::npos);
        }

        CHECK_THROWS_AS(parse_project_file("{ not json"sv), task_error);
    }

    TEST_CASE("002: project file loads from disk", "[002][config][project]") {
        detail::temp_dir temp{"project"};
        auto path = temp.path / "wasmtask.json";
        detail::write_text_file(path, R"({"package": "demo", "run_in_workspace": false})");

        auto file = load_project_file(path);
        REQUIRE(file.package.has_value());
        CHECK(*file.package == "demo");
        REQUIRE(file.run_in_workspace.has_value());
        CHECK_FALSE(*file.run_in_workspace);

        try {
            (void)load_project_file(temp.path / "missing.json");
            FAIL("missing file accepted");
        } catch (const task_error& e) {
            CHECK(e.kind() == error_kind::io);
        }
    }

}  // namespace wasmtask::test
