#include "utils.hpp"

#include "wasmtask/process.hpp"

namespace wasmtask::test {
    using namespace std::string_view_literals;

    TEST_CASE("003: run_process captures stdout stderr and exit code", "[003][process]") {
        auto result = run_process(command_spec{.args = {"sh", "-c", "echo out; echo err >&2; exit 3"}});

        CHECK(result.exit_code == 3);
        CHECK_FALSE(result.success());
        CHECK_FALSE(result.timed_out);
        CHECK(result.stdout_output == "out\n");
        CHECK(result.stderr_output == "err\n");
        CHECK(result.diagnostics() == "err\nout\n");
    }

    TEST_CASE("003: run_process honours cwd and environment overrides", "[003][process]") {
        detail::temp_dir temp{"run_process"};

        auto result = run_process(command_spec{
                .args = {"sh", "-c", "pwd; printf '%s\\n' \"$WASMTASK_TEST_VALUE\""},
                .cwd = temp.path,
                .env = {{"WASMTASK_TEST_VALUE", "hello"}}});

        REQUIRE(result.success());
        auto lines = std::vector<std::string>{};
        std::istringstream in{result.stdout_output};
        for (std::string line; std::getline(in, line);) {
            lines.push_back(line);
        }
        REQUIRE(lines.size() == 2U);
        CHECK(std::filesystem::equivalent(lines[0], temp.path));
        CHECK(lines[1] == "hello");
    }

    TEST_CASE("003: run_process reports signals as 128 plus signo", "[003][process]") {
        auto result = run_process(command_spec{.args = {"sh", "-c", "kill -TERM $$"}});
        CHECK(result.exit_code == 128 + SIGTERM);
    }

    TEST_CASE("003: run_process kills children that outlive the timeout", "[003][process]") {
        auto start = std::chrono::steady_clock::now();
        auto result = run_process(command_spec{.args = {"sleep", "5"}}, std::chrono::milliseconds{100});
        auto elapsed = std::chrono::steady_clock::now() - start;

        CHECK(result.timed_out);
        CHECK_FALSE(result.success());
        CHECK(elapsed < std::chrono::seconds{3});
        CHECK(result.diagnostics().find("timed out") != std::string::npos);
    }

    TEST_CASE("003: run_process throws spawn errors for missing programs", "[003][process]") {
        try {
            (void)run_process(command_spec{.args = {"wasmtask-definitely-not-a-program"}});
            FAIL("missing program spawned");
        } catch (const task_error& e) {
            CHECK(e.kind() == error_kind::spawn);
            CHECK(std::string_view{e.what()}.find("wasmtask-definitely-not-a-program") != std::string_view::npos);
        }

        CHECK_THROWS_AS(run_process(command_spec{}), task_error);
    }

    TEST_CASE("003: command display joins arguments", "[003][process]") {
        command_spec command{.args = {"cargo", "build", "--release"}};
        CHECK(command.display() == "cargo build --release");
    }

}  // namespace wasmtask::test
