#include "utils.hpp"

#include "wasmtask/rebuild.hpp"

namespace wasmtask::test {
    using namespace std::string_view_literals;
    using namespace std::chrono_literals;
    using namespace wasmtask::literals;

    namespace detail {

        struct loop_fixture {
            temp_dir temp{"rebuild"};
            fs::path root{temp.path / "src"};
            fs::path pid_dir{temp.path / "pids"};
            fs::path log_file{temp.path / "spawned.log"};
            fs::path script{temp.path / "child.sh"};

            watch_config config{};
            command_spec command{};

            loop_fixture() {
                fs::create_directories(root);
                fs::create_directories(pid_dir);
                make_executable_file(script, make_pid_file_script(pid_dir, log_file));
                config.roots = {root};
                config.debounce = 100ms;
                config.stop_grace = 1s;
                command.args = {script.string()};
            }

            size_t spawned() const { return read_lines(log_file).size(); }
        };

        // runs the loop on a worker thread; cancels and joins on destruction
        struct loop_runner {
            rebuild_loop& loop;
            std::thread worker;

            loop_runner(rebuild_loop& l, const watch_config& config, const command_spec& command)
                    : loop{l}, worker{[&l, config, command] { l.run(config, command); }} {}

            void stop() {
                if (worker.joinable()) {
                    loop.cancel();
                    worker.join();
                }
            }

            ~loop_runner() { stop(); }
        };

    }  // namespace detail

    TEST_CASE("007: cancellation stops the child before run returns", "[007][rebuild]") {
        detail::loop_fixture fx{};
        rebuild_loop loop{};
        detail::loop_runner runner{loop, fx.config, fx.command};

        REQUIRE(detail::wait_until([&] { return fx.spawned() == 1U; }));
        CHECK(detail::count_pid_files(fx.pid_dir) == 1U);
        auto pid = utils::parse_integer<pid_t>(detail::read_lines(fx.log_file).at(0));
        REQUIRE(pid.has_value());
        CHECK(detail::process_alive(*pid));

        runner.stop();

        // the child's TERM trap removed its pid file before the loop returned
        CHECK(detail::count_pid_files(fx.pid_dir) == 0U);
        CHECK_FALSE(detail::process_alive(*pid));
        CHECK(loop.restart_count() == 0U);
    }

    TEST_CASE("007: a change restarts the command once", "[007][rebuild]") {
        detail::loop_fixture fx{};
        rebuild_loop loop{};
        detail::loop_runner runner{loop, fx.config, fx.command};

        REQUIRE(detail::wait_until([&] { return fx.spawned() == 1U; }));

        detail::write_text_file(fx.root / "lib.rs", "pub fn f() {}\n");
        REQUIRE(detail::wait_until([&] { return loop.restart_count() == 1U; }));
        REQUIRE(detail::wait_until([&] { return fx.spawned() == 2U; }));

        auto pids = detail::read_lines(fx.log_file);
        auto first = utils::parse_integer<pid_t>(pids[0]);
        auto second = utils::parse_integer<pid_t>(pids[1]);
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK_FALSE(detail::process_alive(*first));
        CHECK(detail::process_alive(*second));

        runner.stop();
        CHECK_FALSE(detail::process_alive(*second));
    }

    TEST_CASE("007: a burst of changes collapses into one restart", "[007][rebuild][debounce]") {
        detail::loop_fixture fx{};
        rebuild_loop loop{};
        detail::loop_runner runner{loop, fx.config, fx.command};

        REQUIRE(detail::wait_until([&] { return fx.spawned() == 1U; }));

        for (int i = 0; i < 5; ++i) {
            detail::write_text_file(fx.root / "file{}.rs"_format(i), "// edit\n");
            std::this_thread::sleep_for(10ms);
        }

        REQUIRE(detail::wait_until([&] { return loop.restart_count() >= 1U; }));
        std::this_thread::sleep_for(400ms);
        CHECK(loop.restart_count() == 1U);
        CHECK(fx.spawned() == 2U);
    }

    TEST_CASE("007: changes during a slow restart cause exactly one follow-up", "[007][rebuild][debounce]") {
        detail::loop_fixture fx{};
        // ignores SIGTERM, so every stop() waits out the full grace period
        detail::make_executable_file(
                fx.script,
                "#!/bin/sh\ntrap '' TERM\necho $$ >> \"{}\"\nwhile true; do sleep 0.05; done\n"_format(
                        fx.log_file.string()));
        fx.config.stop_grace = 600ms;
        rebuild_loop loop{};
        detail::loop_runner runner{loop, fx.config, fx.command};

        REQUIRE(detail::wait_until([&] { return fx.spawned() == 1U; }));

        detail::write_text_file(fx.root / "a.rs", "// trigger\n");
        // the debounce fires after 100ms; the restart then blocks in stop() for 600ms
        std::this_thread::sleep_for(250ms);
        CHECK(loop.restart_count() == 0U);
        for (int i = 0; i < 3; ++i) {
            detail::write_text_file(fx.root / "during{}.rs"_format(i), "// edit\n");
            std::this_thread::sleep_for(50ms);
        }

        REQUIRE(detail::wait_until([&] { return loop.restart_count() == 2U; }));
        std::this_thread::sleep_for(1s);
        CHECK(loop.restart_count() == 2U);
        CHECK(fx.spawned() == 3U);
    }

    TEST_CASE("007: ignored paths do not trigger restarts", "[007][rebuild][ignore]") {
        detail::loop_fixture fx{};
        fx.config.ignore = {"*.log"};
        rebuild_loop loop{};
        detail::loop_runner runner{loop, fx.config, fx.command};

        REQUIRE(detail::wait_until([&] { return fx.spawned() == 1U; }));
        detail::write_text_file(fx.root / "build.log", "noise\n");
        detail::write_text_file(fx.root / ".swap", "noise\n");
        std::this_thread::sleep_for(400ms);
        CHECK(loop.restart_count() == 0U);
    }

    TEST_CASE("007: without an initial run the first change starts the command", "[007][rebuild]") {
        detail::loop_fixture fx{};
        fx.config.run_on_start = false;
        rebuild_loop loop{};
        detail::loop_runner runner{loop, fx.config, fx.command};

        std::this_thread::sleep_for(200ms);
        CHECK(fx.spawned() == 0U);

        detail::write_text_file(fx.root / "main.rs", "fn main() {}\n");
        REQUIRE(detail::wait_until([&] { return loop.restart_count() == 1U; }));
        CHECK(detail::wait_until([&] { return fx.spawned() == 1U; }));
    }

    TEST_CASE("007: restart failures are logged and the loop keeps going", "[007][rebuild]") {
        detail::log_capture capture{log::log_level::error};
        detail::loop_fixture fx{};
        rebuild_loop loop{};
        detail::loop_runner runner{loop, fx.config, fx.command};

        REQUIRE(detail::wait_until([&] { return fx.spawned() == 1U; }));

        std::filesystem::remove(fx.script);
        detail::write_text_file(fx.root / "a.rs", "// 1\n");
        REQUIRE(detail::wait_until([&] { return capture.contains("restart failed"); }));
        CHECK(loop.restart_count() == 0U);

        detail::make_executable_file(fx.script, detail::make_pid_file_script(fx.pid_dir, fx.log_file));
        detail::write_text_file(fx.root / "b.rs", "// 2\n");
        REQUIRE(detail::wait_until([&] { return loop.restart_count() == 1U; }));
        CHECK(detail::wait_until([&] { return fx.spawned() == 2U; }));
    }

    TEST_CASE("007: cancel before run returns without spawning", "[007][rebuild]") {
        detail::loop_fixture fx{};
        rebuild_loop loop{};
        loop.cancel();

        auto start = std::chrono::steady_clock::now();
        loop.run(fx.config, fx.command);
        CHECK(std::chrono::steady_clock::now() - start < 1s);
        CHECK(fx.spawned() == 0U);
    }

    TEST_CASE("007: invalid watch configuration is rejected", "[007][rebuild]") {
        detail::loop_fixture fx{};
        rebuild_loop loop{};

        auto no_roots = fx.config;
        no_roots.roots.clear();
        CHECK_THROWS_AS(loop.run(no_roots, fx.command), task_error);

        auto missing_root = fx.config;
        missing_root.roots = {fx.temp.path / "missing"};
        try {
            loop.run(missing_root, fx.command);
            FAIL("missing root accepted");
        } catch (const task_error& e) {
            CHECK(e.kind() == error_kind::watch_init);
        }
        CHECK(fx.spawned() == 0U);
    }

}  // namespace wasmtask::test
