#pragma once

#include "config.hpp"

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wasmtask {

    // ── One-shot subprocess ─────────────────────────────────────────

    struct subprocess_result {
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};
        bool timed_out{false};

        bool success() const { return !timed_out && exit_code == 0; }

        // stderr followed by stdout, for error reports
        std::string diagnostics() const;
    };

    /*
     * Runs `command` to completion with stdout and stderr captured.
     * A child killed by a signal reports 128 + signo; a child still running after
     * `timeout` is killed and reported with `timed_out` set.
     * Throws task_error(spawn) when the program cannot be executed at all.
     */
    subprocess_result run_process(
            const command_spec& command, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // ── Supervised child ────────────────────────────────────────────

    enum class process_state : uint8_t { not_started, running, exited, killed };

    inline constexpr std::string_view to_string(process_state state) {
        switch (state) {
            case process_state::not_started:
                return "not_started"sv;
            case process_state::running:
                return "running"sv;
            case process_state::exited:
                return "exited"sv;
            case process_state::killed:
                return "killed"sv;
        }
        return "not_started"sv;
    }

    /*
     * Owns at most one child process. The child runs in its own process group so that
     * stop() also reaches whatever it spawned (cargo, rustc, shells).
     */
    class process_supervisor {
      public:
        explicit process_supervisor(std::chrono::milliseconds stop_grace = default_stop_grace);
        ~process_supervisor();

        process_supervisor(const process_supervisor&) = delete;
        process_supervisor& operator=(const process_supervisor&) = delete;

        // throws task_error(already_running) while a child is live, task_error(spawn)
        // when the program cannot be executed; state is left unchanged on failure
        void start(const command_spec& command);

        // SIGTERM, then SIGKILL after the grace period; blocks until the child is reaped
        void stop();

        void restart(const command_spec& command);

        // reaps the child without blocking; returns true if it was found to have exited
        bool poll();

        process_state state() const { return state_; }
        bool running() const { return state_ == process_state::running; }
        std::optional<int> exit_code() const { return exit_code_; }
        std::optional<pid_t> pid() const;
        uint64_t spawn_count() const { return spawn_count_; }

      private:
        void record_exit(int status);

        std::chrono::milliseconds stop_grace_;
        pid_t pid_{-1};
        process_state state_{process_state::not_started};
        std::optional<int> exit_code_{};
        uint64_t spawn_count_{0U};
    };

}  // namespace wasmtask
