#include "wasmtask/process.hpp"

#include "wasmtask/errors.hpp"
#include "wasmtask/format.hpp"
#include "wasmtask/log.hpp"

#include "internal/fd.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>
#include <exception>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

extern char** environ;

using namespace wasmtask::literals;

namespace wasmtask {

    namespace detail {

        using clock = std::chrono::steady_clock;

        // argv/envp are built before fork; only async-signal-safe calls happen in the child
        struct exec_image {
            std::vector<std::string> args{};
            std::vector<std::string> env{};
            std::vector<char*> argv{};
            std::vector<char*> envp{};
        };

        static exec_image make_exec_image(const command_spec& command) {
            exec_image image{};
            image.args = command.args;

            for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
                std::string_view kv{*entry};
                auto eq = kv.find('=');
                auto key = kv.substr(0, eq);
                bool overridden = false;
                for (const auto& [name, value] : command.env) {
                    if (name == key) {
                        overridden = true;
                        break;
                    }
                }
                if (!overridden) {
                    image.env.emplace_back(kv);
                }
            }
            for (const auto& [name, value] : command.env) {
                image.env.push_back("{}={}"_format(name, value));
            }

            image.argv.reserve(image.args.size() + 1U);
            for (auto& arg : image.args) {
                image.argv.push_back(arg.data());
            }
            image.argv.push_back(nullptr);

            image.envp.reserve(image.env.size() + 1U);
            for (auto& kv : image.env) {
                image.envp.push_back(kv.data());
            }
            image.envp.push_back(nullptr);
            return image;
        }

        struct spawn_options {
            int stdout_fd{-1};
            int stderr_fd{-1};
            bool own_process_group{false};
        };

        [[noreturn]] static void child_fail(int report_fd) {
            int err = errno;
            while (::write(report_fd, &err, sizeof(err)) < 0 && errno == EINTR) {
            }
            _exit(127);
        }

        /*
         * fork + execvpe. Exec failures travel back through a close-on-exec pipe: EOF means
         * the exec succeeded, an errno value means it did not.
         */
        static pid_t spawn(const command_spec& command, const spawn_options& options) {
            if (command.args.empty()) {
                throw task_error{error_kind::spawn, "cannot spawn an empty command"};
            }

            auto image = make_exec_image(command);
            auto cwd = command.cwd ? command.cwd->string() : std::string{};

            internal::pipe_fds report{};
            if (!internal::make_pipe(report)) {
                throw task_error{error_kind::spawn, "pipe() failed: {}"_format(std::strerror(errno))};
            }

            auto pid = ::fork();
            if (pid < 0) {
                throw task_error{error_kind::spawn, "fork() failed: {}"_format(std::strerror(errno))};
            }

            if (pid == 0) {
                int report_fd = report.write.get();
                if (options.own_process_group && ::setpgid(0, 0) != 0) {
                    child_fail(report_fd);
                }
                ::signal(SIGPIPE, SIG_DFL);
                if (options.stdout_fd >= 0 && ::dup2(options.stdout_fd, STDOUT_FILENO) < 0) {
                    child_fail(report_fd);
                }
                if (options.stderr_fd >= 0 && ::dup2(options.stderr_fd, STDERR_FILENO) < 0) {
                    child_fail(report_fd);
                }
                if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
                    child_fail(report_fd);
                }
                ::execvpe(image.argv[0], image.argv.data(), image.envp.data());
                child_fail(report_fd);
            }

            report.write.reset();

            int child_errno = 0;
            ssize_t n = 0;
            do {
                n = ::read(report.read.get(), &child_errno, sizeof(child_errno));
            } while (n < 0 && errno == EINTR);

            if (n == static_cast<ssize_t>(sizeof(child_errno))) {
                int status = 0;
                while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
                }
                throw task_error{
                        error_kind::spawn,
                        "failed to execute `{}`: {}"_format(command.args.front(), std::strerror(child_errno))};
            }

            return pid;
        }

        static int decode_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

        static int wait_blocking(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    return -1;
                }
            }
            return status;
        }

    }  // namespace detail

    std::string subprocess_result::diagnostics() const {
        std::string text{stderr_output};
        if (!stdout_output.empty()) {
            if (!text.empty() && text.back() != '\n') {
                text.push_back('\n');
            }
            text += stdout_output;
        }
        if (timed_out) {
            if (!text.empty() && text.back() != '\n') {
                text.push_back('\n');
            }
            text += "subprocess timed out";
        }
        return text;
    }

    subprocess_result run_process(const command_spec& command, std::optional<std::chrono::milliseconds> timeout) {
        internal::pipe_fds out_pipe{};
        internal::pipe_fds err_pipe{};
        if (!internal::make_pipe(out_pipe) || !internal::make_pipe(err_pipe)) {
            throw task_error{error_kind::spawn, "pipe() failed: {}"_format(std::strerror(errno))};
        }

        log::trace("running {}"_format(command.display()));
        auto pid = detail::spawn(
                command, detail::spawn_options{.stdout_fd = out_pipe.write.get(), .stderr_fd = err_pipe.write.get()});

        out_pipe.write.reset();
        err_pipe.write.reset();

        subprocess_result result{};
        int fds_open = 2;
        pollfd fds[2]{};
        fds[0] = {.fd = out_pipe.read.get(), .events = POLLIN, .revents = 0};
        fds[1] = {.fd = err_pipe.read.get(), .events = POLLIN, .revents = 0};

        std::optional<detail::clock::time_point> deadline{};
        if (timeout) {
            deadline = detail::clock::now() + *timeout;
        }

        while (fds_open > 0) {
            int wait_ms = -1;
            if (deadline) {
                auto remaining =
                        std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - detail::clock::now()).count();
                if (remaining <= 0) {
                    result.timed_out = true;
                    break;
                }
                wait_ms = static_cast<int>(remaining);
            }

            int ret = ::poll(fds, 2, wait_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ret == 0) {
                result.timed_out = true;
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? result.stdout_output : result.stderr_output).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR) {
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        if (result.timed_out) {
            ::kill(pid, SIGKILL);
        }

        auto status = detail::wait_blocking(pid);
        result.exit_code = result.timed_out || status < 0 ? 1 : detail::decode_status(status);
        return result;
    }

    process_supervisor::process_supervisor(std::chrono::milliseconds stop_grace) : stop_grace_{stop_grace} {}

    process_supervisor::~process_supervisor() {
        try {
            stop();
        } catch (const std::exception&) {
            // only the logging in stop() can throw
            if (pid_ > 0) {
                ::kill(-pid_, SIGKILL);
                ::kill(pid_, SIGKILL);
                detail::wait_blocking(pid_);
                pid_ = -1;
            }
        }
    }

    std::optional<pid_t> process_supervisor::pid() const {
        if (state_ == process_state::running) {
            return pid_;
        }
        return std::nullopt;
    }

    void process_supervisor::record_exit(int status) {
        exit_code_ = detail::decode_status(status);
        state_ = process_state::exited;
        pid_ = -1;
    }

    void process_supervisor::start(const command_spec& command) {
        poll();
        if (state_ == process_state::running) {
            throw task_error{error_kind::already_running, "process {} is still running"_format(pid_)};
        }

        auto pid = detail::spawn(command, detail::spawn_options{.own_process_group = true});
        // the child may not have reached setpgid yet; doing it from both sides closes the race
        ::setpgid(pid, pid);

        pid_ = pid;
        state_ = process_state::running;
        exit_code_.reset();
        ++spawn_count_;
        log::debug("started `{}` as pid {}"_format(command.display(), pid));
    }

    bool process_supervisor::poll() {
        if (state_ != process_state::running) {
            return false;
        }
        int status = 0;
        pid_t rc = 0;
        do {
            rc = ::waitpid(pid_, &status, WNOHANG);
        } while (rc < 0 && errno == EINTR);

        if (rc == pid_) {
            auto pid = pid_;
            record_exit(status);
            ::kill(-pid, SIGKILL);
            if (log::enabled(log::log_level::debug)) {
                log::debug("pid {} exited with {}"_format(pid, *exit_code_));
            }
            return true;
        }
        if (rc < 0) {
            // ECHILD: somebody else reaped it
            state_ = process_state::exited;
            exit_code_.reset();
            pid_ = -1;
            return true;
        }
        return false;
    }

    void process_supervisor::stop() {
        if (poll() || state_ != process_state::running) {
            return;
        }

        auto pid = pid_;
        if (::kill(-pid, SIGTERM) != 0) {
            ::kill(pid, SIGTERM);
        }

        auto deadline = detail::clock::now() + stop_grace_;
        std::optional<int> status{};
        while (!status) {
            int raw = 0;
            auto rc = ::waitpid(pid, &raw, WNOHANG);
            if (rc == pid) {
                status = raw;
                break;
            }
            if (rc < 0 && errno != EINTR) {
                break;
            }
            if (detail::clock::now() >= deadline) {
                log::warn("pid {} ignored SIGTERM for {}ms, killing it"_format(pid, stop_grace_.count()));
                ::kill(-pid, SIGKILL);
                ::kill(pid, SIGKILL);
                auto raw_status = detail::wait_blocking(pid);
                if (raw_status >= 0) {
                    status = raw_status;
                }
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }

        // stragglers left in the group by the leader
        ::kill(-pid, SIGKILL);

        exit_code_ = status ? std::optional<int>{detail::decode_status(*status)} : std::nullopt;
        state_ = process_state::killed;
        pid_ = -1;
        if (log::enabled(log::log_level::debug)) {
            log::debug("stopped pid {}"_format(pid));
        }
    }

    void process_supervisor::restart(const command_spec& command) {
        stop();
        start(command);
    }

}  // namespace wasmtask
