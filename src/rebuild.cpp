#include "wasmtask/rebuild.hpp"

#include "wasmtask/errors.hpp"
#include "wasmtask/format.hpp"
#include "wasmtask/log.hpp"
#include "wasmtask/process.hpp"
#include "wasmtask/watcher.hpp"

extern "C" {
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>
}

#include <algorithm>
#include <cerrno>
#include <cstring>

using namespace wasmtask::literals;

namespace wasmtask {

    namespace detail {

        using clock = std::chrono::steady_clock;

        static int poll_timeout(const debouncer& debounce, clock::time_point now) {
            auto timeout = rebuild_loop::reap_interval;
            if (auto deadline = debounce.deadline()) {
                auto remaining = std::chrono::ceil<std::chrono::milliseconds>(*deadline - now);
                timeout = std::clamp(remaining, std::chrono::milliseconds{0}, timeout);
            }
            return static_cast<int>(timeout.count());
        }

        static void drain_eventfd(int fd) {
            uint64_t value{};
            while (::read(fd, &value, sizeof(value)) < 0 && errno == EINTR) {
            }
        }

    }  // namespace detail

    rebuild_loop::rebuild_loop() : cancel_fd_{::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)} {
        if (cancel_fd_ < 0) {
            throw task_error{error_kind::watch_init, "eventfd failed: {}"_format(std::strerror(errno))};
        }
    }

    rebuild_loop::~rebuild_loop() {
        ::close(cancel_fd_);
    }

    void rebuild_loop::cancel() {
        cancelled_.store(true, std::memory_order_release);
        uint64_t one = 1U;
        while (::write(cancel_fd_, &one, sizeof(one)) < 0 && errno == EINTR) {
        }
    }

    void rebuild_loop::run(const watch_config& config, const command_spec& command) {
        config.validate();
        if (command.args.empty()) {
            throw task_error{error_kind::invalid_config, "watch command must not be empty"};
        }

        ignore_set ignore{config.roots, config.ignore_hidden};
        for (const auto& pattern : config.ignore) {
            ignore.add(pattern);
        }
        change_watcher watcher{config.roots, std::move(ignore)};
        debouncer debounce{config.debounce};
        process_supervisor supervisor{config.stop_grace};

        if (config.run_on_start && !cancelled_.load(std::memory_order_acquire)) {
            try {
                supervisor.start(command);
            } catch (const task_error& e) {
                log::error("cannot start `{}`: {}"_format(command.display(), e.what()));
            }
        }

        pollfd fds[2]{};
        fds[0] = {.fd = watcher.fd(), .events = POLLIN, .revents = 0};
        fds[1] = {.fd = cancel_fd_, .events = POLLIN, .revents = 0};

        while (!cancelled_.load(std::memory_order_acquire)) {
            int ret = ::poll(fds, 2, detail::poll_timeout(debounce, detail::clock::now()));
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                supervisor.stop();
                throw task_error{error_kind::io, "poll failed: {}"_format(std::strerror(errno))};
            }

            if ((fds[1].revents & POLLIN) != 0) {
                break;
            }

            if ((fds[0].revents & POLLIN) != 0) {
                for (const auto& event : watcher.read_events()) {
                    debounce.notify(event.timestamp);
                }
            }

            if (supervisor.poll()) {
                if (auto code = supervisor.exit_code()) {
                    log::info("`{}` exited with {}"_format(command.display(), *code));
                }
            }

            if (debounce.fire_if_due(detail::clock::now())) {
                log::info("Re-running `{}`"_format(command.display()));
                try {
                    supervisor.restart(command);
                    restarts_.fetch_add(1U, std::memory_order_acq_rel);
                } catch (const task_error& e) {
                    log::error("restart failed: {}"_format(e.what()));
                }
            }
        }

        log::trace("Stopping watch's command process");
        supervisor.stop();

        detail::drain_eventfd(cancel_fd_);
        cancelled_.store(false, std::memory_order_release);
    }

}  // namespace wasmtask
