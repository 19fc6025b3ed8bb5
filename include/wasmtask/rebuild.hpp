#pragma once

#include "config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace wasmtask {

    /*
     * Reruns a command whenever the watched tree changes.
     *
     * One thread polls the inotify descriptor and a cancellation eventfd, using the pending
     * debounce deadline as the poll timeout. Changes that arrive while a restart is in
     * progress stay queued in the inotify descriptor and feed the debouncer afterwards, so
     * they collapse into a single follow-up restart.
     */
    class rebuild_loop {
      public:
        rebuild_loop();
        ~rebuild_loop();

        rebuild_loop(const rebuild_loop&) = delete;
        rebuild_loop& operator=(const rebuild_loop&) = delete;

        // returns once cancel() is called, after the child has been stopped;
        // throws task_error(invalid_config | watch_init)
        void run(const watch_config& config, const command_spec& command);

        // safe from any thread, and before run()
        void cancel();

        uint64_t restart_count() const { return restarts_.load(std::memory_order_acquire); }

        // the child reaping cadence while no change is pending
        static constexpr auto reap_interval = std::chrono::milliseconds{100};

      private:
        int cancel_fd_{-1};
        std::atomic<bool> cancelled_{false};
        std::atomic<uint64_t> restarts_{0U};
    };

}  // namespace wasmtask
