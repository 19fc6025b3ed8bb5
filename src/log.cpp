#include "wasmtask/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace wasmtask::log {

    namespace detail {

        static void stderr_sink(log_level lvl, std::string_view message) {
            std::cerr << '[' << to_string(lvl) << "] " << message << '\n';
        }

        struct state {
            std::atomic<log_level> min_level{log_level::info};
            std::mutex sink_mutex{};
            sink current{stderr_sink};
        };

        static state& global() {
            static state s{};
            return s;
        }

    }  // namespace detail

    bool try_parse_log_level(std::string_view text, log_level& out) {
        for (auto candidate :
             {log_level::trace, log_level::debug, log_level::info, log_level::warn, log_level::error, log_level::off}) {
            if (utils::str_case_eq(text, to_string(candidate))) {
                out = candidate;
                return true;
            }
        }
        if (utils::str_case_eq(text, "warning"sv)) {
            out = log_level::warn;
            return true;
        }
        return false;
    }

    void set_level(log_level lvl) {
        detail::global().min_level.store(lvl, std::memory_order_relaxed);
    }

    log_level level() {
        return detail::global().min_level.load(std::memory_order_relaxed);
    }

    void set_sink(sink s) {
        auto& g = detail::global();
        std::lock_guard lock{g.sink_mutex};
        g.current = s ? std::move(s) : sink{detail::stderr_sink};
    }

    bool enabled(log_level lvl) {
        auto min = level();
        return min != log_level::off && lvl >= min;
    }

    void write(log_level lvl, std::string_view message) {
        if (!enabled(lvl)) {
            return;
        }
        auto& g = detail::global();
        std::lock_guard lock{g.sink_mutex};
        g.current(lvl, message);
    }

}  // namespace wasmtask::log
