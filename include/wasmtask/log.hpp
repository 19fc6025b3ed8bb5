#pragma once

#include "format.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace wasmtask::log {

    using namespace std::string_view_literals;

    enum class log_level : uint8_t { trace, debug, info, warn, error, off };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::trace:
                return "trace"sv;
            case log_level::debug:
                return "debug"sv;
            case log_level::info:
                return "info"sv;
            case log_level::warn:
                return "warn"sv;
            case log_level::error:
                return "error"sv;
            case log_level::off:
                return "off"sv;
        }
        return "info"sv;
    }

    bool try_parse_log_level(std::string_view text, log_level& out);

    using sink = std::function<void(log_level, std::string_view)>;

    // process-wide; both are safe to call from any thread
    void set_level(log_level level);
    log_level level();

    // passing an empty sink restores the stderr sink
    void set_sink(sink s);

    bool enabled(log_level level);
    void write(log_level level, std::string_view message);

    inline void trace(std::string_view message) { write(log_level::trace, message); }
    inline void debug(std::string_view message) { write(log_level::debug, message); }
    inline void info(std::string_view message) { write(log_level::info, message); }
    inline void warn(std::string_view message) { write(log_level::warn, message); }
    inline void error(std::string_view message) { write(log_level::error, message); }

}  // namespace wasmtask::log
