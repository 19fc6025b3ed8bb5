#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace wasmtask {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        toolchain,
        artifact_not_found,
        style_compile,
        io,
        optimization,
        network,
        unsupported_platform,
        verification,
        spawn,
        already_running,
        invalid_config,
        watch_init,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::toolchain:
                return "toolchain"sv;
            case error_kind::artifact_not_found:
                return "artifact_not_found"sv;
            case error_kind::style_compile:
                return "style_compile"sv;
            case error_kind::io:
                return "io"sv;
            case error_kind::optimization:
                return "optimization"sv;
            case error_kind::network:
                return "network"sv;
            case error_kind::unsupported_platform:
                return "unsupported_platform"sv;
            case error_kind::verification:
                return "verification"sv;
            case error_kind::spawn:
                return "spawn"sv;
            case error_kind::already_running:
                return "already_running"sv;
            case error_kind::invalid_config:
                return "invalid_config"sv;
            case error_kind::watch_init:
                return "watch_init"sv;
        }
        return "io"sv;
    }

    /*
     * Every failure the library raises. `diagnostics` carries captured tool output
     * (compiler stderr and the like) separately from the one-line message.
     */
    class task_error : public std::runtime_error {
      public:
        task_error(error_kind kind, const std::string& message, std::string diagnostics = {})
                : std::runtime_error{message}, kind_{kind}, diagnostics_{std::move(diagnostics)} {}

        error_kind kind() const noexcept { return kind_; }
        const std::string& diagnostics() const noexcept { return diagnostics_; }

      private:
        error_kind kind_;
        std::string diagnostics_;
    };

}  // namespace wasmtask
