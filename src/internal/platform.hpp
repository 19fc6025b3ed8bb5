#pragma once

#include <string_view>

namespace wasmtask::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = WASMTASK_PLATFORM_LINUX != 0;
    inline constexpr bool is_macos = WASMTASK_PLATFORM_MACOS != 0;
    inline constexpr bool is_x86_64 = WASMTASK_ARCH_X86_64 != 0;
    inline constexpr bool is_arm64 = WASMTASK_ARCH_ARM64 != 0;

    // names used by binaryen release archives
    inline constexpr std::string_view host_arch() {
        if constexpr (is_x86_64) {
            return "x86_64"sv;
        }
        else if constexpr (is_arm64) {
            return "arm64"sv;
        }
        return {};
    }

    inline constexpr std::string_view host_os() {
        if constexpr (is_linux) {
            return "linux"sv;
        }
        else if constexpr (is_macos) {
            return "macos"sv;
        }
        return {};
    }

    namespace tool {
        inline constexpr auto cargo = "cargo"sv;
        inline constexpr auto tar = "tar"sv;
        inline constexpr auto wasm_opt = "wasm-opt"sv;
    }  // namespace tool

}  // namespace wasmtask::internal::platform
