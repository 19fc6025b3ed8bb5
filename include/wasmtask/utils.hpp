#pragma once

#include <algorithm>
#include <charconv>
#include <concepts>
#include <filesystem>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace wasmtask {

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        template <std::integral T>
        constexpr std::optional<T> parse_integer(std::string_view input, int base = 10) {
            T value{};
            auto result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }
            return value;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        // cargo turns '-' into '_' for artifact file names
        inline std::string crate_file_stem(std::string_view name) {
            std::string stem{name};
            std::ranges::replace(stem, '-', '_');
            return stem;
        }

        // component-wise prefix test; "a/bc" is not under "a/b"
        inline bool path_starts_with(const std::filesystem::path& path, const std::filesystem::path& prefix) {
            auto [p_end, _] = std::ranges::mismatch(prefix, path);
            return p_end == prefix.end();
        }

    }  // namespace utils

}  // namespace wasmtask
