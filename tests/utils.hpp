#pragma once

#include "wasmtask/config.hpp"
#include "wasmtask/errors.hpp"
#include "wasmtask/format.hpp"
#include "wasmtask/log.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace wasmtask::test::detail {
    namespace fs = std::filesystem;
    using namespace wasmtask::literals;
    using namespace std::chrono_literals;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            static std::atomic<int> counter{0};
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << "wasmtask_" << prefix << "_" << static_cast<long>(::getpid()) << "_" << now << "_"
                     << counter.fetch_add(1);
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline std::vector<std::string> read_lines(const fs::path& path) {
        std::vector<std::string> lines{};
        std::ifstream in{path};
        std::string line{};
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    inline void make_executable_file(const fs::path& path, std::string_view content) {
        write_text_file(path, content);
        fs::permissions(
                path,
                fs::perms::owner_read | fs::perms::owner_write | fs::perms::owner_exec | fs::perms::group_read |
                        fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                fs::perm_options::replace);
    }

    inline bool wait_until(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return predicate();
    }

    // zombies count as dead; init may be slow to reap orphans
    inline bool process_alive(pid_t pid) {
        std::ifstream stat{"/proc/{}/stat"_format(pid)};
        std::string line{};
        if (!std::getline(stat, line)) {
            return false;
        }
        auto close_paren = line.rfind(')');
        if (close_paren == std::string::npos || close_paren + 2U >= line.size()) {
            return false;
        }
        auto state = line[close_paren + 2U];
        return state != 'Z' && state != 'X';
    }

    inline std::optional<pid_t> read_pid_file(const fs::path& path) {
        std::ifstream in{path};
        long pid = 0;
        if (!(in >> pid) || pid <= 0) {
            return std::nullopt;
        }
        return static_cast<pid_t>(pid);
    }

    /*
     * Long-running child double: creates `<pid_dir>/<pid>.pid`, appends its pid to `log_file`
     * and removes the pid file when terminated.
     */
    inline std::string make_pid_file_script(const fs::path& pid_dir, const fs::path& log_file) {
        std::ostringstream script{};
        script << "#!/bin/sh\n";
        script << "pid_file=\"" << pid_dir.string() << "/$$.pid\"\n";
        script << "trap 'rm -f \"$pid_file\"; exit 0' TERM INT\n";
        script << "echo $$ > \"$pid_file\"\n";
        script << "echo $$ >> \"" << log_file.string() << "\"\n";
        script << "while true; do sleep 0.05; done\n";
        return script.str();
    }

    inline size_t count_pid_files(const fs::path& pid_dir) {
        size_t count = 0;
        std::error_code ec{};
        for (const auto& entry : fs::directory_iterator{pid_dir, ec}) {
            if (entry.path().extension() == ".pid") {
                ++count;
            }
        }
        return count;
    }

    // routes wasmtask::log into a vector for the lifetime of the object
    struct log_capture {
        std::mutex mutex{};
        std::vector<std::pair<log::log_level, std::string>> lines{};
        log::log_level previous_level{log::level()};

        explicit log_capture(log::log_level level = log::log_level::trace) {
            log::set_level(level);
            log::set_sink([this](log::log_level lvl, std::string_view message) {
                std::lock_guard lock{mutex};
                lines.emplace_back(lvl, std::string{message});
            });
        }

        ~log_capture() {
            log::set_sink({});
            log::set_level(previous_level);
        }

        bool contains(std::string_view needle) {
            std::lock_guard lock{mutex};
            return std::ranges::any_of(lines, [needle](const auto& line) { return line.second.find(needle) != std::string::npos; });
        }

        log_capture(const log_capture&) = delete;
        log_capture& operator=(const log_capture&) = delete;
    };

}  // namespace wasmtask::test::detail
