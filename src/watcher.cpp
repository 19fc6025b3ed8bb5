#include "wasmtask/watcher.hpp"

#include "wasmtask/errors.hpp"
#include "wasmtask/format.hpp"
#include "wasmtask/log.hpp"

extern "C" {
#include <fnmatch.h>
#include <string.h>
#include <sys/inotify.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>
#include <system_error>

using namespace wasmtask::literals;
namespace fs = std::filesystem;

namespace wasmtask {

    namespace detail {

        static constexpr uint32_t watch_mask = IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM |
                                               IN_MOVED_TO | IN_DELETE_SELF | IN_ONLYDIR;

        static bool is_glob(std::string_view pattern) {
            return pattern.find_first_of("*?[") != std::string_view::npos;
        }

        // absolute, normalized and without a trailing separator, so "." compares like any other root
        static fs::path canonical_form(const fs::path& path) {
            std::error_code ec{};
            auto absolute = fs::absolute(path, ec);
            auto normal = (ec ? path : absolute).lexically_normal();
            if (!normal.has_filename() && normal != normal.root_path()) {
                normal = normal.parent_path();
            }
            return normal;
        }

        static change_kind kind_of(uint32_t mask) {
            if ((mask & (IN_CREATE | IN_MOVED_TO)) != 0) {
                return change_kind::created;
            }
            if ((mask & (IN_DELETE | IN_MOVED_FROM | IN_DELETE_SELF)) != 0) {
                return change_kind::removed;
            }
            return change_kind::modified;
        }

    }  // namespace detail

    // ── ignore_set ──────────────────────────────────────────────────

    ignore_set::ignore_set(std::vector<fs::path> roots, bool ignore_hidden) : ignore_hidden_{ignore_hidden} {
        roots_.reserve(roots.size());
        for (auto& root : roots) {
            roots_.push_back(detail::canonical_form(root));
        }
    }

    void ignore_set::add(std::string_view pattern) {
        if (pattern.empty()) {
            return;
        }
        if (detail::is_glob(pattern)) {
            globs_.emplace_back(pattern);
            return;
        }

        fs::path prefix{pattern};
        if (prefix.is_absolute() || roots_.empty()) {
            prefixes_.push_back(detail::canonical_form(prefix));
            return;
        }
        for (const auto& root : roots_) {
            prefixes_.push_back(detail::canonical_form(root / prefix));
        }
    }

    bool ignore_set::is_hidden(const fs::path& path) const {
        for (const auto& root : roots_) {
            if (!utils::path_starts_with(path, root)) {
                continue;
            }
            for (const auto& component : path.lexically_relative(root)) {
                auto name = component.native();
                if (name.size() > 1U && name.front() == '.' && name != "..") {
                    return true;
                }
            }
        }
        return false;
    }

    bool ignore_set::matches(const fs::path& path) const {
        auto normal = detail::canonical_form(path);

        for (const auto& prefix : prefixes_) {
            if (utils::path_starts_with(normal, prefix)) {
                return true;
            }
        }

        if (!globs_.empty()) {
            auto full = normal.string();
            auto name = normal.filename().string();
            for (const auto& glob : globs_) {
                if (::fnmatch(glob.c_str(), full.c_str(), 0) == 0 || ::fnmatch(glob.c_str(), name.c_str(), 0) == 0) {
                    return true;
                }
            }
        }

        return ignore_hidden_ && is_hidden(normal);
    }

    // ── change_watcher ──────────────────────────────────────────────

    change_watcher::change_watcher(std::vector<fs::path> roots, ignore_set ignore) : ignore_{std::move(ignore)} {
        if (roots.empty()) {
            throw task_error{error_kind::watch_init, "no paths to watch"};
        }

        fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (fd_ < 0) {
            throw task_error{error_kind::watch_init, "inotify_init1 failed: {}"_format(std::strerror(errno))};
        }

        for (const auto& root : roots) {
            auto path = detail::canonical_form(root);
            std::error_code ec{};
            if (!fs::exists(path, ec)) {
                log::error("cannot watch {}: no such path"_format(path.string()));
                continue;
            }
            if (log::enabled(log::log_level::trace)) {
                log::trace("Watching {}"_format(path.string()));
            }
            if (add_tree(path)) {
                roots_.push_back(std::move(path));
            }
        }

        if (roots_.empty()) {
            ::close(fd_);
            throw task_error{error_kind::watch_init, "none of the configured paths can be watched"};
        }
    }

    change_watcher::~change_watcher() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    bool change_watcher::add_watch(const fs::path& path, log::log_level failure_level) {
        auto mask = detail::watch_mask;
        std::error_code ec{};
        if (!fs::is_directory(path, ec)) {
            // a single watched file
            mask &= ~static_cast<uint32_t>(IN_ONLYDIR);
        }

        int wd = ::inotify_add_watch(fd_, path.c_str(), mask);
        if (wd < 0) {
            log::write(failure_level, "cannot watch {}: {}"_format(path.string(), std::strerror(errno)));
            return false;
        }
        watches_[wd] = path;
        return true;
    }

    bool change_watcher::add_tree(const fs::path& dir, log::log_level failure_level) {
        if (!add_watch(dir, failure_level)) {
            return false;
        }

        std::error_code ec{};
        if (!fs::is_directory(dir, ec)) {
            return true;
        }

        auto it = fs::recursive_directory_iterator{dir, fs::directory_options::skip_permission_denied, ec};
        for (; !ec && it != fs::recursive_directory_iterator{}; it.increment(ec)) {
            if (!it->is_directory(ec) || it->is_symlink(ec)) {
                continue;
            }
            if (ignore_.matches(it->path())) {
                it.disable_recursion_pending();
                continue;
            }
            add_watch(it->path(), log::log_level::warn);
        }
        if (ec) {
            log::warn("cannot list {}: {}"_format(dir.string(), ec.message()));
        }
        return true;
    }

    std::vector<change_event> change_watcher::read_events() {
        std::vector<change_event> events{};
        alignas(inotify_event) char buffer[16 * 1024];

        while (true) {
            auto n = ::read(fd_, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    log::warn("inotify read failed: {}"_format(std::strerror(errno)));
                }
                break;
            }
            if (n == 0) {
                break;
            }

            auto now = std::chrono::steady_clock::now();
            for (ssize_t off = 0; off < n;) {
                inotify_event record{};
                std::memcpy(&record, buffer + off, sizeof(inotify_event));
                const char* name = buffer + off + sizeof(inotify_event);
                off += static_cast<ssize_t>(sizeof(inotify_event) + record.len);

                if ((record.mask & IN_Q_OVERFLOW) != 0) {
                    log::warn("inotify queue overflowed, events were lost");
                    events.push_back(change_event{.timestamp = now, .path = roots_.front(), .kind = change_kind::modified});
                    continue;
                }

                auto found = watches_.find(record.wd);
                if (found == watches_.end()) {
                    continue;
                }
                if ((record.mask & IN_IGNORED) != 0) {
                    watches_.erase(found);
                    continue;
                }

                auto path = found->second;
                if (record.len > 0U) {
                    // NUL-padded to record.len
                    path /= std::string_view{name, ::strnlen(name, record.len)};
                }

                if (ignore_.matches(path)) {
                    continue;
                }

                auto kind = detail::kind_of(record.mask);
                if ((record.mask & IN_ISDIR) != 0 && kind == change_kind::created) {
                    add_tree(path, log::log_level::warn);
                }

                if (log::enabled(log::log_level::trace)) {
                    log::trace("Detected {} at {}"_format(kind, path.string()));
                }
                events.push_back(change_event{.timestamp = now, .path = std::move(path), .kind = kind});
            }
        }

        return events;
    }

}  // namespace wasmtask
