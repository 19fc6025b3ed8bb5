#pragma once

#include "log.hpp"
#include "utils.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wasmtask {

    using namespace std::string_view_literals;

    enum class change_kind : uint8_t { created, modified, removed };

    inline constexpr std::string_view to_string(change_kind kind) {
        switch (kind) {
            case change_kind::created:
                return "created"sv;
            case change_kind::modified:
                return "modified"sv;
            case change_kind::removed:
                return "removed"sv;
        }
        return "modified"sv;
    }

    struct change_event {
        std::chrono::steady_clock::time_point timestamp{};
        std::filesystem::path path{};
        change_kind kind{change_kind::modified};
    };

    /*
     * Paths the watcher drops. A pattern containing `*`, `?` or `[` is an fnmatch glob tested
     * against the full path and against the file name; anything else is a path prefix, matched
     * component-wise. Relative prefixes are taken relative to every watched root.
     */
    class ignore_set {
      public:
        ignore_set() = default;
        ignore_set(std::vector<std::filesystem::path> roots, bool ignore_hidden);

        void add(std::string_view pattern);

        bool matches(const std::filesystem::path& path) const;

        bool ignore_hidden() const { return ignore_hidden_; }

      private:
        bool is_hidden(const std::filesystem::path& path) const;

        std::vector<std::filesystem::path> roots_{};
        std::vector<std::filesystem::path> prefixes_{};
        std::vector<std::string> globs_{};
        bool ignore_hidden_{false};
    };

    // inotify watches over every non-ignored directory below `roots`
    class change_watcher {
      public:
        // roots that cannot be watched are logged and skipped; throws task_error(watch_init)
        // when no root at all can be watched
        change_watcher(std::vector<std::filesystem::path> roots, ignore_set ignore);
        ~change_watcher();

        change_watcher(const change_watcher&) = delete;
        change_watcher& operator=(const change_watcher&) = delete;

        // pollable descriptor, readable while events are pending
        int fd() const { return fd_; }

        // drains pending records without blocking; ignored paths are dropped
        std::vector<change_event> read_events();

        size_t watch_count() const { return watches_.size(); }

      private:
        bool add_tree(const std::filesystem::path& dir, log::log_level failure_level = log::log_level::error);
        bool add_watch(const std::filesystem::path& path, log::log_level failure_level);

        int fd_{-1};
        std::vector<std::filesystem::path> roots_{};
        ignore_set ignore_;
        std::unordered_map<int, std::filesystem::path> watches_{};
    };

    /*
     * Trailing-edge debounce: every notify() pushes the deadline to `t + interval`, and
     * fire_if_due() reports true once when the deadline passes without a newer event.
     */
    class debouncer {
      public:
        using clock = std::chrono::steady_clock;

        explicit debouncer(std::chrono::milliseconds interval) : interval_{interval} {}

        void notify(clock::time_point t) { deadline_ = t + interval_; }

        std::optional<clock::time_point> deadline() const { return deadline_; }

        bool pending() const { return deadline_.has_value(); }

        bool fire_if_due(clock::time_point now) {
            if (deadline_ && now >= *deadline_) {
                deadline_.reset();
                return true;
            }
            return false;
        }

        std::chrono::milliseconds interval() const { return interval_; }

      private:
        std::chrono::milliseconds interval_;
        std::optional<clock::time_point> deadline_{};
    };

}  // namespace wasmtask
