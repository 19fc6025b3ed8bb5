#pragma once

#include "config.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace wasmtask {

    // binaryen names platforms `<arch>-<os>`, e.g. x86_64-linux or arm64-macos
    std::optional<std::string> binaryen_platform(std::string_view arch, std::string_view os);

    // throws task_error(unsupported_platform) when binaryen ships nothing for this host
    std::string host_platform();

    struct cached_binary {
        std::string name{};
        std::string version{};
        std::string platform{};
        std::filesystem::path path{};
        bool executable{false};
    };

    struct release_source {
        std::string archive_url{};
        std::string checksum_url{};
    };

    release_source binaryen_release(std::string_view version, std::string_view platform);

    // hex-encoded SHA-256 of a file; throws task_error(io)
    std::string sha256_file_hex(const std::filesystem::path& path);

    class http_client {
      public:
        virtual ~http_client() = default;

        /*
         * GET `url` into `destination`, following redirects. Returns the final HTTP status;
         * the body is written whatever the status. Throws task_error(network) when no
         * response could be obtained.
         */
        virtual int get(std::string_view url, const std::filesystem::path& destination) = 0;
    };

    // spawns the curl executable
    class curl_http_client final : public http_client {
      public:
        explicit curl_http_client(
                command_spec curl = command_spec{.args = {"curl"}},
                std::chrono::milliseconds timeout = std::chrono::minutes{5});

        int get(std::string_view url, const std::filesystem::path& destination) override;

      private:
        command_spec curl_;
        std::chrono::milliseconds timeout_;
    };

    /*
     * Versioned cache of binaryen tools under `cache_root`:
     *
     *   <cache_root>/<name>/<version>/<platform>/bin/<name>
     *   <cache_root>/<name>/<version>/<platform>/entry.json
     *
     * Entries are assembled in a private staging directory and renamed into place as a
     * whole, so an interrupted or concurrent download never exposes a partial entry.
     */
    class artifact_fetcher {
      public:
        explicit artifact_fetcher(std::filesystem::path cache_root, std::shared_ptr<http_client> http = nullptr);

        // cache hit without network access, otherwise download, verify and install
        cached_binary resolve(std::string_view name, std::string_view version, std::string_view platform);

        std::optional<cached_binary> lookup(
                std::string_view name, std::string_view version, std::string_view platform) const;

        std::filesystem::path entry_dir(
                std::string_view name, std::string_view version, std::string_view platform) const;

        const std::filesystem::path& cache_root() const { return cache_root_; }

      private:
        cached_binary install(std::string_view name, std::string_view version, std::string_view platform);

        std::filesystem::path cache_root_;
        std::shared_ptr<http_client> http_;
    };

}  // namespace wasmtask
