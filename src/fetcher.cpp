#include "wasmtask/fetcher.hpp"

#include "wasmtask/errors.hpp"
#include "wasmtask/format.hpp"
#include "wasmtask/log.hpp"
#include "wasmtask/process.hpp"

#include "internal/platform.hpp"

#include <glaze/glaze.hpp>
#include <openssl/evp.h>

extern "C" {
#include <unistd.h>
}

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>

using namespace wasmtask::literals;
namespace fs = std::filesystem;

namespace wasmtask::detail {

    struct cache_entry_record {
        int schema_version{1};
        std::string name{};
        std::string version{};
        std::string platform{};
        std::string archive_sha256{};
        std::string binary{};
    };

}  // namespace wasmtask::detail

namespace glz {

    template <>
    struct meta<wasmtask::detail::cache_entry_record> {
        using T = wasmtask::detail::cache_entry_record;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "name",
                       &T::name,
                       "version",
                       &T::version,
                       "platform",
                       &T::platform,
                       "archive_sha256",
                       &T::archive_sha256,
                       "binary",
                       &T::binary);
    };

}  // namespace glz

namespace wasmtask {

    namespace detail {

        static constexpr std::array known_arches{"x86_64"sv, "arm64"sv};
        static constexpr std::array known_oses{"linux"sv, "macos"sv};

        static constexpr auto entry_file_name = "entry.json"sv;
        static constexpr auto archive_file_name = "archive.tar.gz"sv;
        static constexpr auto checksum_file_name = "archive.tar.gz.sha256"sv;

        static bool is_executable(const fs::path& path) {
            std::error_code ec{};
            return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
        }

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                throw task_error{error_kind::io, "failed to open {}"_format(path.string())};
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        static void write_text_file(const fs::path& path, std::string_view text) {
            std::ofstream out{path, std::ios::binary | std::ios::trunc};
            if (!out) {
                throw task_error{error_kind::io, "failed to open {} for write"_format(path.string())};
            }
            out << text;
            if (!out) {
                throw task_error{error_kind::io, "failed to write {}"_format(path.string())};
            }
        }

        // removes the staging directory however install() leaves
        struct staging_dir {
            fs::path path{};

            explicit staging_dir(fs::path p) : path{std::move(p)} {
                std::error_code ec{};
                fs::create_directories(path, ec);
                if (ec) {
                    throw task_error{
                            error_kind::io, "failed to create {}: {}"_format(path.string(), ec.message())};
                }
            }

            ~staging_dir() {
                std::error_code ec{};
                fs::remove_all(path, ec);
            }

            staging_dir(const staging_dir&) = delete;
            staging_dir& operator=(const staging_dir&) = delete;
        };

        static fs::path make_staging_path(
                const fs::path& cache_root, std::string_view name, std::string_view version,
                std::string_view platform) {
            static std::atomic<uint64_t> counter{0U};
            auto nonce = counter.fetch_add(1U, std::memory_order_relaxed);
            return cache_root / ".staging-{}-{}-{}-{}-{}"_format(name, version, platform, ::getpid(), nonce);
        }

        // `<hex>  <file name>` as published next to each release archive
        static std::string parse_checksum(std::string_view text) {
            auto trimmed = utils::trim_view(text);
            auto end = trimmed.find_first_of(" \t");
            auto hex = std::string{trimmed.substr(0, end)};
            std::ranges::transform(hex, hex.begin(), utils::char_tolower);
            return hex;
        }

        static void fetch(
                http_client& http, std::string_view url, const fs::path& destination, error_kind missing_kind) {
            log::trace("GET {}"_format(url));
            auto status = http.get(url, destination);
            if (status == 404) {
                throw task_error{missing_kind, "nothing published at {}"_format(url)};
            }
            if (status < 200 || status >= 300) {
                throw task_error{error_kind::network, "GET {} answered HTTP {}"_format(url, status)};
            }
        }

    }  // namespace detail

    std::optional<std::string> binaryen_platform(std::string_view arch, std::string_view os) {
        if (std::ranges::find(detail::known_arches, arch) == detail::known_arches.end()) {
            return std::nullopt;
        }
        if (std::ranges::find(detail::known_oses, os) == detail::known_oses.end()) {
            return std::nullopt;
        }
        return "{}-{}"_format(arch, os);
    }

    std::string host_platform() {
        auto platform = binaryen_platform(internal::platform::host_arch(), internal::platform::host_os());
        if (!platform) {
            throw task_error{error_kind::unsupported_platform, "binaryen provides no release for this host"};
        }
        return *platform;
    }

    release_source binaryen_release(std::string_view version, std::string_view platform) {
        auto archive = "https://github.com/WebAssembly/binaryen/releases/download/version_{0}/"
                       "binaryen-version_{0}-{1}.tar.gz"_format(version, platform);
        return release_source{.archive_url = archive, .checksum_url = archive + ".sha256"};
    }

    std::string sha256_file_hex(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw task_error{error_kind::io, "failed to open {}"_format(path.string())};
        }

        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
        if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw task_error{error_kind::verification, "failed to initialise SHA-256"};
        }

        std::array<char, 64 * 1024> buffer{};
        while (in) {
            in.read(buffer.data(), buffer.size());
            auto count = in.gcount();
            if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1) {
                throw task_error{error_kind::verification, "SHA-256 update failed"};
            }
        }
        if (in.bad()) {
            throw task_error{error_kind::io, "failed to read {}"_format(path.string())};
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
            throw task_error{error_kind::verification, "SHA-256 finalisation failed"};
        }

        std::string hex{};
        hex.reserve(length * 2U);
        for (unsigned int i = 0; i < length; ++i) {
            hex += "{:02x}"_format(digest[i]);
        }
        return hex;
    }

    curl_http_client::curl_http_client(command_spec curl, std::chrono::milliseconds timeout)
            : curl_{std::move(curl)}, timeout_{timeout} {}

    int curl_http_client::get(std::string_view url, const fs::path& destination) {
        auto command = curl_;
        command.args.insert(
                command.args.end(),
                {"--silent",
                 "--show-error",
                 "--location",
                 "--connect-timeout",
                 "30",
                 "--output",
                 destination.string(),
                 "--write-out",
                 "%{http_code}",
                 std::string{url}});

        subprocess_result result{};
        try {
            result = run_process(command, timeout_);
        } catch (const task_error& e) {
            throw task_error{error_kind::network, "cannot run {}: {}"_format(curl_.display(), e.what())};
        }

        auto code = utils::parse_integer<int>(utils::trim_view(result.stdout_output));
        if (!result.success() || !code || *code == 0) {
            throw task_error{error_kind::network, "could not download {}"_format(url), result.diagnostics()};
        }
        return *code;
    }

    artifact_fetcher::artifact_fetcher(fs::path cache_root, std::shared_ptr<http_client> http)
            : cache_root_{std::move(cache_root)}, http_{std::move(http)} {
        if (!http_) {
            http_ = std::make_shared<curl_http_client>();
        }
    }

    fs::path artifact_fetcher::entry_dir(std::string_view name, std::string_view version, std::string_view platform)
            const {
        return cache_root_ / name / version / platform;
    }

    std::optional<cached_binary> artifact_fetcher::lookup(
            std::string_view name, std::string_view version, std::string_view platform) const {
        auto binary = entry_dir(name, version, platform) / "bin" / name;
        if (!detail::is_executable(binary)) {
            return std::nullopt;
        }
        return cached_binary{
                .name = std::string{name},
                .version = std::string{version},
                .platform = std::string{platform},
                .path = binary,
                .executable = true};
    }

    cached_binary artifact_fetcher::resolve(std::string_view name, std::string_view version, std::string_view platform) {
        if (auto hit = lookup(name, version, platform)) {
            log::debug("using cached {} {} at {}"_format(name, version, hit->path.string()));
            return *hit;
        }

        auto dash = platform.find('-');
        if (dash == std::string_view::npos ||
            !binaryen_platform(platform.substr(0, dash), platform.substr(dash + 1U))) {
            throw task_error{error_kind::unsupported_platform, "unsupported platform `{}`"_format(platform)};
        }

        log::info("downloading {} {} for {}"_format(name, version, platform));
        return install(name, version, platform);
    }

    cached_binary artifact_fetcher::install(std::string_view name, std::string_view version, std::string_view platform) {
        auto source = binaryen_release(version, platform);
        detail::staging_dir staging{detail::make_staging_path(cache_root_, name, version, platform)};

        auto archive = staging.path / detail::archive_file_name;
        auto checksum = staging.path / detail::checksum_file_name;
        detail::fetch(*http_, source.archive_url, archive, error_kind::unsupported_platform);
        detail::fetch(*http_, source.checksum_url, checksum, error_kind::verification);

        auto expected = detail::parse_checksum(detail::read_text_file(checksum));
        auto actual = sha256_file_hex(archive);
        if (expected.empty() || expected != actual) {
            throw task_error{
                    error_kind::verification,
                    "checksum mismatch for {}: expected {}, got {}"_format(source.archive_url, expected, actual)};
        }

        auto unpacked = staging.path / "entry";
        std::error_code ec{};
        fs::create_directories(unpacked, ec);
        if (ec) {
            throw task_error{error_kind::io, "failed to create {}: {}"_format(unpacked.string(), ec.message())};
        }

        auto untar = run_process(command_spec{
                .args = {std::string{internal::platform::tool::tar},
                         "-xzf",
                         archive.string(),
                         "-C",
                         unpacked.string(),
                         "--strip-components=1"}});
        if (!untar.success()) {
            throw task_error{
                    error_kind::verification,
                    "cannot unpack {}"_format(source.archive_url),
                    untar.diagnostics()};
        }

        auto binary = unpacked / "bin" / name;
        if (!fs::is_regular_file(binary, ec)) {
            throw task_error{error_kind::verification, "{} is missing from {}"_format(name, source.archive_url)};
        }
        fs::permissions(
                binary,
                fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                fs::perm_options::add,
                ec);
        if (ec || !detail::is_executable(binary)) {
            throw task_error{error_kind::verification, "cannot make {} executable"_format(binary.string())};
        }

        detail::cache_entry_record record{
                .name = std::string{name},
                .version = std::string{version},
                .platform = std::string{platform},
                .archive_sha256 = actual,
                .binary = "bin/{}"_format(name)};
        std::string json{};
        if (glz::write_json(record, json)) {
            throw task_error{error_kind::io, "failed to serialize cache entry for {}"_format(name)};
        }
        detail::write_text_file(unpacked / detail::entry_file_name, json);

        auto final_dir = entry_dir(name, version, platform);
        fs::create_directories(final_dir.parent_path(), ec);
        if (ec) {
            throw task_error{error_kind::io, "failed to create {}: {}"_format(final_dir.string(), ec.message())};
        }

        if (fs::exists(final_dir, ec) && !lookup(name, version, platform)) {
            // a damaged entry (binary gone or no longer executable) is swapped out whole
            log::warn("replacing invalid cache entry {}"_format(final_dir.string()));
            fs::rename(final_dir, staging.path / "stale", ec);
            if (ec && !lookup(name, version, platform)) {
                throw task_error{
                        error_kind::io,
                        "failed to move invalid entry {} aside: {}"_format(final_dir.string(), ec.message())};
            }
        }

        fs::rename(unpacked, final_dir, ec);
        if (ec) {
            // a concurrent resolve installed the same entry first
            if (auto winner = lookup(name, version, platform)) {
                return *winner;
            }
            throw task_error{
                    error_kind::io, "failed to install {} into {}: {}"_format(name, final_dir.string(), ec.message())};
        }

        log::info("installed {} {} into {}"_format(name, version, final_dir.string()));
        auto installed = lookup(name, version, platform);
        if (!installed) {
            throw task_error{error_kind::verification, "installed {} is not executable"_format(name)};
        }
        return *installed;
    }

}  // namespace wasmtask
