/*
 * rangefetch/src/downloader/downloader_config.cpp
 *
 * Downloader configuration resolution (defaults -> config.toml [downloader] -> env)
 * and validation. Command-line overrides are applied by the CLI on top of the result.
 *
 * Recognised keys under [downloader]:
 *   url, chunk_size, truncation_threshold, timeout_ms, connect_timeout_ms,
 *   max_attempts, retry_delay_ms, max_file_bytes
 */

#include <rangefetch/config/config_helpers.h>
#include <rangefetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <limits>
#include <string>
#include <system_error>
#include <utility>

namespace rangefetch::downloader {

namespace {

constexpr const char* kSection = "downloader";

Expected<std::uint64_t> parseUnsigned(const std::string& key, const std::string& raw) {
    std::uint64_t v{0};
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto res = std::from_chars(first, last, v);
    if (res.ec != std::errc() || res.ptr != last) {
        return Error{ErrorCode::InvalidArgument,
                     "config key '" + std::string(kSection) + "." + key +
                         "' is not an unsigned integer: '" + raw + "'"};
    }
    return v;
}

} // namespace

Expected<DownloaderConfig> resolveDownloaderConfig(const std::string& configPath) {
    DownloaderConfig cfg;

    const auto path = config::resolve_config_path(configPath);
    std::error_code ec;
    if (!path.empty() && std::filesystem::is_regular_file(path, ec)) {
        spdlog::debug("Loading downloader config from {}", path.string());

        if (auto url = config::parse_config_value(path, kSection, "url"); !url.empty()) {
            cfg.url = url;
        }

        using std::chrono::milliseconds;
        auto toMs = [](std::uint64_t v) { return milliseconds(static_cast<long long>(v)); };
        const std::pair<const char*, std::function<void(std::uint64_t)>> keys[] = {
            {"chunk_size", [&](std::uint64_t v) { cfg.chunkSizeBytes = v; }},
            {"truncation_threshold", [&](std::uint64_t v) { cfg.truncationThreshold = v; }},
            {"timeout_ms", [&](std::uint64_t v) { cfg.transport.timeout = toMs(v); }},
            {"connect_timeout_ms",
             [&](std::uint64_t v) { cfg.transport.connectTimeout = toMs(v); }},
            {"max_attempts",
             [&](std::uint64_t v) {
                 cfg.retry.maxAttempts = static_cast<int>(
                     std::min<std::uint64_t>(v, std::numeric_limits<int>::max()));
             }},
            {"retry_delay_ms", [&](std::uint64_t v) { cfg.retry.initialBackoff = toMs(v); }},
            {"max_file_bytes", [&](std::uint64_t v) { cfg.maxFileBytes = v; }},
        };
        for (const auto& [key, apply] : keys) {
            auto raw = config::parse_config_value(path, kSection, key);
            if (raw.empty())
                continue;
            auto pr = parseUnsigned(key, raw);
            if (!pr.ok())
                return pr.error();
            apply(pr.value());
        }
    } else {
        spdlog::debug("No downloader config at {}; using defaults", path.string());
    }

    if (const char* env = std::getenv("RANGEFETCH_URL"); env && *env) {
        cfg.url = env;
    }
    return cfg;
}

Expected<void> validateConfig(const DownloaderConfig& cfg) {
    if (cfg.url.empty()) {
        return Error{ErrorCode::InvalidArgument, "url must not be empty"};
    }
    if (cfg.chunkSizeBytes == 0) {
        return Error{ErrorCode::InvalidArgument, "chunk size must be greater than zero"};
    }
    if (cfg.chunkSizeBytes > std::numeric_limits<std::uint32_t>::max()) {
        return Error{ErrorCode::InvalidArgument,
                     "chunk size " + std::to_string(cfg.chunkSizeBytes) +
                         " does not fit a 32-bit window length"};
    }
    if (cfg.truncationThreshold && cfg.chunkSizeBytes >= *cfg.truncationThreshold) {
        return Error{ErrorCode::InvalidArgument,
                     "chunk size " + std::to_string(cfg.chunkSizeBytes) +
                         " must be strictly below the truncation threshold " +
                         std::to_string(*cfg.truncationThreshold)};
    }
    if (cfg.transport.timeout.count() <= 0 || cfg.transport.connectTimeout.count() <= 0) {
        return Error{ErrorCode::InvalidArgument, "timeouts must be positive"};
    }
    if (cfg.retry.maxAttempts < 1) {
        return Error{ErrorCode::InvalidArgument, "max attempts must be at least 1"};
    }
    return {};
}

} // namespace rangefetch::downloader
