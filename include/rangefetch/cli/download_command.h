#pragma once

#include <rangefetch/downloader/downloader.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace rangefetch::cli {

/**
 * Command-line options. Unset optionals fall back to the resolved configuration.
 */
struct DownloadOpts {
    std::uint64_t total_size{0};
    std::optional<std::string> expected_sha256;

    std::optional<std::string> url;
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::uint64_t> truncation_threshold;
    std::optional<int> timeout_ms;
    std::optional<int> connect_timeout_ms;
    std::optional<int> retries;
    std::optional<int> retry_delay_ms;
    std::vector<std::string> headers;
    std::string config_path;

    bool emit_json{false};
    bool quiet{false};
    bool verbose{false};
};

// Process exit status per error code; 0 for ErrorCode::None.
int exitCodeFor(downloader::ErrorCode code) noexcept;

// DigestMismatch error for a Mismatch outcome, nullopt otherwise.
std::optional<downloader::Error> outcomeError(const downloader::DownloadReport& report);

// Apply command-line overrides on top of a resolved configuration.
void applyOverrides(const DownloadOpts& opts, downloader::DownloaderConfig& cfg);

void registerDownloadOptions(CLI::App& app, const std::shared_ptr<DownloadOpts>& opts);

// Resolve config, run the download, print the result. Returns the process exit status.
int runDownload(const DownloadOpts& opts);

// Same, with an injected manager factory (tests).
int runDownload(const DownloadOpts& opts,
                const std::function<std::unique_ptr<downloader::IDownloadManager>(
                    const downloader::DownloaderConfig&)>& makeManager);

} // namespace rangefetch::cli
