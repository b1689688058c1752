/*
 * rangefetch/src/cli/download_command.cpp
 *
 * Command-line surface for the range downloader:
 *   rangefetch <total_size> [<expected_sha256>] [options]
 *
 * - Without a digest, the computed SHA-256 is printed.
 * - With a digest, it is compared; a mismatch exits non-zero with both values.
 * - --json prints a single result object on stdout; logs and progress go to stderr.
 */

#include <rangefetch/cli/download_command.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <string>

using json = nlohmann::json;

namespace rangefetch::cli {

namespace dl = rangefetch::downloader;

namespace {

json errorJson(const dl::Error& err) {
    json e = {{"code", dl::errorCodeName(err.code)}, {"message", err.message}};
    if (err.window) {
        e["window"] = {{"start", err.window->startOffset},
                       {"end", err.window->endOffset()},
                       {"range", dl::formatRangeHeader(*err.window)}};
    }
    if (err.httpStatus)
        e["http_status"] = *err.httpStatus;
    if (err.expectedDigest)
        e["expected_sha256"] = *err.expectedDigest;
    if (err.computedDigest)
        e["computed_sha256"] = *err.computedDigest;
    return e;
}

void printJsonResult(const DownloadOpts& opts, const dl::Expected<dl::DownloadReport>& result,
                     const std::optional<dl::Error>& failure) {
    json out = {{"type", "result"},
                {"success", !failure.has_value()},
                {"size_bytes", opts.total_size},
                {"expected_sha256", nullptr},
                {"sha256", nullptr},
                {"outcome", nullptr}};
    if (opts.expected_sha256)
        out["expected_sha256"] = *opts.expected_sha256;
    if (result.ok()) {
        const auto& report = result.value();
        out["sha256"] = dl::digestToHex(report.outcome.computed);
        out["outcome"] = dl::outcomeName(report.outcome.kind);
        out["windows"] = report.windowCount;
        out["requests"] = report.requestCount;
        out["elapsed_ms"] = report.elapsed.count();
    }
    if (failure)
        out["error"] = errorJson(*failure);
    fmt::print("{}\n", out.dump(2));
}

void printHumanResult(const dl::Expected<dl::DownloadReport>& result,
                      const std::optional<dl::Error>& failure) {
    if (result.ok()) {
        fmt::print("Actual SHA-256:   {}\n", dl::digestToHex(result.value().outcome.computed));
        if (result.value().outcome.kind == dl::VerifyOutcome::Kind::Match) {
            fmt::print("\nSuccess! Downloaded data matches the expected hash.\n");
        }
    }
    if (failure) {
        spdlog::error("{}: {}", dl::errorCodeName(failure->code), failure->message);
        if (failure->code == dl::ErrorCode::DigestMismatch) {
            fmt::print(stderr, "Hash mismatch!\n Expected: {}\n Actual:   {}\n",
                       failure->expectedDigest.value_or(""),
                       failure->computedDigest.value_or(""));
        }
    }
}

dl::ProgressCallback makeProgressPrinter(const DownloadOpts& opts) {
    if (opts.emit_json || opts.quiet)
        return {};
    return [](const dl::ProgressEvent& ev) {
        if (ev.stage == dl::DownloadState::Assembling) {
            fmt::print(stderr, "\rDownloaded: {:.2f}% ({}/{}) bytes", ev.percentage.value_or(100.0f),
                       ev.downloadedBytes, ev.totalBytes);
            std::fflush(stderr);
        } else if (ev.stage == dl::DownloadState::Verifying && ev.windowCount > 0) {
            fmt::print(stderr, "\n");
        }
    };
}

} // namespace

int exitCodeFor(dl::ErrorCode code) noexcept {
    switch (code) {
        case dl::ErrorCode::None:
            return 0;
        case dl::ErrorCode::InvalidArgument:
            return 2;
        case dl::ErrorCode::TransportError:
            return 3;
        case dl::ErrorCode::LengthMismatch:
        case dl::ErrorCode::InvalidWindow:
        case dl::ErrorCode::IncompleteAssembly:
            return 4;
        case dl::ErrorCode::DigestMismatch:
            return 5;
        case dl::ErrorCode::Unknown:
            return 1;
    }
    return 1;
}

std::optional<dl::Error> outcomeError(const dl::DownloadReport& report) {
    if (report.outcome.kind != dl::VerifyOutcome::Kind::Mismatch)
        return std::nullopt;

    const auto computed = dl::digestToHex(report.outcome.computed);
    const auto expected =
        report.outcome.expected ? dl::digestToHex(*report.outcome.expected) : std::string{};
    dl::Error err{dl::ErrorCode::DigestMismatch,
                  "SHA-256 mismatch (expected " + expected + ", computed " + computed + ")"};
    err.expectedDigest = expected;
    err.computedDigest = computed;
    return err;
}

void applyOverrides(const DownloadOpts& opts, dl::DownloaderConfig& cfg) {
    using std::chrono::milliseconds;
    if (opts.url)
        cfg.url = *opts.url;
    if (opts.chunk_size)
        cfg.chunkSizeBytes = *opts.chunk_size;
    if (opts.truncation_threshold)
        cfg.truncationThreshold = *opts.truncation_threshold;
    if (opts.timeout_ms)
        cfg.transport.timeout = milliseconds(*opts.timeout_ms);
    if (opts.connect_timeout_ms)
        cfg.transport.connectTimeout = milliseconds(*opts.connect_timeout_ms);
    if (opts.retries)
        cfg.retry.maxAttempts = *opts.retries + 1;
    if (opts.retry_delay_ms)
        cfg.retry.initialBackoff = milliseconds(*opts.retry_delay_ms);

    for (const auto& h : opts.headers) {
        auto pos = h.find(':');
        if (pos == std::string::npos)
            continue;
        std::string key = h.substr(0, pos);
        std::string value = h.substr(pos + 1);
        // trim leading space from value
        if (!value.empty() && value[0] == ' ') {
            value.erase(0, 1);
        }
        cfg.headers.push_back({key, value});
    }
}

void registerDownloadOptions(CLI::App& app, const std::shared_ptr<DownloadOpts>& opts) {
    app.add_option("total_size", opts->total_size, "Expected total size of the file in bytes.")
        ->required();
    app.add_option("expected_sha256", opts->expected_sha256,
                   "Expected SHA-256 (64 hex characters). When omitted, the computed digest "
                   "is printed.")
        ->check(CLI::Validator(
            [](std::string& s) {
                return dl::parseDigestHex(s).ok()
                           ? std::string{}
                           : std::string{"expected 64 hexadecimal characters"};
            },
            "SHA256"));

    app.add_option("-u,--url", opts->url, "Source URL (default http://127.0.0.1:8080/).")
        ->check(CLI::NonEmpty());
    app.add_option("--chunk-size", opts->chunk_size,
                   "Window size in bytes; must stay below the truncation threshold.")
        ->check(CLI::Range(std::uint64_t{1}, std::uint64_t{0xFFFFFFFF}));
    app.add_option("--truncation-threshold", opts->truncation_threshold,
                   "Known server truncation threshold in bytes (validates --chunk-size).")
        ->check(CLI::PositiveNumber);
    app.add_option("--timeout-ms", opts->timeout_ms, "Per-request timeout in ms (default 10000).")
        ->check(CLI::Range(1, 3600 * 1000));
    app.add_option("--connect-timeout-ms", opts->connect_timeout_ms,
                   "Connect timeout in ms (default 5000).")
        ->check(CLI::Range(1, 600 * 1000));
    app.add_option("--retries", opts->retries, "Retries per window after a failure (default 0).")
        ->check(CLI::Range(0, 20));
    app.add_option("--retry-delay-ms", opts->retry_delay_ms,
                   "Initial delay between retries in ms (default 500).")
        ->check(CLI::Range(0, 60000));
    app.add_option("-H,--header", opts->headers,
                   "Extra request header (repeatable), e.g. 'User-Agent: rangefetch'.")
        ->check(CLI::Validator(
            [](std::string& s) {
                const auto pos = s.find(':');
                return pos != std::string::npos && pos > 0
                           ? std::string{}
                           : std::string{"expected 'Name: value'"};
            },
            "HEADER"));
    app.add_option("-c,--config", opts->config_path,
                   "Config file (default $RANGEFETCH_CONFIG or ~/.config/rangefetch/config.toml).");

    app.add_flag("--json", opts->emit_json, "Emit the final result as JSON on stdout.");
    app.add_flag("-q,--quiet", opts->quiet, "Suppress non-critical logs and progress.");
    app.add_flag("-v,--verbose", opts->verbose, "Enable debug logging.");

    app.footer(R"(Behavior:
  - The server reads "Range: bytes=a-b" as [a, b) and truncates large bodies silently.
    Windows are requested as bytes=start-(start+length) and each body must match exactly.
  - Exit status: 0 success, 2 invalid arguments, 3 transport error,
    4 length/assembly fault, 5 digest mismatch, 1 other.)");
}

int runDownload(const DownloadOpts& opts) {
    return runDownload(opts, [](const dl::DownloaderConfig& cfg) {
        return dl::makeDownloadManager(cfg);
    });
}

int runDownload(const DownloadOpts& opts,
                const std::function<std::unique_ptr<dl::IDownloadManager>(
                    const dl::DownloaderConfig&)>& makeManager) {
    dl::DownloadSpec spec;
    spec.expectedLength = opts.total_size;
    if (opts.expected_sha256) {
        auto pr = dl::parseDigestHex(*opts.expected_sha256);
        if (!pr.ok()) {
            spdlog::error("Invalid expected SHA-256: {}", pr.error().message);
            return exitCodeFor(pr.error().code);
        }
        spec.expectedDigest = pr.value();
    }

    auto cr = dl::resolveDownloaderConfig(opts.config_path);
    if (!cr.ok()) {
        spdlog::error("Configuration error: {}", cr.error().message);
        return exitCodeFor(cr.error().code);
    }
    auto cfg = std::move(cr).value();
    applyOverrides(opts, cfg);
    if (auto vr = dl::validateConfig(cfg); !vr.ok()) {
        spdlog::error("Configuration error: {}", vr.error().message);
        return exitCodeFor(vr.error().code);
    }

    spdlog::info("Expected total size: {} bytes", spec.expectedLength);

    auto manager = makeManager(cfg);
    auto result = manager->download(spec, makeProgressPrinter(opts));

    std::optional<dl::Error> failure;
    if (!result.ok()) {
        failure = result.error();
    } else {
        failure = outcomeError(result.value());
    }

    if (opts.emit_json) {
        printJsonResult(opts, result, failure);
    } else {
        printHumanResult(result, failure);
    }
    return failure ? exitCodeFor(failure->code) : 0;
}

} // namespace rangefetch::cli
