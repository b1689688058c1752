#pragma once

/*
 * rangefetch Downloader - Public Types and Component Interfaces (C++20)
 *
 * This header defines the public data types, component classes and abstract
 * interfaces of the range downloader.
 *
 * The target server deviates from RFC 9110 partial content:
 * - "Range: bytes=a-b" is read as the half-open interval [a, b)
 * - no Content-Range header is sent back
 * - response bodies are silently cut at a fixed truncation threshold
 *
 * Pipeline: RangePlanner -> ChunkFetcher -> Assembler -> integrity check,
 * sequenced by IDownloadManager.
 */

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rangefetch::downloader {

// ================================
// Fundamental enums and constants
// ================================

using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;

/**
 * Raw SHA-256 digest (32 bytes).
 */
using Digest = std::array<std::uint8_t, 32>;

inline constexpr std::string_view kDefaultUrl = "http://127.0.0.1:8080/";
inline constexpr std::uint32_t kDefaultChunkSizeBytes = 32u * 1024u;

/**
 * Canonical error codes for downloader operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    TransportError,
    LengthMismatch,
    InvalidWindow,
    IncompleteAssembly,
    DigestMismatch,
    Unknown
};

/**
 * Orchestrator states. Done and Aborted are terminal.
 */
enum class DownloadState { Idle, Planning, Fetching, Assembling, Verifying, Done, Aborted };

[[nodiscard]] const char* errorCodeName(ErrorCode code) noexcept;
[[nodiscard]] const char* downloadStateName(DownloadState state) noexcept;

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * A planned byte window [startOffset, startOffset + length).
 */
struct Window {
    std::uint64_t startOffset{0};
    std::uint32_t length{0};

    [[nodiscard]] std::uint64_t endOffset() const noexcept { return startOffset + length; }

    friend bool operator==(const Window&, const Window&) = default;
};

/**
 * Bounds placed verbatim in the Range header ("bytes=first-last").
 * The server reads them as [first, last).
 */
struct WireRange {
    std::uint64_t first{0};
    std::uint64_t last{0};

    friend bool operator==(const WireRange&, const WireRange&) = default;
};

/**
 * Immutable description of one download.
 */
struct DownloadSpec {
    std::uint64_t expectedLength{0};
    std::optional<Digest> expectedDigest{};
};

/**
 * Retry/backoff policy. maxAttempts == 1 disables retries.
 */
struct RetryPolicy {
    int maxAttempts{1};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
};

/**
 * Transport-level options for a single request.
 */
struct TransportOptions {
    std::chrono::milliseconds timeout{10000};
    std::chrono::milliseconds connectTimeout{5000};
};

/**
 * Options consumed by ChunkFetcher.
 */
struct FetchOptions {
    std::string url{kDefaultUrl};
    std::vector<Header> headers;
    TransportOptions transport{};
    RetryPolicy retry{};
};

/**
 * Downloader configuration (see resolveDownloaderConfig / validateConfig).
 */
struct DownloaderConfig {
    std::string url{kDefaultUrl};
    std::vector<Header> headers;
    std::uint64_t chunkSizeBytes{kDefaultChunkSizeBytes};
    // Known out-of-band; chunkSizeBytes must stay strictly below it.
    std::optional<std::uint64_t> truncationThreshold{};
    TransportOptions transport{};
    RetryPolicy retry{};
    std::uint64_t maxFileBytes{0}; // 0 = unlimited
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::optional<Window> window{};
    std::optional<long> httpStatus{};
    std::optional<std::string> expectedDigest{};
    std::optional<std::string> computedDigest{};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Range window planner
// ===================

/**
 * Lazy, single-pass generator of contiguous windows covering [0, totalLength).
 * The last window carries the remainder. A default-constructed planner is empty.
 */
class RangePlanner {
public:
    RangePlanner() = default;
    RangePlanner(std::uint64_t totalLength, std::uint32_t chunkSize);

    [[nodiscard]] std::optional<Window> next();
    [[nodiscard]] std::uint64_t windowCount() const noexcept;
    [[nodiscard]] std::uint64_t totalLength() const noexcept { return _total; }
    [[nodiscard]] std::uint32_t chunkSize() const noexcept { return _chunk; }

private:
    std::uint64_t _total{0};
    std::uint32_t _chunk{0};
    std::uint64_t _cursor{0};
};

/**
 * Create a planner. Fails with InvalidArgument when chunkSize == 0.
 */
Expected<RangePlanner> makeRangePlanner(std::uint64_t totalLength, std::uint32_t chunkSize);

/**
 * Drain a planner into a vector.
 */
Expected<std::vector<Window>> planWindows(std::uint64_t totalLength, std::uint32_t chunkSize);

/**
 * Translate a window into the server's exclusive convention: last = start + length.
 */
[[nodiscard]] constexpr WireRange toWireRange(const Window& w) noexcept {
    return WireRange{w.startOffset, w.startOffset + w.length};
}

/**
 * "bytes=<first>-<last>" for the given window.
 */
[[nodiscard]] std::string formatRangeHeader(const Window& w);

/**
 * "[start, end)" for diagnostics.
 */
[[nodiscard]] std::string describeWindow(const Window& w);

// ===================
// HTTP transport
// ===================

using ByteSink = std::function<Expected<void>(ByteSpan)>;

/**
 * HTTP adapter abstraction (libcurl-based implementation in http_adapter_curl.cpp).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * GET url with "Range: bytes=<range.first>-<range.last>" and stream the body to sink.
     * The sink may be called multiple times on the same thread; an error from the sink
     * aborts the transfer and is returned as-is.
     * Connection failures and non-2xx statuses are returned as TransportError.
     * On success returns the HTTP status code.
     */
    virtual Expected<long> fetchRange(std::string_view url, const std::vector<Header>& headers,
                                      const WireRange& range, const TransportOptions& options,
                                      const ByteSink& sink) = 0;
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();

// ===================
// Chunk fetcher
// ===================

/**
 * Issues one range request per window (plus bounded retries) and checks the body size.
 */
class ChunkFetcher {
public:
    ChunkFetcher(IHttpAdapter& http, FetchOptions options);

    Expected<ByteVector> fetch(const Window& window);

    [[nodiscard]] std::uint64_t requestCount() const noexcept { return _requests; }

private:
    Expected<ByteVector> fetchOnce(const Window& window);

    IHttpAdapter& _http;
    FetchOptions _options;
    std::uint64_t _requests{0};
};

// ===================
// Assembler
// ===================

/**
 * Read-only contiguous bytes produced by a complete Assembler.
 */
class AssembledBuffer {
public:
    AssembledBuffer() = default;
    explicit AssembledBuffer(ByteVector bytes) noexcept : _bytes(std::move(bytes)) {}

    [[nodiscard]] ByteSpan bytes() const noexcept { return {_bytes.data(), _bytes.size()}; }
    [[nodiscard]] std::uint64_t size() const noexcept { return _bytes.size(); }

private:
    ByteVector _bytes;
};

/**
 * Owns a buffer of exactly expectedLength bytes, filled strictly in window order.
 */
class Assembler {
public:
    explicit Assembler(std::uint64_t expectedLength);

    Expected<void> write(const Window& window, ByteSpan chunk);

    [[nodiscard]] bool isComplete() const noexcept { return _filled == _expected; }
    [[nodiscard]] std::uint64_t filledBytes() const noexcept { return _filled; }
    [[nodiscard]] std::uint64_t expectedLength() const noexcept { return _expected; }

    /**
     * Hand the buffer over. IncompleteAssembly unless isComplete().
     */
    Expected<AssembledBuffer> intoBuffer() &&;

private:
    std::uint64_t _expected{0};
    std::uint64_t _filled{0};
    ByteVector _buffer;
};

// ===================
// Integrity verification
// ===================

/**
 * Result of comparing a computed digest with an optional expected one.
 */
struct VerifyOutcome {
    enum class Kind { Match, Mismatch, NoExpectedProvided };

    Kind kind{Kind::NoExpectedProvided};
    Digest computed{};
    std::optional<Digest> expected{};
};

[[nodiscard]] const char* outcomeName(VerifyOutcome::Kind kind) noexcept;

/**
 * Streaming SHA-256 calculator.
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset() = 0;
    virtual void update(ByteSpan data) = 0;
    virtual Expected<Digest> finalize() = 0;
};

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifierSha256();

/**
 * SHA-256 over the whole buffer.
 */
Expected<Digest> computeDigest(const AssembledBuffer& buffer);

[[nodiscard]] VerifyOutcome compareDigest(const Digest& computed,
                                          const std::optional<Digest>& expected);

/**
 * Parse 64 hex characters (either case). InvalidArgument otherwise.
 */
Expected<Digest> parseDigestHex(std::string_view hex);

/**
 * Lower-case hex rendering.
 */
[[nodiscard]] std::string digestToHex(const Digest& digest);

// ===================
// Orchestrator
// ===================

/**
 * Progress event emitted after each stage change and each assembled window.
 */
struct ProgressEvent {
    DownloadState stage{DownloadState::Planning};
    std::uint64_t downloadedBytes{0};
    std::uint64_t totalBytes{0};
    std::optional<float> percentage{}; // 0.0 - 100.0
    std::uint64_t windowIndex{0};
    std::uint64_t windowCount{0};
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * What a run that reached Done reports back.
 */
struct DownloadReport {
    VerifyOutcome outcome{};
    std::uint64_t sizeBytes{0};
    std::uint64_t windowCount{0};
    std::uint64_t requestCount{0};
    std::chrono::milliseconds elapsed{0};
};

/**
 * Download manager abstraction (orchestrates planner/fetcher/assembler/verifier).
 */
class IDownloadManager {
public:
    virtual ~IDownloadManager() = default;

    /**
     * Run one download to Done (report) or Aborted (error).
     */
    virtual Expected<DownloadReport> download(const DownloadSpec& spec,
                                              const ProgressCallback& onProgress = {}) = 0;

    [[nodiscard]] virtual DownloadState state() const noexcept = 0;
    [[nodiscard]] virtual DownloaderConfig config() const = 0;
};

std::unique_ptr<IDownloadManager> makeDownloadManager(const DownloaderConfig& cfg);

/**
 * Construct with injected collaborators; nullptr selects the default implementation.
 */
std::unique_ptr<IDownloadManager>
makeDownloadManagerWithDependencies(const DownloaderConfig& cfg,
                                    std::unique_ptr<IHttpAdapter> http,
                                    std::unique_ptr<IIntegrityVerifier> integ);

// ===================
// Configuration
// ===================

/**
 * Defaults, then the [downloader] section of configPath (if it exists), then
 * RANGEFETCH_URL. The result is not validated.
 */
Expected<DownloaderConfig> resolveDownloaderConfig(const std::string& configPath);

Expected<void> validateConfig(const DownloaderConfig& cfg);

} // namespace rangefetch::downloader
