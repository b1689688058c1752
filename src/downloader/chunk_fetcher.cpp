/*
 * rangefetch/src/downloader/chunk_fetcher.cpp
 *
 * One range request per window against IHttpAdapter.
 * - Accepts 200 and 206; any other status is a TransportError.
 * - The body must be exactly window.length bytes. Bodies that grow past the
 *   window abort the transfer from the sink; short bodies are detected after it.
 * - Optional bounded retry with exponential backoff (RetryPolicy). The accepted
 *   bytes are always those of a single complete attempt.
 */

#include <rangefetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>

namespace rangefetch::downloader {

namespace {

Error lengthMismatch(const Window& window, std::uint64_t received, bool overflow) {
    Error err;
    err.code = ErrorCode::LengthMismatch;
    err.window = window;
    err.message = "window " + describeWindow(window) + " (" + formatRangeHeader(window) +
                  ") expected " + std::to_string(window.length) + " bytes, received " +
                  (overflow ? "more than " + std::to_string(received) : std::to_string(received));
    return err;
}

std::chrono::milliseconds nextBackoff(const RetryPolicy& policy, std::chrono::milliseconds cur) {
    const auto scaled = static_cast<long long>(static_cast<double>(cur.count()) * policy.multiplier);
    return std::min(std::chrono::milliseconds(scaled), policy.maxBackoff);
}

} // namespace

ChunkFetcher::ChunkFetcher(IHttpAdapter& http, FetchOptions options)
    : _http(http), _options(std::move(options)) {}

Expected<ByteVector> ChunkFetcher::fetch(const Window& window) {
    const int attempts = std::max(1, _options.retry.maxAttempts);
    auto backoff = _options.retry.initialBackoff;

    Expected<ByteVector> last;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        last = fetchOnce(window);
        if (last.ok())
            return last;

        if (attempt < attempts) {
            spdlog::warn("{}. Retrying (attempt {}/{})", last.error().message, attempt + 1,
                         attempts);
            std::this_thread::sleep_for(backoff);
            backoff = nextBackoff(_options.retry, backoff);
        }
    }
    return last;
}

Expected<ByteVector> ChunkFetcher::fetchOnce(const Window& window) {
    ByteVector body;
    body.reserve(window.length);
    bool overflow = false;

    ByteSink sink = [&](ByteSpan data) -> Expected<void> {
        if (body.size() + data.size() > window.length) {
            overflow = true;
            return lengthMismatch(window, body.size() + data.size(), true);
        }
        const auto oldSize = body.size();
        body.resize(oldSize + data.size());
        std::memcpy(body.data() + oldSize, data.data(), data.size());
        return Expected<void>{};
    };

    ++_requests;
    auto fr = _http.fetchRange(_options.url, _options.headers, toWireRange(window),
                               _options.transport, sink);
    if (!fr.ok()) {
        if (overflow)
            return fr.error();
        Error err = fr.error();
        err.window = window;
        if (err.code == ErrorCode::Unknown)
            err.code = ErrorCode::TransportError;
        err.message = "window " + describeWindow(window) + " (" + formatRangeHeader(window) +
                      "): " + err.message;
        return err;
    }

    const long status = fr.value();
    if (status != 200 && status != 206) {
        Error err{ErrorCode::TransportError,
                  "window " + describeWindow(window) + " (" + formatRangeHeader(window) +
                      "): unexpected HTTP status " + std::to_string(status)};
        err.window = window;
        err.httpStatus = status;
        return err;
    }

    if (body.size() != window.length) {
        return lengthMismatch(window, body.size(), false);
    }

    spdlog::debug("window {} received {} bytes (HTTP {})", describeWindow(window), body.size(),
                  status);
    return body;
}

} // namespace rangefetch::downloader
