/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - fetchRange() over the libcurl easy API, one easy handle per request.
 * - The Range header is written by hand from the wire bounds; CURLOPT_RANGE is not used
 *   so that nothing rewrites the server-specific exclusive upper bound.
 * - HTTP/1.1 with "Connection: close"; the target server handles one request at a time.
 * - Honors connect and total timeouts. Non-2xx statuses are reported as TransportError.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <rangefetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <mutex>
#include <string>
#include <string_view>

namespace rangefetch::downloader {

namespace {

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.code = ErrorCode::TransportError;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.message += " (timed out)";
            break;
        case CURLE_PARTIAL_FILE:
            // Body shorter than the announced Content-Length.
            err.message += " (connection closed before the announced body length)";
            break;
        default:
            break;
    }
    return err;
}

// Helper to build curl_slist from headers
curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Write sink context for fetchRange
struct WriteContext {
    const ByteSink* sink{nullptr};
    std::uint64_t received{0};
    std::optional<Error> sinkError{};
};

// CURL write callback
size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    ByteSpan bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (ctx->sink && *ctx->sink)
                 ? (*ctx->sink)(bytes)
                 : Expected<void>{Error{ErrorCode::Unknown, "No sink provided"}};
    if (!r.ok()) {
        ctx->sinkError = r.error();
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    ctx->received += static_cast<std::uint64_t>(total);
    return total;
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, const TransportOptions& options) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min(options.connectTimeout, options.timeout).count()));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() {
        static std::once_flag curlInitFlag;
        std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
    }
    ~CurlHttpAdapter() override = default;

    Expected<long> fetchRange(std::string_view url, const std::vector<Header>& headers,
                              const WireRange& range, const TransportOptions& options,
                              const ByteSink& sink) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        // Build headers including Range
        curl_slist* list = build_header_list(headers);
        const std::string rangeHeader =
            "Range: bytes=" + std::to_string(range.first) + "-" + std::to_string(range.last);
        list = curl_slist_append(list, rangeHeader.c_str());
        list = curl_slist_append(list, "Connection: close");

        const std::string urlStr(url);
        curl_easy_setopt(curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);

        WriteContext wctx;
        wctx.sink = &sink;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);

        configure_common(curl, options);

        spdlog::debug("GET {} {}", urlStr, rangeHeader);
        CURLcode rc = curl_easy_perform(curl);

        long http_status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetchRange(GET)");
        }
        if (http_status < 200 || http_status >= 300) {
            Error err{ErrorCode::TransportError, "HTTP status " + std::to_string(http_status)};
            err.httpStatus = http_status;
            return err;
        }

        spdlog::debug("HTTP {} with {} body bytes", http_status, wctx.received);
        return http_status;
    }
};

} // namespace

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace rangefetch::downloader
