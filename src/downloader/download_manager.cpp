/*
 * rangefetch/src/downloader/download_manager.cpp
 *
 * DownloadManager (sequential range orchestrator):
 * - Plan windows for the expected length at the configured chunk size
 * - For each window in ascending order: fetch it (ChunkFetcher), then write it (Assembler)
 * - Abort on the first fetch or assembly failure; remaining windows are not requested
 * - Hash the assembled buffer and compare against the optional expected digest
 *
 * State: Planning -> Fetching -> Assembling -> Verifying -> Done, or Aborted.
 */

#include <rangefetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <limits>
#include <memory>
#include <new>
#include <string>
#include <utility>

namespace rangefetch::downloader {

const char* errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::TransportError:
            return "TransportError";
        case ErrorCode::LengthMismatch:
            return "LengthMismatch";
        case ErrorCode::InvalidWindow:
            return "InvalidWindow";
        case ErrorCode::IncompleteAssembly:
            return "IncompleteAssembly";
        case ErrorCode::DigestMismatch:
            return "DigestMismatch";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

const char* downloadStateName(DownloadState state) noexcept {
    switch (state) {
        case DownloadState::Idle:
            return "Idle";
        case DownloadState::Planning:
            return "Planning";
        case DownloadState::Fetching:
            return "Fetching";
        case DownloadState::Assembling:
            return "Assembling";
        case DownloadState::Verifying:
            return "Verifying";
        case DownloadState::Done:
            return "Done";
        case DownloadState::Aborted:
            return "Aborted";
    }
    return "Unknown";
}

namespace {

std::optional<float> percentOf(std::uint64_t done, std::uint64_t total) {
    if (total == 0)
        return std::nullopt;
    return static_cast<float>((static_cast<long double>(done) * 100.0L) /
                              static_cast<long double>(total));
}

} // namespace

// ---- DownloadManager implementation ----
class DownloadManager final : public IDownloadManager {
public:
    DownloadManager(DownloaderConfig cfg, std::unique_ptr<IHttpAdapter> http = nullptr,
                    std::unique_ptr<IIntegrityVerifier> integ = nullptr)
        : config_(std::move(cfg)), http_(std::move(http)), integ_(std::move(integ)) {
        if (!http_)
            http_ = makeCurlHttpAdapter();
        if (!integ_)
            integ_ = makeIntegrityVerifierSha256();
    }

    Expected<DownloadReport> download(const DownloadSpec& spec,
                                      const ProgressCallback& onProgress) override {
        try {
            return run(spec, onProgress);
        } catch (const std::bad_alloc&) {
            state_ = DownloadState::Aborted;
            return Error{ErrorCode::Unknown, "Unable to allocate " +
                                                 std::to_string(spec.expectedLength) +
                                                 " bytes for the download buffer"};
        } catch (const std::exception& ex) {
            state_ = DownloadState::Aborted;
            return Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()};
        }
    }

    [[nodiscard]] DownloadState state() const noexcept override { return state_; }
    [[nodiscard]] DownloaderConfig config() const override { return config_; }

private:
    Expected<DownloadReport> run(const DownloadSpec& spec, const ProgressCallback& onProgress) {
        const auto started = std::chrono::steady_clock::now();
        const std::uint64_t total = spec.expectedLength;

        auto emit = [&](DownloadState stage, std::uint64_t done, std::uint64_t index,
                        std::uint64_t count) {
            if (!onProgress)
                return;
            ProgressEvent ev;
            ev.stage = stage;
            ev.downloadedBytes = done;
            ev.totalBytes = total;
            ev.percentage = percentOf(done, total);
            ev.windowIndex = index;
            ev.windowCount = count;
            onProgress(ev);
        };

        auto fail = [&](Error err) -> Expected<DownloadReport> {
            spdlog::debug("download aborted in state {}: {}", downloadStateName(state_),
                          err.message);
            state_ = DownloadState::Aborted;
            return err;
        };

        // ---- Planning ----
        state_ = DownloadState::Planning;
        if (auto vr = validateConfig(config_); !vr.ok()) {
            return fail(vr.error());
        }
        if (config_.maxFileBytes > 0 && total > config_.maxFileBytes) {
            return fail(Error{ErrorCode::InvalidArgument,
                              "Expected length " + std::to_string(total) +
                                  " exceeds configured max_file_bytes (" +
                                  std::to_string(config_.maxFileBytes) + ")"});
        }
        if (total > static_cast<std::uint64_t>(std::numeric_limits<std::ptrdiff_t>::max())) {
            return fail(Error{ErrorCode::InvalidArgument,
                              "Expected length " + std::to_string(total) +
                                  " is not addressable on this platform"});
        }

        auto pr = makeRangePlanner(total, static_cast<std::uint32_t>(config_.chunkSizeBytes));
        if (!pr.ok()) {
            return fail(pr.error());
        }
        auto& planner = pr.value();
        const auto windowCount = planner.windowCount();
        spdlog::info("Downloading {} bytes from {} in {} window(s) of up to {} bytes", total,
                     config_.url, windowCount, planner.chunkSize());
        emit(DownloadState::Planning, 0, 0, windowCount);

        Assembler assembler(total);
        FetchOptions fopts;
        fopts.url = config_.url;
        fopts.headers = config_.headers;
        fopts.transport = config_.transport;
        fopts.retry = config_.retry;
        ChunkFetcher fetcher(*http_, std::move(fopts));

        // ---- Fetching / Assembling, one window at a time ----
        std::uint64_t index = 0;
        while (auto window = planner.next()) {
            state_ = DownloadState::Fetching;
            emit(DownloadState::Fetching, assembler.filledBytes(), index, windowCount);
            auto fr = fetcher.fetch(*window);
            if (!fr.ok()) {
                return fail(fr.error());
            }

            state_ = DownloadState::Assembling;
            const auto& chunk = fr.value();
            auto wr = assembler.write(*window, ByteSpan{chunk.data(), chunk.size()});
            if (!wr.ok()) {
                return fail(wr.error());
            }

            ++index;
            emit(DownloadState::Assembling, assembler.filledBytes(), index, windowCount);
        }

        if (!assembler.isComplete()) {
            return fail(Error{ErrorCode::IncompleteAssembly,
                              "planned windows filled " + std::to_string(assembler.filledBytes()) +
                                  " of " + std::to_string(total) + " bytes"});
        }
        auto br = std::move(assembler).intoBuffer();
        if (!br.ok()) {
            return fail(br.error());
        }
        const AssembledBuffer buffer = std::move(br).value();

        // ---- Verifying ----
        state_ = DownloadState::Verifying;
        emit(DownloadState::Verifying, buffer.size(), index, windowCount);
        integ_->reset();
        integ_->update(buffer.bytes());
        auto dr = integ_->finalize();
        if (!dr.ok()) {
            return fail(dr.error());
        }

        DownloadReport report;
        report.outcome = compareDigest(dr.value(), spec.expectedDigest);
        report.sizeBytes = buffer.size();
        report.windowCount = windowCount;
        report.requestCount = fetcher.requestCount();
        report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        state_ = DownloadState::Done;
        emit(DownloadState::Done, buffer.size(), index, windowCount);
        spdlog::info("Download complete: {} bytes, sha256 {} ({})", report.sizeBytes,
                     digestToHex(report.outcome.computed), outcomeName(report.outcome.kind));
        return report;
    }

    DownloaderConfig config_;
    DownloadState state_{DownloadState::Idle};

    std::unique_ptr<IHttpAdapter> http_;
    std::unique_ptr<IIntegrityVerifier> integ_;
};

std::unique_ptr<IDownloadManager>
makeDownloadManagerWithDependencies(const DownloaderConfig& cfg,
                                    std::unique_ptr<IHttpAdapter> http,
                                    std::unique_ptr<IIntegrityVerifier> integ) {
    return std::make_unique<DownloadManager>(cfg, std::move(http), std::move(integ));
}

std::unique_ptr<IDownloadManager> makeDownloadManager(const DownloaderConfig& cfg) {
    return makeDownloadManagerWithDependencies(cfg, nullptr, nullptr);
}

} // namespace rangefetch::downloader
