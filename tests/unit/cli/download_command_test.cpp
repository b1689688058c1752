#include <gtest/gtest.h>
#include <rangefetch/cli/download_command.h>

#include "fake_http_adapter.h"
#include "test_helpers.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace rangefetch;
using rangefetch::tests::make_temp_dir;
using rangefetch::tests::QuirkyServerAdapter;
using rangefetch::tests::random_bytes;
using rangefetch::tests::ScopedEnv;
using rangefetch::tests::ScriptedHttpAdapter;

namespace {

std::string hexOf(const std::vector<std::byte>& data) {
    auto d = downloader::computeDigest(downloader::AssembledBuffer{data});
    EXPECT_TRUE(d.ok());
    return downloader::digestToHex(d.value());
}

} // namespace

TEST(DownloadCommand, ExitCodesPerErrorKind) {
    using downloader::ErrorCode;
    EXPECT_EQ(cli::exitCodeFor(ErrorCode::None), 0);
    EXPECT_EQ(cli::exitCodeFor(ErrorCode::InvalidArgument), 2);
    EXPECT_EQ(cli::exitCodeFor(ErrorCode::TransportError), 3);
    EXPECT_EQ(cli::exitCodeFor(ErrorCode::LengthMismatch), 4);
    EXPECT_EQ(cli::exitCodeFor(ErrorCode::InvalidWindow), 4);
    EXPECT_EQ(cli::exitCodeFor(ErrorCode::IncompleteAssembly), 4);
    EXPECT_EQ(cli::exitCodeFor(ErrorCode::DigestMismatch), 5);
    EXPECT_EQ(cli::exitCodeFor(ErrorCode::Unknown), 1);
}

TEST(DownloadCommand, MismatchOutcomeBecomesDigestError) {
    downloader::DownloadReport report;
    report.outcome.kind = downloader::VerifyOutcome::Kind::Mismatch;
    report.outcome.computed.fill(0xab);
    downloader::Digest expected{};
    expected.fill(0x01);
    report.outcome.expected = expected;

    auto err = cli::outcomeError(report);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, downloader::ErrorCode::DigestMismatch);
    std::string abab;
    for (int i = 0; i < 32; ++i)
        abab += "ab";
    EXPECT_EQ(err->computedDigest.value_or(""), abab);
    EXPECT_EQ(err->expectedDigest.value_or(""), downloader::digestToHex(expected));
    EXPECT_NE(err->message.find(downloader::digestToHex(expected)), std::string::npos);

    report.outcome.kind = downloader::VerifyOutcome::Kind::Match;
    EXPECT_FALSE(cli::outcomeError(report).has_value());
    report.outcome.kind = downloader::VerifyOutcome::Kind::NoExpectedProvided;
    EXPECT_FALSE(cli::outcomeError(report).has_value());
}

TEST(DownloadCommand, OverridesReplaceResolvedValues) {
    cli::DownloadOpts opts;
    opts.url = "http://cli/";
    opts.chunk_size = 65000;
    opts.truncation_threshold = 65536;
    opts.timeout_ms = 1234;
    opts.retries = 2;
    opts.retry_delay_ms = 50;

    downloader::DownloaderConfig cfg;
    cfg.transport.connectTimeout = std::chrono::milliseconds(999);
    cli::applyOverrides(opts, cfg);

    EXPECT_EQ(cfg.url, "http://cli/");
    EXPECT_EQ(cfg.chunkSizeBytes, 65000u);
    ASSERT_TRUE(cfg.truncationThreshold.has_value());
    EXPECT_EQ(*cfg.truncationThreshold, 65536u);
    EXPECT_EQ(cfg.transport.timeout, std::chrono::milliseconds(1234));
    EXPECT_EQ(cfg.transport.connectTimeout, std::chrono::milliseconds(999));
    EXPECT_EQ(cfg.retry.maxAttempts, 3);
    EXPECT_EQ(cfg.retry.initialBackoff, std::chrono::milliseconds(50));
}

TEST(DownloadCommand, HeaderOverridesAreSplitAtFirstColon) {
    cli::DownloadOpts opts;
    opts.headers = {"User-Agent: rangefetch/1", "X-Token:a:b"};

    downloader::DownloaderConfig cfg;
    cli::applyOverrides(opts, cfg);

    ASSERT_EQ(cfg.headers.size(), 2u);
    EXPECT_EQ(cfg.headers[0].name, "User-Agent");
    EXPECT_EQ(cfg.headers[0].value, "rangefetch/1");
    EXPECT_EQ(cfg.headers[1].name, "X-Token");
    EXPECT_EQ(cfg.headers[1].value, "a:b");
}

TEST(DownloadCommand, ParsesPositionalsAndOptions) {
    CLI::App app{"test", "rangefetch"};
    auto opts = std::make_shared<cli::DownloadOpts>();
    cli::registerDownloadOptions(app, opts);

    const std::string digest = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
    ASSERT_NO_THROW(app.parse("646863 " + digest + " --chunk-size 65000 --url http://h:1/ --json",
                              false));
    EXPECT_EQ(opts->total_size, 646863u);
    ASSERT_TRUE(opts->expected_sha256.has_value());
    EXPECT_EQ(*opts->expected_sha256, digest);
    ASSERT_TRUE(opts->chunk_size.has_value());
    EXPECT_EQ(*opts->chunk_size, 65000u);
    EXPECT_EQ(opts->url.value_or(""), "http://h:1/");
    EXPECT_TRUE(opts->emit_json);
}

TEST(DownloadCommand, ParsesRepeatableHeaders) {
    CLI::App app{"test", "rangefetch"};
    auto opts = std::make_shared<cli::DownloadOpts>();
    cli::registerDownloadOptions(app, opts);

    ASSERT_NO_THROW(app.parse("100 -H \"User-Agent: rf\" --header X-A:1", false));
    ASSERT_EQ(opts->headers.size(), 2u);
    EXPECT_EQ(opts->headers[0], "User-Agent: rf");
    EXPECT_EQ(opts->headers[1], "X-A:1");
}

TEST(DownloadCommand, RejectsMalformedDigestAndMissingSize) {
    {
        CLI::App app{"test", "rangefetch"};
        auto opts = std::make_shared<cli::DownloadOpts>();
        cli::registerDownloadOptions(app, opts);
        EXPECT_THROW(app.parse("100 not-a-digest", false), CLI::ValidationError);
    }
    {
        CLI::App app{"test", "rangefetch"};
        auto opts = std::make_shared<cli::DownloadOpts>();
        cli::registerDownloadOptions(app, opts);
        EXPECT_THROW(app.parse("--json", false), CLI::RequiredError);
    }
    {
        CLI::App app{"test", "rangefetch"};
        auto opts = std::make_shared<cli::DownloadOpts>();
        cli::registerDownloadOptions(app, opts);
        EXPECT_THROW(app.parse("100 --chunk-size 0", false), CLI::ValidationError);
    }
    {
        CLI::App app{"test", "rangefetch"};
        auto opts = std::make_shared<cli::DownloadOpts>();
        cli::registerDownloadOptions(app, opts);
        EXPECT_THROW(app.parse("100 --chunk-size 4294967296", false), CLI::ValidationError);
    }
    {
        CLI::App app{"test", "rangefetch"};
        auto opts = std::make_shared<cli::DownloadOpts>();
        cli::registerDownloadOptions(app, opts);
        EXPECT_THROW(app.parse("100 -H no-colon", false), CLI::ValidationError);
    }
}

class RunDownloadTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_temp_dir("rangefetch_cli_");
        config_ = std::make_unique<ScopedEnv>("RANGEFETCH_CONFIG",
                                              (dir_ / "missing.toml").c_str());
        url_ = std::make_unique<ScopedEnv>("RANGEFETCH_URL", nullptr);
        source_ = random_bytes(10'000, 5);
        // Keep the default stdout logger out of captured command output
        spdlog::set_level(spdlog::level::off);
    }

    void TearDown() override {
        spdlog::set_level(spdlog::level::info);
        url_.reset();
        config_.reset();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    int run(const cli::DownloadOpts& opts, std::uint64_t threshold = 65536) {
        return cli::runDownload(opts, [&](const downloader::DownloaderConfig& cfg) {
            lastConfig_ = cfg;
            return downloader::makeDownloadManagerWithDependencies(
                cfg, std::make_unique<QuirkyServerAdapter>(source_, threshold), nullptr);
        });
    }

    struct Output {
        int rc{0};
        std::string out;
        std::string err;
    };

    Output runCaptured(const cli::DownloadOpts& opts, std::uint64_t threshold = 65536) {
        testing::internal::CaptureStdout();
        testing::internal::CaptureStderr();
        Output o;
        o.rc = run(opts, threshold);
        o.out = testing::internal::GetCapturedStdout();
        o.err = testing::internal::GetCapturedStderr();
        return o;
    }

    cli::DownloadOpts jsonOpts() const {
        auto opts = quietOpts();
        opts.quiet = false;
        opts.emit_json = true;
        return opts;
    }

    cli::DownloadOpts quietOpts() const {
        cli::DownloadOpts opts;
        opts.total_size = source_.size();
        opts.chunk_size = 3000;
        opts.quiet = true;
        return opts;
    }

    fs::path dir_;
    std::unique_ptr<ScopedEnv> config_;
    std::unique_ptr<ScopedEnv> url_;
    std::vector<std::byte> source_;
    downloader::DownloaderConfig lastConfig_;
};

TEST_F(RunDownloadTest, MatchingDigestExitsZero) {
    auto opts = quietOpts();
    opts.expected_sha256 = hexOf(source_);
    EXPECT_EQ(run(opts), 0);
    EXPECT_EQ(lastConfig_.chunkSizeBytes, 3000u);
    EXPECT_EQ(lastConfig_.url, "http://127.0.0.1:8080/");
}

TEST_F(RunDownloadTest, NoDigestExitsZero) {
    EXPECT_EQ(run(quietOpts()), 0);
}

TEST_F(RunDownloadTest, CommandLineHeadersReachTheManager) {
    auto opts = quietOpts();
    opts.headers = {"User-Agent: rangefetch-test"};
    EXPECT_EQ(run(opts), 0);
    ASSERT_EQ(lastConfig_.headers.size(), 1u);
    EXPECT_EQ(lastConfig_.headers[0].name, "User-Agent");
    EXPECT_EQ(lastConfig_.headers[0].value, "rangefetch-test");
}

TEST_F(RunDownloadTest, JsonReportsMatch) {
    auto opts = jsonOpts();
    const auto hex = hexOf(source_);
    opts.expected_sha256 = hex;

    auto o = runCaptured(opts);
    EXPECT_EQ(o.rc, 0);
    const auto j = json::parse(o.out);
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["size_bytes"], 10000);
    EXPECT_EQ(j["windows"], 4);
    EXPECT_EQ(j["requests"], 4);
    EXPECT_EQ(j["sha256"], hex);
    EXPECT_EQ(j["expected_sha256"], hex);
    EXPECT_EQ(j["outcome"], "match");
    EXPECT_TRUE(j.contains("elapsed_ms"));
    EXPECT_FALSE(j.contains("error"));
    // No progress line in JSON mode
    EXPECT_EQ(o.err.find("Downloaded:"), std::string::npos);
}

TEST_F(RunDownloadTest, JsonReportsComputedDigestWithoutExpected) {
    auto o = runCaptured(jsonOpts());
    EXPECT_EQ(o.rc, 0);
    const auto j = json::parse(o.out);
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["sha256"], hexOf(source_));
    EXPECT_TRUE(j["expected_sha256"].is_null());
    EXPECT_EQ(j["outcome"], "no_expected_provided");
}

TEST_F(RunDownloadTest, JsonReportsMismatchWithBothDigests) {
    auto opts = jsonOpts();
    const std::string wrong(64, '0');
    opts.expected_sha256 = wrong;

    auto o = runCaptured(opts);
    EXPECT_EQ(o.rc, 5);
    const auto j = json::parse(o.out);
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["outcome"], "mismatch");
    EXPECT_EQ(j["sha256"], hexOf(source_));
    ASSERT_TRUE(j.contains("error"));
    EXPECT_EQ(j["error"]["code"], "DigestMismatch");
    EXPECT_EQ(j["error"]["expected_sha256"], wrong);
    EXPECT_EQ(j["error"]["computed_sha256"], hexOf(source_));
}

TEST_F(RunDownloadTest, JsonReportsLengthMismatchWindow) {
    auto o = runCaptured(jsonOpts(), 1000);
    EXPECT_EQ(o.rc, 4);
    const auto j = json::parse(o.out);
    EXPECT_EQ(j["success"], false);
    EXPECT_TRUE(j["sha256"].is_null());
    ASSERT_TRUE(j.contains("error"));
    EXPECT_EQ(j["error"]["code"], "LengthMismatch");
    EXPECT_FALSE(j["error"]["message"].get<std::string>().empty());
    EXPECT_EQ(j["error"]["window"]["start"], 0);
    EXPECT_EQ(j["error"]["window"]["end"], 3000);
    EXPECT_EQ(j["error"]["window"]["range"], "bytes=0-3000");
}

TEST_F(RunDownloadTest, HumanOutputOnMatch) {
    auto opts = quietOpts();
    opts.quiet = false;
    opts.expected_sha256 = hexOf(source_);

    auto o = runCaptured(opts);
    EXPECT_EQ(o.rc, 0);
    EXPECT_NE(o.out.find("Actual SHA-256:   " + hexOf(source_)), std::string::npos);
    EXPECT_NE(o.out.find("Success! Downloaded data matches the expected hash."),
              std::string::npos);
    EXPECT_NE(o.err.find("Downloaded: 100.00% (10000/10000) bytes"), std::string::npos);
}

TEST_F(RunDownloadTest, HumanOutputWithoutDigestPrintsComputedOnly) {
    auto o = runCaptured(quietOpts());
    EXPECT_EQ(o.rc, 0);
    EXPECT_NE(o.out.find("Actual SHA-256:   " + hexOf(source_)), std::string::npos);
    EXPECT_EQ(o.out.find("Success!"), std::string::npos);
    // --quiet suppresses the progress line
    EXPECT_EQ(o.err.find("Downloaded:"), std::string::npos);
}

TEST_F(RunDownloadTest, HumanOutputOnMismatchShowsBothDigests) {
    auto opts = quietOpts();
    const std::string wrong(64, '0');
    opts.expected_sha256 = wrong;

    auto o = runCaptured(opts);
    EXPECT_EQ(o.rc, 5);
    EXPECT_EQ(o.out.find("Success!"), std::string::npos);
    EXPECT_NE(o.err.find("Hash mismatch!"), std::string::npos);
    EXPECT_NE(o.err.find("Expected: " + wrong), std::string::npos);
    EXPECT_NE(o.err.find("Actual:   " + hexOf(source_)), std::string::npos);
}

TEST_F(RunDownloadTest, WrongDigestExitsWithMismatchStatus) {
    auto opts = quietOpts();
    opts.expected_sha256 = std::string(64, '0');
    EXPECT_EQ(run(opts), 5);
}

TEST_F(RunDownloadTest, TruncatedWindowExitsWithLengthStatus) {
    auto opts = quietOpts();
    EXPECT_EQ(run(opts, 1000), 4);
}

TEST_F(RunDownloadTest, ChunkNotBelowThresholdExitsWithUsageStatus) {
    auto opts = quietOpts();
    opts.truncation_threshold = 3000;
    bool called = false;
    const int rc = cli::runDownload(opts, [&](const downloader::DownloaderConfig& cfg) {
        called = true;
        return downloader::makeDownloadManagerWithDependencies(
            cfg, std::make_unique<ScriptedHttpAdapter>(), nullptr);
    });
    EXPECT_EQ(rc, 2);
    EXPECT_FALSE(called);
}

TEST_F(RunDownloadTest, BadDigestTextExitsWithUsageStatus) {
    auto opts = quietOpts();
    opts.expected_sha256 = "xyz";
    EXPECT_EQ(run(opts), 2);
}
