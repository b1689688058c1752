#include <rangefetch/cli/download_command.h>
#include <rangefetch/version.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    try {
        // Logs go to stderr so that --json output on stdout stays machine-readable
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        spdlog::set_default_logger(std::make_shared<spdlog::logger>("rangefetch", stderr_sink));
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"Download a file in ranges from a server with exclusive Range bounds and "
                     "silent body truncation, then verify its SHA-256",
                     "rangefetch"};
        app.set_version_flag("--version", std::string(rangefetch::kVersionLongString));

        auto opts = std::make_shared<rangefetch::cli::DownloadOpts>();
        rangefetch::cli::registerDownloadOptions(app, opts);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // Usage errors use the InvalidArgument status unless CLI11 reports success (--help)
            const int rc = app.exit(e);
            return rc == 0 ? 0
                           : rangefetch::cli::exitCodeFor(
                                 rangefetch::downloader::ErrorCode::InvalidArgument);
        }

        if (opts->verbose) {
            spdlog::set_level(spdlog::level::debug);
        } else if (opts->quiet || opts->emit_json) {
            spdlog::set_level(spdlog::level::warn);
        }

        return rangefetch::cli::runDownload(*opts);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
