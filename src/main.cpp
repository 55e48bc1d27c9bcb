#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include <unistd.h>

#include <CLI/CLI.hpp> // CLI11 main header
#include <curl/curl.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "cancellation.hpp"
#include "cli_options.hpp"
#include "config.hpp"
#include "directory_listing.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include "progress_reporter.hpp"
#include "retry_controller.hpp"
#include "sync_orchestrator.hpp"
#include "transfer_error.hpp"

namespace
{

constexpr const char *kVersion = "1.0";

void printVersion()
{
    fmt::print("File Synchronizer v{}\n", kVersion);
    fmt::print("Built with:\n");
    fmt::print("  - libcurl {}: HTTP/HTTPS range requests\n", curl_version_info(CURLVERSION_NOW)->version);
    fmt::print("  - CLI11: Command-line parsing and configuration file\n");
    fmt::print("  - fmt: Modern string formatting\n");
    fmt::print("  - spdlog {}.{}.{}: Logging\n", SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH);
}

HttpOptions httpOptions(const SyncConfig &config)
{
    HttpOptions options;
    options.username = config.username;
    options.password = config.password;
    options.connectTimeoutSeconds = config.connectTimeoutSeconds;
    options.readTimeoutSeconds = config.readTimeoutSeconds;
    return options;
}

RetryPolicy retryPolicy(const SyncConfig &config)
{
    RetryPolicy policy;
    policy.maxAttempts = config.maxRetries;
    policy.delay = std::chrono::milliseconds(static_cast<long long>(config.retryDelaySeconds * 1000.0));
    return policy;
}

} // namespace

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v") {
            printVersion();
            return 0;
        }
    }

    // Create CLI11 app
    CLI::App app{fmt::format("File Synchronizer v{} - Resumable HTTP directory sync", kVersion)};

    // Configuration struct to be populated
    SyncConfig config;
    addSyncOptions(app, config);

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        // CLI11 automatically generates beautiful help/error messages
        return app.exit(e);
    }

    const bool isTerminal = ::isatty(STDOUT_FILENO) != 0;
    const bool color = isTerminal && !config.noColor;
    setupLogging(LoggingOptions{config.verbose, color, config.logFile});

    try
    {
        validateConfig(config);
    }
    catch (const ConfigError &e)
    {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    }

    // ====================================================================
    // DISPLAY CONFIGURATION
    // ====================================================================

    fmt::print("File Synchronizer v{}\n", kVersion);
    fmt::print("====================================\n\n");

    fmt::print("Configuration:\n");
    fmt::print("  Server:       {}\n", config.url);
    fmt::print("  Local dir:    {}\n", config.localDir);
    fmt::print("  Download dir: {}\n", config.downloadDir);
    if (!config.extension.empty()) {
        fmt::print("  Extension:    {}\n", config.extension);
    }
    fmt::print("  Max Retries:  {}\n", config.maxRetries);
    fmt::print("  Chunk size:   {} bytes\n", config.chunkSize);
    if (config.filter.enabled) {
        fmt::print("  Filter:       {} ({})\n", config.filter.pattern,
                   config.filter.caseSensitive ? "case-sensitive" : "case-insensitive");
    } else {
        fmt::print("  Filter:       disabled\n");
    }
    fmt::print("\n");

    // ====================================================================
    // SYNCHRONIZE
    // ====================================================================

    try
    {
        CancellationToken token;
        SignalHandlerGuard signals(token);

        // Create HTTP client (RAII ensures cleanup)
        HttpClient client(httpOptions(config));

        std::vector<RemoteFile> files;
        DirectoryListing listing(client, config.url, config.extension);
        RetryController retry(retryPolicy(config), token);
        RetryOutcome fetched = retry.run([&] { files = listing.fetch(); }, "directory listing");

        if (fetched.status == RetryStatus::Cancelled)
        {
            spdlog::warn("Terminated before the directory listing was retrieved");
            return 0;
        }
        if (fetched.status == RetryStatus::Failed)
        {
            spdlog::error("Could not retrieve file list from server: {}", fetched.reason);
            return 1;
        }

        ProgressReporter progress(std::chrono::duration<double>(config.progressUpdateInterval), isTerminal, color);
        SyncOrchestrator orchestrator(config, client, token, progress);
        SyncSummary summary = orchestrator.run(files);

        fmt::print("{}", formatSummary(summary, config, color));
        std::fflush(stdout);
        return summary.exitCode();
    }
    catch (const ConfigError &e)
    {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    }
    catch (const std::exception &e)
    {
        spdlog::critical("Unexpected error: {}", e.what());
        return 1;
    }
}
