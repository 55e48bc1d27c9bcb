#include "cli_options.hpp"

#include <string>

void addSyncOptions(CLI::App &app, SyncConfig &config)
{
    // Flat "key = value" file; a missing default file is not an error
    app.set_config("-c,--config", "sync_config.ini", "Path to configuration file");

    // ====================================================================
    // SERVER
    // ====================================================================

    app.add_option("-u,--url", config.url, "Server directory URL")
        ->check([](const std::string &url) -> std::string {
            // Custom validator: check if URL starts with http:// or https://
            if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0) {
                return "";  // Empty string = valid
            }
            return "URL must start with http:// or https://";
        });
    app.add_option("--username", config.username, "Server username");
    app.add_option("--password", config.password,
                   "Server password (not recommended on the command line, use the config file instead)");

    // ====================================================================
    // LOCAL LAYOUT
    // ====================================================================

    app.add_option("--local-dir", config.localDir, "Directory of already synchronized files")
        ->capture_default_str();
    app.add_option("--download-dir", config.downloadDir, "Directory for new and partial downloads")
        ->capture_default_str();
    app.add_option("-e,--extension", config.extension,
                   "File extension to synchronize (e.g. '.laz'). If not specified, all files are considered.");
    app.add_flag("--move-completed", config.moveCompleted,
                 "Move completed files from the download directory to the local directory");

    // ====================================================================
    // DOWNLOAD
    // ====================================================================

    app.add_option("--chunk-size", config.chunkSize, "Download chunk size in bytes")
        ->check(CLI::Range(std::size_t{1}, std::size_t{64} * 1024 * 1024))
        ->capture_default_str();
    app.add_option("-r,--max-retries", config.maxRetries, "Maximum attempts per file")
        ->check(CLI::Range(1, 100))
        ->capture_default_str();
    app.add_option("--retry-delay", config.retryDelaySeconds, "Delay between attempts in seconds")
        ->check(CLI::NonNegativeNumber)
        ->capture_default_str();
    app.add_option("--progress-interval", config.progressUpdateInterval, "Progress update interval in seconds")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--connect-timeout", config.connectTimeoutSeconds, "Connect timeout in seconds")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("-t,--timeout", config.readTimeoutSeconds,
                   "Seconds without received data before a transfer is retried")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    // ====================================================================
    // FILTER
    // ====================================================================

    auto *filter = app.add_option_function<std::string>(
        "--filter",
        [&config](const std::string &pattern) {
            config.filter.pattern = pattern;
            config.filter.enabled = true;
        },
        "Regex filter pattern; also enables filtering");
    app.add_option("--pattern", config.filter.pattern, "Regex filter pattern (does not enable filtering)")
        ->capture_default_str();
    auto *enable = app.add_flag("--enable-filter", config.filter.enabled,
                                "Enable regex filtering with the configured pattern");
    app.add_flag_callback("--disable-filter", [&config]() { config.filter.enabled = false; },
                 "Disable regex filtering (no files will be downloaded)")
        ->excludes(enable)
        ->excludes(filter);
    app.add_flag("--case-sensitive", config.filter.caseSensitive, "Match the filter pattern case-sensitively");

    // ====================================================================
    // OUTPUT
    // ====================================================================

    app.add_flag("--verbose", config.verbose, "Enable verbose logging");
    app.add_flag("--no-color", config.noColor, "Disable colored output");
    app.add_option("--log-file", config.logFile, "Log file (empty to disable)")->capture_default_str();

    // Optional flag: --version (for help display only, actual handling is done in main)
    app.add_flag("-v,--version", config.showVersion, "Display version information");
}
