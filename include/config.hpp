#pragma once

#include <cstddef>
#include <string>

/**
 * Regex filter settings. Filtering is disabled by default, which means
 * nothing is downloaded until a pattern is enabled.
 */
struct FilterConfig
{
    bool enabled = false;
    std::string pattern = ".*";
    bool caseSensitive = false;
};

/**
 * Configuration for a sync pass.
 * Populated by CLI11 from the configuration file and command-line arguments.
 */
struct SyncConfig
{
    // Server
    std::string url;
    std::string username;
    std::string password;

    // Local layout
    std::string localDir = "current_files";
    std::string downloadDir = "new_downloads";
    std::string extension; // Optional suffix filter applied to the listing, e.g. ".laz"

    // Download tuning
    std::size_t chunkSize = 8192;
    int maxRetries = 3;              // Attempts per file, including the first one
    double retryDelaySeconds = 5.0;
    double progressUpdateInterval = 1.0;
    int connectTimeoutSeconds = 10;
    int readTimeoutSeconds = 30;     // Stall timeout, expiry is retried
    bool moveCompleted = false;      // Move finished files from downloadDir to localDir

    FilterConfig filter;

    // Output
    bool verbose = false;
    bool noColor = false;
    std::string logFile = "sync_log.txt";

    // Flags
    bool showVersion = false;
};

/**
 * Reject a configuration that cannot drive a sync pass.
 *
 * @throws ConfigError describing the first invalid field
 */
void validateConfig(const SyncConfig &config);
