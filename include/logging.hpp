#pragma once

#include <string>

struct LoggingOptions
{
    bool verbose = false;
    bool color = true;
    std::string logFile = "sync_log.txt"; // Empty disables the file sink
};

/**
 * Install the default spdlog logger: colored console output plus an
 * append-only log file.
 */
void setupLogging(const LoggingOptions &options);
