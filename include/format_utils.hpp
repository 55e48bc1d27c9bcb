#pragma once

#include <cstdint>
#include <string>

/**
 * Format bytes into human-readable string (e.g., "52.30 MB")
 */
std::string formatBytes(double bytes);

/**
 * Format duration into human-readable string (e.g., "2m 30s").
 * Negative durations are reported as "unknown".
 */
std::string formatDuration(long seconds);

/**
 * Format a transfer rate (e.g., "1.50 MB/s")
 */
std::string formatRate(double bytesPerSecond);
