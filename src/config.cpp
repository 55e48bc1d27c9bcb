#include "config.hpp"

#include "file_filter.hpp"
#include "transfer_error.hpp"

#include <fmt/core.h>

namespace
{

bool isHttpUrl(const std::string &url)
{
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

} // namespace

void validateConfig(const SyncConfig &config)
{
    if (config.url.empty())
    {
        throw ConfigError("Server URL is not configured");
    }
    if (!isHttpUrl(config.url))
    {
        throw ConfigError(fmt::format("Server URL must start with http:// or https://: {}", config.url));
    }
    if (config.username.empty() || config.password.empty())
    {
        throw ConfigError("Server credentials are incomplete (username and password are required)");
    }
    if (config.localDir.empty() || config.downloadDir.empty())
    {
        throw ConfigError("Local and download directories must be set");
    }
    if (config.chunkSize == 0)
    {
        throw ConfigError("Chunk size must be positive");
    }
    if (config.maxRetries < 1)
    {
        throw ConfigError(fmt::format("max_retries must be at least 1 (got {})", config.maxRetries));
    }
    if (config.retryDelaySeconds < 0)
    {
        throw ConfigError("Retry delay cannot be negative");
    }
    if (config.progressUpdateInterval <= 0)
    {
        throw ConfigError("Progress update interval must be positive");
    }
    if (config.connectTimeoutSeconds <= 0 || config.readTimeoutSeconds <= 0)
    {
        throw ConfigError("Timeouts must be positive");
    }

    // Compiling the filter surfaces an invalid pattern before any transfer
    FileFilter filter(config.filter);
    (void)filter;
}
