#include "cli_options.hpp"
#include "config.hpp"
#include "transfer_error.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

namespace
{

SyncConfig validConfig()
{
    SyncConfig config;
    config.url = "https://data.example.org/lidar/tiles/";
    config.username = "surveyor";
    config.password = "secret";
    return config;
}

bool rejects(const SyncConfig &config)
{
    try
    {
        validateConfig(config);
        return false;
    }
    catch (const ConfigError &)
    {
        return true;
    }
}

// Parse arguments the way main() does
SyncConfig parse(std::vector<std::string> args)
{
    SyncConfig config;
    CLI::App app{"test"};
    addSyncOptions(app, config);
    std::reverse(args.begin(), args.end()); // CLI11 takes the vector in reverse order
    app.parse(args);
    return config;
}

void testValidation()
{
    fmt::print("\n-- validation --\n");
    bool accepted = !rejects(validConfig());
    test::expect(accepted, "complete configuration accepted");

    SyncConfig config = validConfig();
    config.url = "";
    test::expect(rejects(config), "missing URL rejected");

    config = validConfig();
    config.url = "ftp://data.example.org/";
    test::expect(rejects(config), "non-HTTP URL rejected");

    config = validConfig();
    config.password = "";
    test::expect(rejects(config), "missing password rejected");

    config = validConfig();
    config.chunkSize = 0;
    test::expect(rejects(config), "zero chunk size rejected");

    config = validConfig();
    config.maxRetries = 0;
    test::expect(rejects(config), "zero attempts rejected");

    config = validConfig();
    config.retryDelaySeconds = -1;
    test::expect(rejects(config), "negative delay rejected");

    config = validConfig();
    config.progressUpdateInterval = 0;
    test::expect(rejects(config), "zero progress interval rejected");

    config = validConfig();
    config.filter.enabled = true;
    config.filter.pattern = "[unclosed";
    test::expect(rejects(config), "invalid filter pattern rejected");
}

void testDefaults()
{
    fmt::print("\n-- defaults --\n");
    SyncConfig config = parse({});
    test::expect(config.localDir == "current_files" && config.downloadDir == "new_downloads", "directory defaults");
    test::expect(config.chunkSize == 8192 && config.maxRetries == 3, "transfer defaults");
    test::expect(config.retryDelaySeconds == 5.0 && config.progressUpdateInterval == 1.0, "timing defaults");
    test::expect(!config.filter.enabled && config.filter.pattern == ".*", "filter disabled by default");
    test::expect(config.logFile == "sync_log.txt", "log file default");
}

void testCommandLine()
{
    fmt::print("\n-- command line --\n");
    SyncConfig config = parse({"--url", "https://data.example.org/", "--username", "surveyor", "--password",
                               "secret", "--chunk-size", "65536", "-r", "5", "--retry-delay", "0.5",
                               "--filter", "^tile_", "--case-sensitive", "--move-completed", "-e", ".laz"});
    test::expect(config.url == "https://data.example.org/", "URL");
    test::expect(config.chunkSize == 65536 && config.maxRetries == 5, "numbers");
    test::expect(config.retryDelaySeconds == 0.5, "fractional delay");
    test::expect(config.filter.enabled && config.filter.pattern == "^tile_", "--filter sets and enables");
    test::expect(config.filter.caseSensitive && config.moveCompleted, "flags");
    test::expect(config.extension == ".laz", "extension");

    SyncConfig disabled = parse({"--pattern", "x", "--disable-filter"});
    test::expect(!disabled.filter.enabled && disabled.filter.pattern == "x", "--pattern alone does not enable");

    bool conflict = false;
    try
    {
        parse({"--enable-filter", "--disable-filter"});
    }
    catch (const CLI::ParseError &)
    {
        conflict = true;
    }
    test::expect(conflict, "--enable-filter and --disable-filter exclude each other");

    bool badUrl = false;
    try
    {
        parse({"--url", "data.example.org"});
    }
    catch (const CLI::ParseError &)
    {
        badUrl = true;
    }
    test::expect(badUrl, "URL without scheme rejected by the parser");
}

void testConfigFile()
{
    fmt::print("\n-- configuration file --\n");
    test::ScratchDir dir("config");
    auto path = dir / "sync_config.ini";
    test::writeFile(path, "; survey server\n"
                          "url = https://data.example.org/lidar/\n"
                          "username = surveyor\n"
                          "password = from-file\n"
                          "download-dir = incoming\n"
                          "max-retries = 7\n"
                          "enable-filter = true\n"
                          "pattern = tile_2023\n");

    SyncConfig config = parse({"--config", path.string(), "--password", "from-cli"});
    test::expect(config.url == "https://data.example.org/lidar/", "URL from file");
    test::expect(config.downloadDir == "incoming" && config.maxRetries == 7, "values from file");
    test::expect(config.filter.enabled && config.filter.pattern == "tile_2023", "filter from file");
    test::expect(config.password == "from-cli", "command line overrides the file");
    bool valid = !rejects(config);
    test::expect(valid, "file-based configuration validates");
}

} // namespace

int main()
{
    test::quietLogging();
    try
    {
        testValidation();
        testDefaults();
        testCommandLine();
        testConfigFile();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
    return test::finish();
}
