#include "sync_orchestrator.hpp"

#include "format_utils.hpp"
#include "transfer_error.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <fmt/color.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace
{

const SyncConfig &validated(const SyncConfig &config)
{
    validateConfig(config);
    return config;
}

DownloadOptions downloadOptions(const SyncConfig &config)
{
    DownloadOptions options;
    options.chunkSize = config.chunkSize;
    options.retry.maxAttempts = config.maxRetries;
    options.retry.delay = std::chrono::milliseconds(static_cast<long long>(config.retryDelaySeconds * 1000.0));
    return options;
}

// Listing names end up as paths under the download directory
bool isSafeFilename(const std::string &name)
{
    return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos && name.find('\0') == std::string::npos;
}

bool sameDirectory(const std::string &a, const std::string &b)
{
    return std::filesystem::absolute(a).lexically_normal() == std::filesystem::absolute(b).lexically_normal();
}

// Where completed files end up after finalize()
std::filesystem::path finishedFilesDir(const SyncConfig &config)
{
    const std::string &directory =
        config.moveCompleted && !sameDirectory(config.localDir, config.downloadDir) ? config.localDir
                                                                                     : config.downloadDir;
    return std::filesystem::absolute(directory);
}

void ensureDirectory(const std::string &directory)
{
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        throw ConfigError(fmt::format("Cannot create directory {}: {}", directory, ec.message()));
    }
}

} // namespace

SyncOrchestrator::SyncOrchestrator(const SyncConfig &config, HttpSource &source, const CancellationToken &token,
                                   ProgressSink &sink)
    : config_(validated(config)),
      filter_(config.filter),
      token_(token),
      downloader_(source, downloadOptions(config), token, sink)
{
}

SyncSummary SyncOrchestrator::run(const std::vector<RemoteFile> &files)
{
    const auto start = std::chrono::steady_clock::now();
    SyncSummary summary;

    ensureDirectory(config_.localDir);
    ensureDirectory(config_.downloadDir);

    if (!filter_.enabled())
    {
        spdlog::warn("Filtering is disabled. No files will be downloaded.");
        for (const auto &file : files)
        {
            summary.filteredOut.push_back(file.name);
        }
        summary.elapsed = std::chrono::steady_clock::now() - start;
        return summary;
    }

    std::vector<RemoteFile> candidates;
    for (const auto &file : files)
    {
        if (filter_.matches(file.name))
        {
            candidates.push_back(file);
        }
        else
        {
            summary.filteredOut.push_back(file.name);
        }
    }

    if (!summary.filteredOut.empty())
    {
        spdlog::info("Filtered out {} files using pattern: '{}'", summary.filteredOut.size(), filter_.pattern());
    }
    spdlog::info("Matched {} files with pattern: '{}'", candidates.size(), filter_.pattern());

    if (candidates.empty())
    {
        spdlog::info("All matching files are up to date or none match the filter pattern!");
        summary.elapsed = std::chrono::steady_clock::now() - start;
        return summary;
    }

    logPlan(candidates, summary);

    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        const RemoteFile &file = candidates[i];

        if (token_.isCancelled())
        {
            if (!summary.cancelled)
            {
                spdlog::warn("Termination requested - stopping after {} of {} files", i, candidates.size());
                summary.cancelled = true;
            }
            summary.notStarted.push_back(file.name);
            continue;
        }

        spdlog::info("File {} of {}: {}", i + 1, candidates.size(), file.name);
        FileOutcome outcome = syncOne(file);
        summary.bytesDownloaded += outcome.bytesDownloaded;

        switch (outcome.state)
        {
        case TransferState::Completed:
            if (outcome.alreadyPresent)
            {
                summary.skipped.push_back(std::move(outcome));
            }
            else
            {
                summary.completed.push_back(std::move(outcome));
            }
            break;
        case TransferState::Paused:
            summary.paused.push_back(std::move(outcome));
            break;
        case TransferState::Failed:
        case TransferState::NotStarted:
        case TransferState::InProgress:
            if (outcome.reason.empty())
            {
                outcome.reason = fmt::format("ended in state '{}'", toString(outcome.state));
            }
            outcome.state = TransferState::Failed;
            summary.failed.push_back(std::move(outcome));
            break;
        }
    }

    summary.cancelled = summary.cancelled || token_.isCancelled();
    summary.elapsed = std::chrono::steady_clock::now() - start;
    return summary;
}

FileOutcome SyncOrchestrator::syncOne(const RemoteFile &file)
{
    FileOutcome outcome;
    outcome.name = file.name;

    if (!isSafeFilename(file.name))
    {
        spdlog::error("Refusing to download '{}': not a plain file name", file.name);
        outcome.state = TransferState::Failed;
        outcome.reason = "unsafe file name";
        return outcome;
    }

    try
    {
        if (separateLocalDir())
        {
            std::filesystem::path existing = std::filesystem::path(config_.localDir) / file.name;
            if (std::filesystem::exists(existing))
            {
                spdlog::info("{} already present in {}", file.name, config_.localDir);
                outcome.state = TransferState::Completed;
                outcome.alreadyPresent = true;
                outcome.offset = static_cast<std::int64_t>(std::filesystem::file_size(existing));
                return outcome;
            }
        }

        outcome = downloader_.download(file, std::filesystem::path(config_.downloadDir) / file.name);
        if (outcome.state == TransferState::Completed)
        {
            finalize(file);
        }
    }
    catch (const std::exception &e)
    {
        spdlog::error("{} failed: {}", file.name, e.what());
        outcome.state = TransferState::Failed;
        outcome.reason = e.what();
    }
    return outcome;
}

// Move a finished file out of the download directory when configured
void SyncOrchestrator::finalize(const RemoteFile &file) const
{
    if (!config_.moveCompleted || !separateLocalDir())
    {
        return;
    }

    std::filesystem::path from = std::filesystem::path(config_.downloadDir) / file.name;
    std::filesystem::path to = std::filesystem::path(config_.localDir) / file.name;

    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec)
    {
        // Different filesystems: copy, then drop the download copy
        std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing);
        std::filesystem::remove(from);
    }
    spdlog::debug("Moved {} to {}", from.string(), to.string());
}

bool SyncOrchestrator::separateLocalDir() const
{
    return !sameDirectory(config_.localDir, config_.downloadDir);
}

void SyncOrchestrator::logPlan(const std::vector<RemoteFile> &candidates, const SyncSummary &summary) const
{
    std::int64_t remaining = 0;
    std::size_t unknownSizes = 0;
    std::vector<std::string> partials;

    for (const auto &file : candidates)
    {
        if (!file.size)
        {
            ++unknownSizes;
            continue;
        }

        std::error_code ec;
        auto local = std::filesystem::file_size(std::filesystem::path(config_.downloadDir) / file.name, ec);
        std::int64_t have = ec ? 0 : static_cast<std::int64_t>(local);
        if (have > 0 && have < *file.size)
        {
            double percent = static_cast<double>(have) * 100.0 / static_cast<double>(*file.size);
            partials.push_back(fmt::format("  {}: {:.1f}% complete ({} of {})", file.name, percent,
                                           formatBytes(static_cast<double>(have)),
                                           formatBytes(static_cast<double>(*file.size))));
        }
        remaining += std::max<std::int64_t>(0, *file.size - have);
    }

    spdlog::info("Need to download {} files", candidates.size());
    if (!summary.filteredOut.empty())
    {
        spdlog::info("Excluded {} files by regex filter", summary.filteredOut.size());
    }
    if (!partials.empty())
    {
        spdlog::info("Including {} partially downloaded files:", partials.size());
        for (const auto &line : partials)
        {
            spdlog::info("{}", line);
        }
    }
    if (unknownSizes > 0)
    {
        spdlog::info("Total remaining download size: {} (+ {} files of unknown size)",
                     formatBytes(static_cast<double>(remaining)), unknownSizes);
    }
    else
    {
        spdlog::info("Total remaining download size: {}", formatBytes(static_cast<double>(remaining)));
    }
    spdlog::info("Files will be downloaded to: {}", std::filesystem::absolute(config_.downloadDir).string());
    spdlog::info("Press Ctrl+C at any time to gracefully terminate");
}

std::string formatSummary(const SyncSummary &summary, const SyncConfig &config, bool color)
{
    auto paint = [color](fmt::color shade, const std::string &text) {
        return color ? fmt::format(fmt::fg(shade), "{}", text) : text;
    };

    std::string out;
    const std::string separator(80, '-');
    out += "\n" + separator + "\n";

    if (summary.cancelled)
    {
        out += paint(fmt::color::yellow, "DOWNLOAD OPERATION TERMINATED BY USER") + "\n\n";
    }
    else if (!summary.failed.empty())
    {
        out += paint(fmt::color::red, "DOWNLOAD OPERATION COMPLETED WITH ERRORS") + "\n\n";
    }
    else
    {
        out += paint(fmt::color::green, "DOWNLOAD OPERATION COMPLETED SUCCESSFULLY") + "\n\n";
    }

    if (!summary.completed.empty())
    {
        out += paint(fmt::color::green, fmt::format("Successfully downloaded files ({}):", summary.completed.size())) + "\n";
        for (const auto &file : summary.completed)
        {
            out += fmt::format("  {}\n", file.name);
        }
    }

    if (!summary.skipped.empty())
    {
        out += fmt::format("\nAlready present ({}):\n", summary.skipped.size());
        for (const auto &file : summary.skipped)
        {
            out += fmt::format("  {}\n", file.name);
        }
    }

    if (!summary.failed.empty())
    {
        out += "\n" + paint(fmt::color::red, fmt::format("Failed files ({}):", summary.failed.size())) + "\n";
        for (const auto &file : summary.failed)
        {
            out += fmt::format("  {}: {}\n", file.name, file.reason);
        }
    }

    if (!summary.paused.empty())
    {
        out += "\n" + paint(fmt::color::yellow, fmt::format("Paused files ({}):", summary.paused.size())) + "\n";
        for (const auto &file : summary.paused)
        {
            out += fmt::format("  {} (at {})\n", file.name, formatBytes(static_cast<double>(file.offset)));
        }
    }

    if (!summary.notStarted.empty())
    {
        out += "\n" + paint(fmt::color::yellow, fmt::format("Not started ({}):", summary.notStarted.size())) + "\n";
        for (const auto &name : summary.notStarted)
        {
            out += fmt::format("  {}\n", name);
        }
    }

    if (!summary.filteredOut.empty())
    {
        // Only show up to 10 filtered files to avoid flooding the console
        constexpr std::size_t kShown = 10;
        out += "\n" + paint(fmt::color::yellow, fmt::format("Filtered out files ({}):", summary.filteredOut.size())) + "\n";
        for (std::size_t i = 0; i < summary.filteredOut.size() && i < kShown; ++i)
        {
            out += fmt::format("  {}\n", summary.filteredOut[i]);
        }
        if (summary.filteredOut.size() > kShown)
        {
            out += fmt::format("  ...and {} more\n", summary.filteredOut.size() - kShown);
        }
    }

    double seconds = std::chrono::duration<double>(summary.elapsed).count();
    out += "\nStatistics:\n";
    out += fmt::format("  Total downloaded: {}\n", formatBytes(static_cast<double>(summary.bytesDownloaded)));
    out += fmt::format("  Time elapsed: {}\n", formatDuration(static_cast<long>(seconds)));
    if (seconds > 0 && summary.bytesDownloaded > 0)
    {
        out += fmt::format("  Average download speed: {}\n",
                           formatRate(static_cast<double>(summary.bytesDownloaded) / seconds));
    }
    out += fmt::format("  Files are available in: {}\n", finishedFilesDir(config).string());

    if (config.filter.enabled)
    {
        out += fmt::format("  Filter: {} ({})\n", config.filter.pattern,
                           config.filter.caseSensitive ? "case-sensitive" : "case-insensitive");
    }
    else
    {
        out += "  Filter: " + paint(fmt::color::red, "Disabled") + "\n";
    }

    if (summary.cancelled && (!summary.paused.empty() || !summary.notStarted.empty()))
    {
        out += "\n" + paint(fmt::color::yellow, "To resume downloading incomplete files, run the program again.") + "\n";
        out += paint(fmt::color::yellow, "The program will automatically pick up where it left off.") + "\n";
    }

    out += separator + "\n";
    return out;
}
