#pragma once

#include "cancellation.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "file_filter.hpp"
#include "http_source.hpp"
#include "progress_reporter.hpp"
#include "sync_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

/**
 * Result of one sync pass.
 */
struct SyncSummary
{
    std::vector<FileOutcome> completed;
    std::vector<FileOutcome> skipped;    // Already present, no transfer made
    std::vector<FileOutcome> failed;
    std::vector<FileOutcome> paused;     // Interrupted, resumable on the next run
    std::vector<std::string> notStarted; // Left over after cancellation
    std::vector<std::string> filteredOut;
    std::int64_t bytesDownloaded = 0;
    std::chrono::steady_clock::duration elapsed{};
    bool cancelled = false;

    /**
     * 0 unless a file failed. Cancellation is not an error.
     */
    int exitCode() const { return failed.empty() ? 0 : 1; }
};

/**
 * Downloads the filtered remote files one at a time into the download
 * directory and collects the per-file outcomes.
 */
class SyncOrchestrator
{
public:
    /**
     * @throws ConfigError if `config` cannot drive a sync pass
     */
    SyncOrchestrator(const SyncConfig &config, HttpSource &source, const CancellationToken &token,
                     ProgressSink &sink);

    /**
     * Process `files` in order. Per-file failures are recorded in the
     * summary, never thrown. Once cancellation is requested no new file is
     * started.
     */
    SyncSummary run(const std::vector<RemoteFile> &files);

private:
    void logPlan(const std::vector<RemoteFile> &candidates, const SyncSummary &summary) const;
    FileOutcome syncOne(const RemoteFile &file);
    void finalize(const RemoteFile &file) const;
    bool separateLocalDir() const;

    SyncConfig config_;
    FileFilter filter_;
    const CancellationToken &token_;
    Downloader downloader_;
};

/**
 * Render the end-of-run report.
 */
std::string formatSummary(const SyncSummary &summary, const SyncConfig &config, bool color);
