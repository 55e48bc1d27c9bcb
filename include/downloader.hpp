#pragma once

#include "cancellation.hpp"
#include "http_source.hpp"
#include "progress_reporter.hpp"
#include "range_negotiator.hpp"
#include "retry_controller.hpp"
#include "sync_types.hpp"
#include "transfer_loop.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>

struct DownloadOptions
{
    std::size_t chunkSize = 8192;
    RetryPolicy retry;
};

/**
 * Downloads one remote file with resumption and retries.
 *
 * Every attempt, the first one and each retry, re-reads the local file
 * length and negotiates a range from there, so a retry after a dropped
 * connection takes the same path as a resume after a restart.
 */
class Downloader
{
public:
    Downloader(HttpSource &source, const DownloadOptions &options, const CancellationToken &token,
               ProgressSink &sink);

    /**
     * Bring `target` up to date with `file`. Never throws for per-file
     * failures: they are reported as a Failed outcome.
     */
    FileOutcome download(const RemoteFile &file, const std::filesystem::path &target);

private:
    TransferResult attemptOnce(const RemoteFile &file, const std::filesystem::path &target,
                               std::int64_t &bytesDownloaded);
    void checkDiskSpace(const std::filesystem::path &target, std::int64_t requiredBytes) const;

    RangeNegotiator negotiator_;
    RetryController retry_;
    TransferLoop loop_;
    ProgressSink &sink_;
};
