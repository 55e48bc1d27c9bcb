#include "downloader.hpp"

#include "format_utils.hpp"
#include "transfer_error.hpp"

#include <system_error>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace
{

std::int64_t localLength(const std::filesystem::path &target)
{
    std::error_code ec;
    auto size = std::filesystem::file_size(target, ec);
    return ec ? 0 : static_cast<std::int64_t>(size);
}

} // namespace

Downloader::Downloader(HttpSource &source, const DownloadOptions &options, const CancellationToken &token,
                       ProgressSink &sink)
    : negotiator_(source), retry_(options.retry, token), loop_(options.chunkSize, token, sink), sink_(sink)
{
}

FileOutcome Downloader::download(const RemoteFile &file, const std::filesystem::path &target)
{
    FileOutcome outcome;
    outcome.name = file.name;

    std::int64_t initialSize = 0;
    try
    {
        ResumePlan initial = negotiator_.plan(target, file.size, file.sizeExact);
        initialSize = initial.localSize;
        if (initial.action == ResumePlan::Action::Skip)
        {
            spdlog::info("{} is already complete ({})", file.name,
                         formatBytes(static_cast<double>(initial.localSize)));
            outcome.state = TransferState::Completed;
            outcome.alreadyPresent = true;
            outcome.offset = initial.localSize;
            return outcome;
        }
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        spdlog::error("Cannot inspect {}: {}", target.string(), e.what());
        outcome.state = TransferState::Failed;
        outcome.reason = e.what();
        return outcome;
    }

    outcome.state = TransferState::InProgress;
    TransferResult last;
    RetryOutcome retried = retry_.run([&] { last = attemptOnce(file, target, outcome.bytesDownloaded); },
                                      file.name);

    outcome.attempts = retried.attempts;
    outcome.offset = localLength(target);

    switch (retried.status)
    {
    case RetryStatus::Succeeded:
        // The loop already reported the end of the transfer to the sink
        outcome.state = last.status == TransferStatus::Completed ? TransferState::Completed : TransferState::Paused;
        // The server confirmed a local copy the listing size could not vouch for
        outcome.alreadyPresent = outcome.state == TransferState::Completed && outcome.bytesDownloaded == 0 &&
                                 initialSize > 0 && outcome.offset == initialSize;
        break;
    case RetryStatus::Cancelled:
        outcome.state = TransferState::Paused;
        if (retried.attempts > 0)
        {
            sink_.onFinish(TransferState::Paused);
        }
        break;
    case RetryStatus::Failed:
        outcome.state = TransferState::Failed;
        outcome.reason = retried.reason;
        sink_.onFinish(TransferState::Failed);
        break;
    }

    spdlog::debug("{}: {} at byte {} after {} attempt(s)", file.name, toString(outcome.state), outcome.offset,
                  outcome.attempts);
    return outcome;
}

TransferResult Downloader::attemptOnce(const RemoteFile &file, const std::filesystem::path &target,
                                       std::int64_t &bytesDownloaded)
{
    ResumePlan plan;
    try
    {
        if (target.has_parent_path())
        {
            std::filesystem::create_directories(target.parent_path());
        }
        plan = negotiator_.plan(target, file.size, file.sizeExact);
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        throw TransferError(ErrorType::Permanent, fmt::format("Cannot prepare {}: {}", target.string(), e.what()));
    }

    // A previous attempt may have finished the file before failing
    if (plan.action == ResumePlan::Action::Skip)
    {
        return TransferResult{TransferStatus::Completed, 0, plan.localSize, file.size};
    }

    NegotiatedTransfer transfer = negotiator_.open(file.url, plan);
    if (transfer.complete)
    {
        return TransferResult{TransferStatus::Completed, 0, transfer.startOffset, transfer.expectedTotal};
    }
    if (transfer.expectedTotal)
    {
        checkDiskSpace(target, *transfer.expectedTotal - transfer.startOffset);
    }

    TransferResult result;
    try
    {
        result = loop_.run(*transfer.stream, target, transfer.startOffset, transfer.expectedTotal, file.name);
    }
    catch (const TransferError &)
    {
        bytesDownloaded += loop_.bytesWritten();
        throw;
    }
    bytesDownloaded += result.bytesWritten;
    return result;
}

// Check if there's enough disk space for the remaining bytes
void Downloader::checkDiskSpace(const std::filesystem::path &target, std::int64_t requiredBytes) const
{
    if (requiredBytes <= 0)
    {
        return;
    }

    try
    {
        auto directory = target.parent_path();
        if (directory.empty())
        {
            directory = ".";
        }

        // Add 10% buffer to be safe (some filesystems reserve space)
        auto spaceInfo = std::filesystem::space(directory);
        auto requiredWithBuffer = static_cast<std::uintmax_t>(requiredBytes + requiredBytes / 10);

        if (spaceInfo.available < requiredWithBuffer)
        {
            throw TransferError(ErrorType::Permanent,
                                fmt::format("Insufficient disk space: need {} (+ 10% buffer) but only {} available",
                                            formatBytes(static_cast<double>(requiredBytes)),
                                            formatBytes(static_cast<double>(spaceInfo.available))));
        }
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        // Some filesystems don't support space queries
        spdlog::warn("Unable to check disk space: {}", e.what());
    }
}
