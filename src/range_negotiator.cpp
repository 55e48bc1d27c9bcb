#include "range_negotiator.hpp"

#include "transfer_error.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace
{

void throwForStatus(const std::string &url, long status)
{
    throw TransferError(classifyHttpStatus(status),
                        fmt::format("HTTP error {}: {} ({})", status, httpStatusText(status), url),
                        status);
}

// Size of the resource, or the end of this response when the server hides the total
std::int64_t rangeEnd(const ContentRange &range)
{
    return range.total ? *range.total : range.last + 1;
}

} // namespace

RangeNegotiator::RangeNegotiator(HttpSource &source) : source_(source)
{
}

ResumePlan RangeNegotiator::plan(const std::filesystem::path &target, std::optional<std::int64_t> remoteSize,
                                 bool sizeExact) const
{
    ResumePlan plan;
    if (!std::filesystem::exists(target))
    {
        return plan;
    }

    plan.localSize = static_cast<std::int64_t>(std::filesystem::file_size(target));

    if (!remoteSize)
    {
        if (plan.localSize > 0)
        {
            // No size to compare against: resuming could merge unrelated bytes
            spdlog::info("{}: remote size unknown, discarding {} local bytes and downloading again",
                         target.filename().string(), plan.localSize);
        }
        return plan;
    }

    if (sizeExact && plan.localSize >= *remoteSize)
    {
        plan.action = ResumePlan::Action::Skip;
        plan.startOffset = plan.localSize;
        return plan;
    }

    // A rounded size cannot prove completion: the server's answer to the range decides
    plan.startOffset = plan.localSize;
    return plan;
}

NegotiatedTransfer RangeNegotiator::open(const std::string &url, const ResumePlan &plan) const
{
    if (plan.startOffset <= 0)
    {
        return openFull(url);
    }

    spdlog::info("Resuming download from byte {}", plan.startOffset);

    NegotiatedTransfer transfer;
    transfer.stream = source_.open(url, plan.startOffset);
    const ResponseInfo &info = transfer.stream->info();

    if (info.status == 206)
    {
        if (info.contentRange && info.contentRange->first == plan.startOffset)
        {
            transfer.startOffset = plan.startOffset;
            transfer.expectedTotal = rangeEnd(*info.contentRange);
            return transfer;
        }

        spdlog::warn("Server answered the range request for {} with a different range, "
                     "starting from beginning",
                     url);
        transfer.stream.reset();
        NegotiatedTransfer full = openFull(url);
        full.restarted = true;
        return full;
    }

    if (info.status == 200)
    {
        // Server sent the ENTIRE file, ignoring our Range header
        if (info.acceptRanges)
        {
            spdlog::warn("Server ignored the range request, starting from beginning");
        }
        else
        {
            spdlog::warn("Server doesn't support range requests, starting from beginning");
        }
        transfer.startOffset = 0;
        transfer.expectedTotal = info.contentLength;
        transfer.restarted = true;
        return transfer;
    }

    if (info.status == 416)
    {
        if (info.unsatisfiedTotal && *info.unsatisfiedTotal == plan.startOffset)
        {
            spdlog::info("Local copy already has all {} bytes", plan.startOffset);
            transfer.stream.reset();
            transfer.startOffset = plan.startOffset;
            transfer.expectedTotal = info.unsatisfiedTotal;
            transfer.complete = true;
            return transfer;
        }

        spdlog::warn("Server rejected range starting at byte {}, starting from beginning", plan.startOffset);
        transfer.stream.reset();
        NegotiatedTransfer full = openFull(url);
        full.restarted = true;
        return full;
    }

    throwForStatus(url, info.status);
    return transfer; // Not reached
}

NegotiatedTransfer RangeNegotiator::openFull(const std::string &url) const
{
    NegotiatedTransfer transfer;
    transfer.stream = source_.open(url, 0);
    const ResponseInfo &info = transfer.stream->info();

    if (info.status == 200)
    {
        transfer.expectedTotal = info.contentLength;
        return transfer;
    }

    // Unrequested partial content is only usable when it starts at byte 0
    if (info.status == 206 && info.contentRange && info.contentRange->first == 0)
    {
        transfer.expectedTotal = rangeEnd(*info.contentRange);
        return transfer;
    }

    if (info.status >= 400)
    {
        throwForStatus(url, info.status);
    }

    throw TransferError(ErrorType::Permanent,
                        fmt::format("Unexpected response {} ({}) for {}", info.status,
                                    httpStatusText(info.status), url),
                        info.status);
}
