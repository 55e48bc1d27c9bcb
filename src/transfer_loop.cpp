#include "transfer_loop.hpp"

#include "format_utils.hpp"
#include "transfer_error.hpp"

#include <fstream>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace
{

/**
 * Append one chunk and push it to disk. On failure the file is cut back to
 * `offset` so no partial chunk survives.
 */
void writeChunk(std::ofstream &out, const std::filesystem::path &target, std::int64_t offset,
                const char *data, std::size_t size)
{
    out.write(data, static_cast<std::streamsize>(size));
    out.flush();
    if (out.good())
    {
        return;
    }

    out.close();
    std::error_code ec;
    std::filesystem::resize_file(target, static_cast<std::uintmax_t>(offset), ec);
    if (ec)
    {
        spdlog::error("Could not truncate {} back to byte {}: {}", target.string(), offset, ec.message());
    }
    throw TransferError(ErrorType::Permanent,
                        fmt::format("Disk write failed for {} at byte {} (disk full or not writable)",
                                    target.string(), offset));
}

} // namespace

TransferLoop::TransferLoop(std::size_t chunkSize, const CancellationToken &token, ProgressSink &sink)
    : chunkSize_(chunkSize), token_(token), sink_(sink)
{
}

TransferResult TransferLoop::run(ResponseStream &stream, const std::filesystem::path &target,
                                 std::int64_t startOffset, std::optional<std::int64_t> expectedTotal,
                                 const std::string &label)
{
    bytesWritten_ = 0;

    // If resuming (startOffset > 0), open in APPEND mode to continue writing
    // If starting fresh (startOffset == 0), open in TRUNCATE mode
    std::ios::openmode fileMode = std::ios::binary;
    fileMode |= startOffset > 0 ? std::ios::app : std::ios::trunc;

    std::ofstream outFile(target, fileMode);
    if (!outFile)
    {
        throw TransferError(ErrorType::Permanent, fmt::format("Cannot open file for writing: {}", target.string()));
    }

    std::vector<char> chunk(chunkSize_);
    std::int64_t offset = startOffset;
    sink_.onStart(label, startOffset, expectedTotal);

    while (true)
    {
        // Fill a whole chunk unless the body ends first; a read error drops the unfinished chunk
        std::size_t filled = 0;
        bool endOfBody = false;
        while (filled < chunkSize_)
        {
            std::size_t count = stream.read(chunk.data() + filled, chunkSize_ - filled);
            if (count == 0)
            {
                endOfBody = true;
                break;
            }
            filled += count;
        }

        if (filled > 0)
        {
            auto size = static_cast<std::int64_t>(filled);
            if (expectedTotal && offset + size > *expectedTotal)
            {
                throw TransferError(ErrorType::Permanent,
                                    fmt::format("Server sent more than the advertised {} bytes for {}",
                                                *expectedTotal, label));
            }

            writeChunk(outFile, target, offset, chunk.data(), filled);
            offset += size;
            bytesWritten_ += size;
            sink_.onSample(ProgressSample{offset, std::chrono::steady_clock::now()});
        }

        if (endOfBody)
        {
            break;
        }

        if (token_.isCancelled())
        {
            outFile.close();
            spdlog::warn("Download of {} interrupted at {}", label, formatBytes(static_cast<double>(offset)));
            sink_.onFinish(TransferState::Paused);
            return TransferResult{TransferStatus::Interrupted, bytesWritten_, offset, expectedTotal};
        }
    }

    outFile.close();

    if (expectedTotal && offset != *expectedTotal)
    {
        throw TransferError(ErrorType::Transient,
                            fmt::format("Connection closed early: received {} of {} bytes for {}", offset,
                                        *expectedTotal, label));
    }

    sink_.onFinish(TransferState::Completed);
    return TransferResult{TransferStatus::Completed, bytesWritten_, offset, expectedTotal};
}
