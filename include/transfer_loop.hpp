#pragma once

#include "cancellation.hpp"
#include "http_source.hpp"
#include "progress_reporter.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

/**
 * How a transfer attempt ended without an error.
 */
enum class TransferStatus
{
    Completed,  // Response exhausted, size matches when known
    Interrupted // Cancellation observed at a chunk boundary
};

struct TransferResult
{
    TransferStatus status = TransferStatus::Completed;
    std::int64_t bytesWritten = 0; // Written during this attempt
    std::int64_t finalOffset = 0;  // Local file length after the attempt
    std::optional<std::int64_t> expectedTotal;
};

/**
 * Streams a response body to disk in fixed-size chunks.
 *
 * A chunk is filled completely from the network before it is written, so
 * the file only ever grows by whole chunks (the last one may be short at the
 * end of the body). Cancellation is checked after every chunk.
 */
class TransferLoop
{
public:
    TransferLoop(std::size_t chunkSize, const CancellationToken &token, ProgressSink &sink);

    /**
     * Write the body of `stream` to `target` starting at `startOffset`
     * (truncate when 0, append otherwise).
     *
     * @throws TransferError Transient if the body ends early or the connection fails,
     *         Permanent if the file cannot be written or the server sends too much
     */
    TransferResult run(ResponseStream &stream, const std::filesystem::path &target, std::int64_t startOffset,
                       std::optional<std::int64_t> expectedTotal, const std::string &label);

    /**
     * Bytes written by the last run(), also valid after it threw.
     */
    std::int64_t bytesWritten() const { return bytesWritten_; }

private:
    std::size_t chunkSize_;
    const CancellationToken &token_;
    ProgressSink &sink_;
    std::int64_t bytesWritten_ = 0;
};
