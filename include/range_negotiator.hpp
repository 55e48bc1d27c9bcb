#pragma once

#include "http_source.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

/**
 * What to do with a target file before the next transfer attempt.
 * The partial file's length on disk is the only resumption checkpoint.
 */
struct ResumePlan
{
    enum class Action
    {
        Download, // Request bytes [startOffset, end)
        Skip      // Local copy already complete
    };

    Action action = Action::Download;
    std::int64_t startOffset = 0;
    std::int64_t localSize = 0; // Length found on disk (0 if absent)
};

/**
 * An opened response positioned at the byte the local file continues from.
 */
struct NegotiatedTransfer
{
    std::unique_ptr<ResponseStream> stream;
    std::int64_t startOffset = 0;              // Write position; 0 means truncate
    std::optional<std::int64_t> expectedTotal; // Full resource size, if the server advertised it
    bool restarted = false;                    // A requested resume fell back to a full download
    bool complete = false;                     // Server confirmed the local file is whole, no stream
};

/**
 * Decides where a transfer starts and validates the server's answer to a
 * range request.
 */
class RangeNegotiator
{
public:
    explicit RangeNegotiator(HttpSource &source);

    /**
     * Inspect the local file.
     * - no file: download from 0
     * - remote size unknown: download from 0 (partial bytes are not trusted)
     * - local length >= exact remote size: skip (an empty file of size 0 included)
     * - otherwise: resume from the local length; with a rounded remote size this
     *   happens even past it, and open() learns the real size from the server
     *
     * @throws std::filesystem::filesystem_error if the file cannot be inspected
     */
    ResumePlan plan(const std::filesystem::path &target, std::optional<std::int64_t> remoteSize,
                    bool sizeExact = true) const;

    /**
     * Open `url` according to `plan`. A server that ignores the range
     * (200 instead of 206), rejects it (416) or answers with a different range
     * is handled by restarting from offset 0. A 416 whose total equals the
     * local length means the file is already whole: `complete` is set and no
     * stream is returned.
     *
     * @throws TransferError for HTTP error statuses and malformed responses
     */
    NegotiatedTransfer open(const std::string &url, const ResumePlan &plan) const;

private:
    NegotiatedTransfer openFull(const std::string &url) const;

    HttpSource &source_;
};
