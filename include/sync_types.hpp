#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * A file advertised by the remote directory listing.
 * Immutable for the duration of a sync pass.
 */
struct RemoteFile
{
    std::string name;                 // Local filename (percent-decoded)
    std::string url;                  // Absolute URL of the resource
    std::optional<std::int64_t> size; // Advertised size, if any
    bool sizeExact = true;            // false when the listing rounded it ("176M")
    std::string lastModified;
};

/**
 * Lifecycle of one logical file transfer.
 */
enum class TransferState
{
    NotStarted,
    InProgress,
    Paused,    // Interrupted by the user, resumable from `offset`
    Completed,
    Failed     // Terminal, see `reason`
};

const char *toString(TransferState state);

/**
 * Per-file result collected by the sync orchestrator.
 */
struct FileOutcome
{
    std::string name;
    TransferState state = TransferState::NotStarted;
    bool alreadyPresent = false;    // Completed without any transfer
    std::int64_t offset = 0;        // Local length when the outcome was recorded
    std::int64_t bytesDownloaded = 0;
    int attempts = 0;
    std::string reason;             // Failure reason
};
