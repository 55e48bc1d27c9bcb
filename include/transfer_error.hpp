#pragma once

#include <stdexcept>
#include <string>

/**
 * Error classification for retry logic.
 * Transient errors are temporary (network issues, overloaded server) and worth retrying.
 * Permanent errors are unrecoverable (404, disk full) and fail the file immediately.
 */
enum class ErrorType
{
    Transient, // Temporary failure - retry might succeed
    Permanent, // Permanent failure - retrying won't help
    Unknown    // Uncertain - treat conservatively as transient
};

const char *toString(ErrorType type);

/**
 * Raised by the transport and the transfer loop for a failed transfer attempt.
 */
class TransferError : public std::runtime_error
{
public:
    TransferError(ErrorType type, const std::string &message, long httpStatus = 0)
        : std::runtime_error(message), type_(type), httpStatus_(httpStatus)
    {
    }

    ErrorType type() const { return type_; }
    long httpStatus() const { return httpStatus_; }

    bool isRetryable() const { return type_ != ErrorType::Permanent; }

private:
    ErrorType type_;
    long httpStatus_;
};

/**
 * Raised when a configuration record cannot be used for a sync pass.
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * Classify an HTTP status code.
 * 5xx, 408 and 429 are transient, every other 4xx is permanent.
 */
ErrorType classifyHttpStatus(long status);

/**
 * Get human-readable HTTP status text for a status code.
 */
std::string httpStatusText(long status);
