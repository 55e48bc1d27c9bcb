#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

/**
 * Parsed "Content-Range: bytes first-last/total" header.
 */
struct ContentRange
{
    std::int64_t first = 0;
    std::int64_t last = 0;
    std::optional<std::int64_t> total; // "*" means the server does not know
};

/**
 * Parse a Content-Range header value.
 * Example: "bytes 1000-49999/50000"
 *
 * @return nullopt if the value is not a satisfied byte range
 */
std::optional<ContentRange> parseContentRange(const std::string &value);

/**
 * Parse the unsatisfied Content-Range form (an asterisk in place of the range,
 * then "/total") that a server sends with 416 Range Not Satisfiable.
 *
 * @return the resource size, nullopt for any other value
 */
std::optional<std::int64_t> parseUnsatisfiedRange(const std::string &value);

/**
 * Status line and the headers that matter for resumption.
 */
struct ResponseInfo
{
    long status = 0;
    std::optional<std::int64_t> contentLength;
    std::optional<ContentRange> contentRange;
    std::optional<std::int64_t> unsatisfiedTotal; // From "Content-Range: bytes */N"
    bool acceptRanges = false;
};

/**
 * Body of an HTTP response, pulled by the caller.
 */
class ResponseStream
{
public:
    virtual ~ResponseStream() = default;

    virtual const ResponseInfo &info() const = 0;

    /**
     * Read up to `maxBytes` of the body.
     *
     * @return number of bytes copied into `buffer`, 0 at the end of the body
     * @throws TransferError if the connection fails before the body ends
     */
    virtual std::size_t read(char *buffer, std::size_t maxBytes) = 0;
};

/**
 * Range-capable HTTP fetch.
 */
class HttpSource
{
public:
    virtual ~HttpSource() = default;

    /**
     * Issue a GET for `url`. When `startOffset` > 0 the request asks for
     * bytes [startOffset, end). Returns once the response headers arrived;
     * HTTP error statuses are returned, not thrown.
     *
     * @throws TransferError if no response could be obtained
     */
    virtual std::unique_ptr<ResponseStream> open(const std::string &url, std::int64_t startOffset) = 0;
};
