#pragma once

#include "http_source.hpp"
#include "transfer_error.hpp"

#include <curl/curl.h>
#include <memory>
#include <string>

/**
 * Connection settings shared by every request of a sync pass.
 */
struct HttpOptions
{
    std::string username;
    std::string password;
    long connectTimeoutSeconds = 10;
    long readTimeoutSeconds = 30; // No byte received for this long = timeout
    std::string userAgent = "FileSynchronizer/1.0";
};

/**
 * HTTP client for range requests using libcurl.
 * Uses RAII to manage CURL handle lifecycle: the handle configured here is
 * duplicated for every request, each response owns its own handles.
 */
class HttpClient : public HttpSource
{
public:
    explicit HttpClient(const HttpOptions &options);
    ~HttpClient() override;

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    std::unique_ptr<ResponseStream> open(const std::string &url, std::int64_t startOffset) override;

    /**
     * Classify a CURL error to determine if retry is appropriate.
     *
     * @param code CURL error code from failed operation
     * @param httpCode HTTP status code (0 if no HTTP response received)
     * @return ErrorType indicating whether to retry
     */
    static ErrorType classifyError(CURLcode code, long httpCode);

private:
    // CURL handle with custom deleter (RAII pattern), template for every request
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
};
