#include "http_client.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <string>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace
{

// Upper bound on body bytes held in memory before libcurl is paused
constexpr std::size_t kMaxBufferedBytes = 256 * 1024;
constexpr int kPollTimeoutMs = 500;

std::string trim(const std::string &text)
{
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
    {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isRedirect(long status)
{
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

/**
 * Response body pulled from a libcurl multi handle.
 * The easy handle is driven with curl_multi_perform() only when the caller
 * needs more bytes, so the reader sets the pace of the transfer.
 */
class CurlResponseStream : public ResponseStream
{
public:
    using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    CurlResponseStream(EasyHandle easy, const std::string &url, std::int64_t startOffset)
        : easy_(std::move(easy)), multi_(curl_multi_init(), curl_multi_cleanup), url_(url)
    {
        if (!multi_)
        {
            throw TransferError(ErrorType::Permanent, "Failed to initialize CURL multi handle");
        }

        CURL *handle = easy_.get();
        curl_easy_setopt(handle, CURLOPT_URL, url_.c_str());

        // Format: "N-" means "from byte N to end of file"
        if (startOffset > 0)
        {
            std::string range = fmt::format("{}-", startOffset);
            curl_easy_setopt(handle, CURLOPT_RANGE, range.c_str());
        }

        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, this);
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, this);

        CURLMcode mc = curl_multi_add_handle(multi_.get(), handle);
        if (mc != CURLM_OK)
        {
            throw TransferError(ErrorType::Permanent,
                                fmt::format("Failed to start request: {}", curl_multi_strerror(mc)));
        }
    }

    ~CurlResponseStream() override
    {
        curl_multi_remove_handle(multi_.get(), easy_.get());
    }

    const ResponseInfo &info() const override { return info_; }

    /**
     * Drive the transfer until the final response headers arrived.
     */
    void waitForHeaders()
    {
        while (!headersDone_ && !done_)
        {
            pump();
            if (!headersDone_ && !done_)
            {
                waitForActivity();
            }
        }

        if (info_.status == 0)
        {
            long code = 0;
            curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &code);
            info_.status = code;
        }

        // A connection that failed before any header arrived has no response to report
        if (done_ && !headersDone_)
        {
            raiseIfFailed();
        }
    }

    std::size_t read(char *buffer, std::size_t maxBytes) override
    {
        while (available() == 0 && !done_)
        {
            resume();
            pump();
            if (available() == 0 && !done_)
            {
                waitForActivity();
            }
        }

        if (available() == 0)
        {
            raiseIfFailed();
            return 0; // End of body
        }

        std::size_t count = std::min(maxBytes, available());
        std::memcpy(buffer, buffer_.data() + readPos_, count);
        readPos_ += count;

        if (readPos_ == buffer_.size())
        {
            buffer_.clear();
            readPos_ = 0;
        }
        else if (readPos_ >= kMaxBufferedBytes)
        {
            buffer_.erase(0, readPos_);
            readPos_ = 0;
        }

        if (available() < kMaxBufferedBytes / 2)
        {
            resume();
        }
        return count;
    }

private:
    std::size_t available() const { return buffer_.size() - readPos_; }

    void resume()
    {
        if (paused_)
        {
            paused_ = false;
            curl_easy_pause(easy_.get(), CURLPAUSE_CONT);
        }
    }

    void pump()
    {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_.get(), &running);
        if (mc != CURLM_OK)
        {
            throw TransferError(ErrorType::Unknown,
                                fmt::format("curl_multi_perform failed: {}", curl_multi_strerror(mc)));
        }

        int queued = 0;
        while (CURLMsg *message = curl_multi_info_read(multi_.get(), &queued))
        {
            if (message->msg == CURLMSG_DONE)
            {
                done_ = true;
                result_ = message->data.result;
            }
        }

        if (running == 0)
        {
            done_ = true;
        }
    }

    void waitForActivity()
    {
        CURLMcode mc = curl_multi_poll(multi_.get(), nullptr, 0, kPollTimeoutMs, nullptr);
        if (mc != CURLM_OK)
        {
            throw TransferError(ErrorType::Unknown,
                                fmt::format("curl_multi_poll failed: {}", curl_multi_strerror(mc)));
        }
    }

    void raiseIfFailed() const
    {
        if (result_ == CURLE_OK)
        {
            return;
        }
        throw TransferError(HttpClient::classifyError(result_, info_.status),
                            fmt::format("{}: {}", url_, curl_easy_strerror(result_)),
                            info_.status);
    }

    // Static callback: libcurl calls this once per header line
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
    {
        size_t totalSize = size * nitems;
        auto *self = static_cast<CurlResponseStream *>(userdata);
        std::string line = trim(std::string(buffer, totalSize));

        // New status line: interim (1xx) or redirect responses are superseded
        if (line.rfind("HTTP/", 0) == 0)
        {
            self->info_ = ResponseInfo{};
            self->headersDone_ = false;
            auto space = line.find(' ');
            if (space != std::string::npos)
            {
                self->info_.status = std::strtol(line.c_str() + space + 1, nullptr, 10);
            }
            return totalSize;
        }

        if (line.empty())
        {
            if (self->info_.status >= 200 && !isRedirect(self->info_.status))
            {
                self->headersDone_ = true;
            }
            return totalSize;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos)
        {
            return totalSize;
        }
        std::string name = toLower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (name == "content-length")
        {
            char *end = nullptr;
            long long length = std::strtoll(value.c_str(), &end, 10);
            if (end != value.c_str() && *end == '\0' && length >= 0)
            {
                self->info_.contentLength = static_cast<std::int64_t>(length);
            }
        }
        else if (name == "content-range")
        {
            self->info_.contentRange = parseContentRange(value);
            self->info_.unsatisfiedTotal = parseUnsatisfiedRange(value);
        }
        else if (name == "accept-ranges")
        {
            self->info_.acceptRanges = toLower(value) == "bytes";
        }
        return totalSize;
    }

    // Static callback: libcurl calls this with chunks of downloaded data
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
    {
        size_t totalSize = size * nmemb;
        auto *self = static_cast<CurlResponseStream *>(userdata);
        self->headersDone_ = true;

        // Reader is behind: libcurl keeps this data and delivers it again after unpausing
        if (self->available() >= kMaxBufferedBytes)
        {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }

        self->buffer_.append(ptr, totalSize);
        return totalSize;
    }

    EasyHandle easy_;
    std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)> multi_;
    std::string url_;
    ResponseInfo info_;
    bool headersDone_ = false;
    bool done_ = false;
    bool paused_ = false;
    CURLcode result_ = CURLE_OK;
    std::string buffer_;
    std::size_t readPos_ = 0;
};

} // namespace

HttpClient::HttpClient(const HttpOptions &options) : curl_(curl_easy_init(), curl_easy_cleanup)
{
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialize CURL (out of memory or library error)");
    }

    CURL *handle = curl_.get();

    // Set a user-agent (some servers block requests without one)
    curl_easy_setopt(handle, CURLOPT_USERAGENT, options.userAgent.c_str());

    // HTTPS settings (CRITICAL for security)
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L); // Verify server certificate
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L); // Verify hostname matches cert

    // Follow HTTP redirects, limit the chain
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);

    // Basic credentials
    if (!options.username.empty())
    {
        curl_easy_setopt(handle, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
        curl_easy_setopt(handle, CURLOPT_USERNAME, options.username.c_str());
        curl_easy_setopt(handle, CURLOPT_PASSWORD, options.password.c_str());
    }

    // Connect timeout, and a stall timeout instead of a total one: large files take long
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, options.connectTimeoutSeconds);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, options.readTimeoutSeconds);

    // Signals belong to the cancellation handler, not to DNS timeouts
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

std::unique_ptr<ResponseStream> HttpClient::open(const std::string &url, std::int64_t startOffset)
{
    CurlResponseStream::EasyHandle handle(curl_easy_duphandle(curl_.get()), curl_easy_cleanup);
    if (!handle)
    {
        throw TransferError(ErrorType::Unknown, "Failed to duplicate CURL handle");
    }

    spdlog::debug("GET {} (from byte {})", url, startOffset);

    auto stream = std::make_unique<CurlResponseStream>(std::move(handle), url, startOffset);
    stream->waitForHeaders();
    return stream;
}

// Classify error for retry logic
ErrorType HttpClient::classifyError(CURLcode code, long httpCode)
{
    // First, check CURL-level errors (network, DNS, etc.)
    switch (code)
    {
    // Transient network errors - worth retrying
    case CURLE_OPERATION_TIMEDOUT:   // Server didn't respond in time, or the transfer stalled
    case CURLE_COULDNT_RESOLVE_HOST: // DNS lookup failed (might be temporary)
    case CURLE_COULDNT_CONNECT:      // Connection refused (server might be restarting)
    case CURLE_PARTIAL_FILE:         // Transfer ended early (network interruption)
    case CURLE_RECV_ERROR:           // Error receiving data (network glitch)
    case CURLE_SEND_ERROR:           // Error sending data (network glitch)
    case CURLE_GOT_NOTHING:          // Server sent no data (might be overloaded)
        return ErrorType::Transient;

    // Permanent errors - retrying won't help
    case CURLE_URL_MALFORMAT:             // Invalid URL syntax
    case CURLE_UNSUPPORTED_PROTOCOL:      // Protocol not supported
    case CURLE_OUT_OF_MEMORY:             // System resource exhaustion
    case CURLE_SSL_CERTPROBLEM:           // SSL client certificate invalid
    case CURLE_SSL_CIPHER:                // SSL cipher negotiation failed
    case CURLE_PEER_FAILED_VERIFICATION:  // Server certificate rejected
    case CURLE_LOGIN_DENIED:              // Credentials rejected
    case CURLE_TOO_MANY_REDIRECTS:        // Redirect loop
    case CURLE_WRITE_ERROR:               // Local write failed
        return ErrorType::Permanent;

    // No CURL error - check HTTP status code
    case CURLE_OK:
        return classifyHttpStatus(httpCode);

    // Unknown CURL error - be conservative and retry
    default:
        return ErrorType::Unknown;
    }
}
