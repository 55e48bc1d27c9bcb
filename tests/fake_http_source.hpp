#pragma once

#include "cancellation.hpp"
#include "http_source.hpp"
#include "transfer_error.hpp"

#include <algorithm>
#include <cstring>
#include <deque>
#include <map>
#include <string>
#include <vector>

#include <fmt/core.h>

/**
 * How the fake server answers for one URL.
 */
struct FakeResource
{
    std::string body;
    bool honorRanges = true;              // false: answer 200 with the whole body
    bool advertiseLength = true;          // false: no Content-Length / "*" total
    long rangeStatus = 0;                 // Non-zero: answer range requests with this status (416 sends the total)
    std::int64_t rangeShift = 0;          // Added to Content-Range first (mismatched 206)
    std::deque<long> failStatuses;        // Consumed one per open(), returned before the body
    std::int64_t dropAfterBytes = -1;     // Connection drops once this absolute offset is reached
    int drops = 1;                        // How many opens drop the connection
    std::int64_t cancelAfterBytes = -1;   // Request cancellation once this absolute offset is served
    CancellationToken *token = nullptr;
    std::size_t pieceSize = 1000;         // Bytes handed out per read()
};

/**
 * In-memory HttpSource. Records every request.
 */
class FakeHttpSource : public HttpSource
{
public:
    struct Request
    {
        std::string url;
        std::int64_t startOffset = 0;
    };

    FakeResource &add(const std::string &url, const std::string &body)
    {
        FakeResource &resource = resources_[url];
        resource.body = body;
        return resource;
    }

    FakeResource &resource(const std::string &url) { return resources_.at(url); }

    const std::vector<Request> &requests() const { return requests_; }

    std::size_t opensFor(const std::string &url) const
    {
        return static_cast<std::size_t>(std::count_if(requests_.begin(), requests_.end(),
                                                      [&](const Request &r) { return r.url == url; }));
    }

    std::unique_ptr<ResponseStream> open(const std::string &url, std::int64_t startOffset) override
    {
        requests_.push_back(Request{url, startOffset});

        auto found = resources_.find(url);
        if (found == resources_.end())
        {
            ResponseInfo info;
            info.status = 404;
            return std::make_unique<Stream>(info, "", 0, nullptr);
        }

        FakeResource &resource = found->second;
        const auto size = static_cast<std::int64_t>(resource.body.size());

        if (!resource.failStatuses.empty())
        {
            ResponseInfo info;
            info.status = resource.failStatuses.front();
            resource.failStatuses.pop_front();
            return std::make_unique<Stream>(info, "", 0, nullptr);
        }

        ResponseInfo info;
        info.acceptRanges = resource.honorRanges;
        std::int64_t first = 0;

        if (startOffset > 0 && resource.rangeStatus != 0)
        {
            info.status = resource.rangeStatus;
            if (info.status == 416 && resource.advertiseLength)
            {
                info.unsatisfiedTotal = size;
            }
            return std::make_unique<Stream>(info, "", 0, nullptr);
        }

        // Nothing left past the end: "416, Content-Range: bytes */size"
        if (startOffset >= size && startOffset > 0 && resource.honorRanges)
        {
            info.status = 416;
            if (resource.advertiseLength)
            {
                info.unsatisfiedTotal = size;
            }
            return std::make_unique<Stream>(info, "", 0, nullptr);
        }

        if (startOffset > 0 && resource.honorRanges)
        {
            first = std::min(startOffset, size);
            info.status = 206;
            ContentRange range;
            range.first = first + resource.rangeShift;
            range.last = size - 1;
            if (resource.advertiseLength)
            {
                range.total = size;
            }
            info.contentRange = range;
            if (resource.advertiseLength)
            {
                info.contentLength = size - first;
            }
        }
        else
        {
            info.status = 200;
            if (resource.advertiseLength)
            {
                info.contentLength = size;
            }
        }

        auto stream = std::make_unique<Stream>(info, resource.body, first, &resource);
        return stream;
    }

private:
    class Stream : public ResponseStream
    {
    public:
        Stream(ResponseInfo info, std::string body, std::int64_t first, FakeResource *resource)
            : info_(info), body_(std::move(body)), position_(first), resource_(resource)
        {
            if (resource_ && resource_->dropAfterBytes >= 0 && resource_->drops > 0 &&
                position_ < resource_->dropAfterBytes)
            {
                dropAt_ = resource_->dropAfterBytes;
                --resource_->drops;
            }
        }

        const ResponseInfo &info() const override { return info_; }

        std::size_t read(char *buffer, std::size_t maxBytes) override
        {
            const auto size = static_cast<std::int64_t>(body_.size());
            if (dropAt_ >= 0 && position_ >= dropAt_)
            {
                throw TransferError(ErrorType::Transient, fmt::format("connection reset at byte {}", position_));
            }
            if (position_ >= size)
            {
                return 0;
            }

            std::int64_t limit = size;
            if (dropAt_ >= 0)
            {
                limit = std::min(limit, dropAt_);
            }
            std::size_t piece = resource_ ? resource_->pieceSize : maxBytes;
            auto count = static_cast<std::size_t>(
                std::min<std::int64_t>({static_cast<std::int64_t>(maxBytes),
                                        static_cast<std::int64_t>(piece), limit - position_}));

            std::memcpy(buffer, body_.data() + position_, count);
            position_ += static_cast<std::int64_t>(count);

            if (resource_ && resource_->token && resource_->cancelAfterBytes >= 0 &&
                position_ >= resource_->cancelAfterBytes)
            {
                resource_->token->requestCancel();
            }
            return count;
        }

    private:
        ResponseInfo info_;
        std::string body_;
        std::int64_t position_;
        FakeResource *resource_;
        std::int64_t dropAt_ = -1;
    };

    std::map<std::string, FakeResource> resources_;
    std::vector<Request> requests_;
};
