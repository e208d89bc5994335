#include "object_storage_transport.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "logger.hpp"

namespace
{

// One shared handle for every bucket
const std::string kSharedKey;

size_t appendToString(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *body = static_cast<std::string *>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

/**
 * Fetches [position, objectSize) one "Range: bytes=a-b" request at a time.
 */
class RangeTransferHandle : public TransferHandle
{
public:
    RangeTransferHandle(ConnectionPool &pool, std::string url,
                        std::uint64_t offset, std::uint64_t objectSize)
        : pool_(pool), url_(std::move(url)), offset_(offset), position_(offset), objectSize_(objectSize)
    {
    }

    std::string readChunk(size_t blockSize) override
    {
        if (position_ >= objectSize_ || blockSize == 0)
        {
            return {};
        }

        // Range ends are inclusive
        std::uint64_t last = std::min<std::uint64_t>(position_ + blockSize, objectSize_) - 1;
        std::string range = fmt::format("{}-{}", position_, last);

        CURL *handle = pool_.acquire(Protocol::ObjectStorage, kSharedKey);
        std::string body;
        curl_easy_setopt(handle, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(handle, CURLOPT_RANGE, range.c_str());
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, appendToString);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &body);

        CURLcode res = curl_easy_perform(handle);
        if (res != CURLE_OK)
        {
            throw TransportError(fmt::format("{} [{}]: {}", url_, range, curl_easy_strerror(res)));
        }

        std::uint64_t expected = last - position_ + 1;
        if (body.size() != expected)
        {
            throw TransportError(fmt::format("{} [{}]: expected {} bytes, got {}",
                                             url_, range, expected, body.size()));
        }

        position_ += body.size();
        return body;
    }

    std::uint64_t startOffset() const override { return offset_; }

private:
    ConnectionPool &pool_;
    std::string url_;
    std::uint64_t offset_;
    std::uint64_t position_;
    std::uint64_t objectSize_;
};

} // namespace

ObjectStorageTransport::ObjectStorageTransport(ConnectionPool &pool, std::string endpoint)
    : pool_(pool), endpoint_(std::move(endpoint))
{
}

std::string ObjectStorageTransport::httpsUrl(const Url &url) const
{
    // url.host is the bucket, url.path is "/key"
    if (endpoint_.find("://") == std::string::npos)
    {
        return fmt::format("https://{}.{}{}", url.host, endpoint_, url.path);
    }

    // Path-style addressing under a full base URL
    std::string base = endpoint_;
    while (!base.empty() && base.back() == '/')
    {
        base.pop_back();
    }
    return fmt::format("{}/{}{}", base, url.host, url.path);
}

std::unique_ptr<TransferHandle> ObjectStorageTransport::open(const Url &url, std::uint64_t resumeOffset)
{
    std::string target = httpsUrl(url);
    std::uint64_t objectSize = queryContentLength(pool_.acquire(Protocol::ObjectStorage, kSharedKey), target);
    logger::debug("Object {} -> {} ({} bytes)", url.text, target, objectSize);

    return std::make_unique<RangeTransferHandle>(pool_, target, resumeOffset, objectSize);
}

std::uint64_t ObjectStorageTransport::size(const Url &url)
{
    return queryContentLength(pool_.acquire(Protocol::ObjectStorage, kSharedKey), httpsUrl(url));
}
