#include "http_transport.hpp"

#include "curl_stream.hpp"
#include "logger.hpp"

std::unique_ptr<TransferHandle> HttpTransport::open(const Url &url, std::uint64_t resumeOffset)
{
    // HEAD first so a dead host or a 404 fails here and the next candidate gets a turn
    queryContentLength(pool_.acquire(Protocol::Http, url.host), url.text);

    if (resumeOffset > 0)
    {
        logger::info("Resuming {} from byte {}", url.text, resumeOffset);
    }

    auto stream = std::make_unique<CurlStream>(pool_, Protocol::Http, url.host, url.text, resumeOffset);
    return std::make_unique<StreamTransferHandle>(std::move(stream));
}

std::uint64_t HttpTransport::size(const Url &url)
{
    return queryContentLength(pool_.acquire(Protocol::Http, url.host), url.text);
}
