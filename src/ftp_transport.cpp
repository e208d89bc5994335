#include "ftp_transport.hpp"

#include "curl_stream.hpp"
#include "logger.hpp"

std::unique_ptr<TransferHandle> FtpTransport::open(const Url &url, std::uint64_t resumeOffset)
{
    // SIZE fails with "remote file not found" when there is nothing to fetch
    std::uint64_t remoteSize = queryContentLength(pool_.acquire(Protocol::Ftp, url.host), url.text);
    logger::debug("FTP {} has {} bytes, restarting at {}", url.text, remoteSize, resumeOffset);

    auto stream = std::make_unique<CurlStream>(pool_, Protocol::Ftp, url.host, url.text, resumeOffset);
    return std::make_unique<StreamTransferHandle>(std::move(stream));
}

std::uint64_t FtpTransport::size(const Url &url)
{
    return queryContentLength(pool_.acquire(Protocol::Ftp, url.host), url.text);
}
