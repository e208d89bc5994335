#include "connection_pool.hpp"

#include <fmt/core.h>

#include "logger.hpp"
#include "transport.hpp"

ConnectionPool::ConnectionPool(CurlOptions options)
    : options_(std::move(options)), share_(curl_share_init(), curl_share_cleanup)
{
    if (!share_)
    {
        throw TransportError("Failed to initialize CURL share handle");
    }

    curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(share_.get(), CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
}

CURL *ConnectionPool::acquire(Protocol protocol, const std::string &host)
{
    auto key = std::make_pair(protocol, host);
    auto it = handles_.find(key);
    if (it == handles_.end())
    {
        HandlePtr handle(curl_easy_init(), curl_easy_cleanup);
        if (!handle)
        {
            throw TransportError("Failed to initialize CURL (out of memory or library error)");
        }
        logger::debug("Opening {} connection handle for '{}'", protocolName(protocol), host);
        it = handles_.emplace(key, std::move(handle)).first;
    }

    CURL *handle = it->second.get();

    // Reset clears options from the previous use but keeps live connections
    curl_easy_reset(handle);
    applyCommonOptions(handle, protocol);
    return handle;
}

void ConnectionPool::applyCommonOptions(CURL *handle, Protocol protocol) const
{
    curl_easy_setopt(handle, CURLOPT_SHARE, share_.get());

    // Set a user-agent (some servers block requests without one)
    curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.userAgent.c_str());

    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);

    // 4xx/5xx must surface as errors, not as an error page written to disk
    curl_easy_setopt(handle, CURLOPT_FAILONERROR, 1L);

    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSeconds);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, options_.lowSpeedTimeSeconds);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    if (protocol == Protocol::Ftp)
    {
        // Stay in the login directory so the control connection is reusable for any path
        curl_easy_setopt(handle, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_NOCWD));
        if (!options_.ftpUser.empty())
        {
            curl_easy_setopt(handle, CURLOPT_USERNAME, options_.ftpUser.c_str());
        }
    }
}

std::uint64_t queryContentLength(CURL *handle, const std::string &url)
{
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);

    CURLcode res = curl_easy_perform(handle);
    if (res != CURLE_OK)
    {
        throw TransportError(fmt::format("{}: {}", url, curl_easy_strerror(res)));
    }

    curl_off_t contentLength = -1;
    curl_easy_getinfo(handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);

    // Restore a normal transfer for whoever uses the handle next
    curl_easy_setopt(handle, CURLOPT_NOBODY, 0L);

    return contentLength > 0 ? static_cast<std::uint64_t>(contentLength) : 0;
}
