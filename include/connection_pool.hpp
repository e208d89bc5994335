#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>

#include "protocol.hpp"

/**
 * Options applied to every libcurl handle handed out by the pool.
 */
struct CurlOptions
{
    long connectTimeoutSeconds = 30;
    long lowSpeedTimeSeconds = 60; // Abort if below 1 byte/s for this long
    std::string userAgent = "manifetch/1.0";
    std::string ftpUser;           // Empty: anonymous login
};

/**
 * Reusable libcurl easy handles, one per (protocol, host).
 *
 * Handles are created on first use and live as long as the pool. All of them
 * share one connection cache (a libcurl share handle), and acquire() resets a
 * handle's options without closing its connections, so an FTP control
 * connection or an HTTP keep-alive socket survives from one request to the
 * next, including across manifest entries. Not thread-safe: a batch runs on
 * one thread.
 */
class ConnectionPool
{
public:
    /**
     * @throws TransportError if libcurl cannot allocate the share handle
     */
    explicit ConnectionPool(CurlOptions options = {});

    ConnectionPool(const ConnectionPool &) = delete;
    ConnectionPool &operator=(const ConnectionPool &) = delete;

    /**
     * Get the handle for (protocol, host), reset and configured with the
     * common options.
     *
     * @throws TransportError if libcurl cannot allocate a handle
     */
    CURL *acquire(Protocol protocol, const std::string &host);

    size_t size() const { return handles_.size(); }

    const CurlOptions &options() const { return options_; }

private:
    using HandlePtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using SharePtr = std::unique_ptr<CURLSH, decltype(&curl_share_cleanup)>;

    void applyCommonOptions(CURL *handle, Protocol protocol) const;

    CurlOptions options_;

    // Declared before handles_: easy handles must be cleaned up first
    SharePtr share_;
    std::map<std::pair<Protocol, std::string>, HandlePtr> handles_;
};

/**
 * Issue a header-only request (HTTP HEAD, FTP SIZE) for `url` on `handle`.
 *
 * @return Announced content length, or 0 if the server does not report one
 * @throws TransportError if the request fails or the object does not exist
 */
std::uint64_t queryContentLength(CURL *handle, const std::string &url);
