#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <curl/curl.h>

#include "connection_pool.hpp"
#include "transport.hpp"

/**
 * Blocking pull interface over a libcurl transfer.
 *
 * libcurl pushes received data into a write callback in pieces of whatever
 * size the network delivers. CurlStream drives the transfer through a multi
 * handle only until the caller's requested amount is buffered, pausing the
 * transfer once the buffer is full, so at most one request plus one network
 * piece (CURL_MAX_WRITE_SIZE) is held in memory.
 *
 * The transfer starts lazily on the first read(), on a handle acquired from
 * the pool at that moment. From then until the stream is destroyed the
 * handle belongs to the stream.
 */
class CurlStream
{
public:
    CurlStream(ConnectionPool &pool, Protocol protocol, std::string host,
               std::string url, std::uint64_t offset);
    ~CurlStream();

    CurlStream(const CurlStream &) = delete;
    CurlStream &operator=(const CurlStream &) = delete;

    /**
     * Block until `count` bytes are available or the transfer ends.
     *
     * If the server refuses to resume before sending anything (HTTP 200 to a
     * range request, FTP REST rejected), the transfer restarts at offset 0
     * and startOffset() reports it. If it answers that nothing lies past the
     * offset (HTTP 416), the transfer simply ends.
     *
     * @return Up to `count` bytes; empty at end of transfer
     * @throws TransportError when the transfer fails and no buffered data is left
     */
    std::string read(size_t count);

    std::uint64_t startOffset() const { return offset_; }

private:
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    void start();
    void stop();
    void pump();
    bool cannotResume() const;
    bool nothingPastOffset() const;

    ConnectionPool &pool_;
    Protocol protocol_;
    std::string host_;
    std::string url_;
    std::uint64_t offset_;

    std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)> multi_;
    CURL *easy_ = nullptr;

    std::string buffer_;
    size_t wanted_ = 0;
    std::uint64_t delivered_ = 0;
    bool paused_ = false;
    bool done_ = false;
    CURLcode result_ = CURLE_OK;
    long responseCode_ = 0;
};

/**
 * TransferHandle backed by a CurlStream (BulkHTTP and FTP).
 */
class StreamTransferHandle : public TransferHandle
{
public:
    explicit StreamTransferHandle(std::unique_ptr<CurlStream> stream) : stream_(std::move(stream)) {}

    std::string readChunk(size_t blockSize) override { return stream_->read(blockSize); }

    std::uint64_t startOffset() const override { return stream_->startOffset(); }

private:
    std::unique_ptr<CurlStream> stream_;
};
