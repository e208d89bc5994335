#pragma once

#include "connection_pool.hpp"
#include "transport.hpp"

/**
 * Bulk HTTP/HTTPS transport.
 * open() checks the object with a HEAD request and returns a ranged stream
 * ("Range: bytes=N-") that starts on the first read.
 */
class HttpTransport : public ProtocolTransport
{
public:
    explicit HttpTransport(ConnectionPool &pool) : pool_(pool) {}

    Protocol protocol() const override { return Protocol::Http; }

    std::unique_ptr<TransferHandle> open(const Url &url, std::uint64_t resumeOffset) override;

    std::uint64_t size(const Url &url) override;

private:
    ConnectionPool &pool_;
};
