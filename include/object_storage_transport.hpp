#pragma once

#include <string>

#include "connection_pool.hpp"
#include "transport.hpp"

/**
 * Anonymous S3-style object storage over HTTPS.
 *
 * "s3://bucket/key" is fetched from "https://bucket.<endpoint>/key", or from
 * "<endpoint>/bucket/key" when the endpoint is a full base URL such as
 * "http://localhost:9000" (path-style, for S3-compatible servers). Every
 * readChunk() is its own bounded range GET, so an interrupted transfer loses
 * at most one block. All buckets share a single pooled handle.
 */
class ObjectStorageTransport : public ProtocolTransport
{
public:
    ObjectStorageTransport(ConnectionPool &pool, std::string endpoint = "s3.amazonaws.com");

    Protocol protocol() const override { return Protocol::ObjectStorage; }

    /**
     * @throws TransportError if the bucket or key is missing or not public
     */
    std::unique_ptr<TransferHandle> open(const Url &url, std::uint64_t resumeOffset) override;

    std::uint64_t size(const Url &url) override;

    /**
     * HTTPS URL an "s3://bucket/key" URL is fetched from.
     */
    std::string httpsUrl(const Url &url) const;

private:
    ConnectionPool &pool_;
    std::string endpoint_;
};
