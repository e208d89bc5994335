#pragma once

#include "connection_pool.hpp"
#include "transport.hpp"

/**
 * FTP transport over one pooled control connection per host.
 *
 * The server pushes the file down a data connection (RETR, resumed with
 * REST); CurlStream absorbs those pushes and hands them out as pull-style
 * chunks, so the engine treats FTP like every other chunked transport.
 */
class FtpTransport : public ProtocolTransport
{
public:
    explicit FtpTransport(ConnectionPool &pool) : pool_(pool) {}

    Protocol protocol() const override { return Protocol::Ftp; }

    /**
     * @throws TransportError if login fails or the file is not on the server
     */
    std::unique_ptr<TransferHandle> open(const Url &url, std::uint64_t resumeOffset) override;

    std::uint64_t size(const Url &url) override;

private:
    ConnectionPool &pool_;
};
