#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "transport.hpp"

/**
 * Settings for the external Aspera "ascp" client.
 */
struct FaspOptions
{
    std::string ascpPath = "ascp"; // Looked up on PATH unless absolute
    std::string user;              // Remote login; empty uses ascp's default
    std::string keyFile;           // Private key (-i); empty relies on ASPERA_SCP_PASS etc.
    std::string targetRate = "300m";
    int port = 33001;
};

/**
 * High-throughput UDP transfer (FASP) through the ascp client.
 *
 * There is no partial-byte resume: open() runs one whole-file transfer into a
 * staging file and either succeeds or throws. The handle then replays the
 * staged file, reporting a start offset of 0 so any stale partial data is
 * discarded. chunked() is false, so the engine shows no per-chunk progress.
 */
class FaspTransport : public ProtocolTransport
{
public:
    FaspTransport(FaspOptions options, std::filesystem::path stagingDirectory);

    Protocol protocol() const override { return Protocol::Fasp; }

    /**
     * @throws TransportError if ascp cannot be started or exits non-zero
     */
    std::unique_ptr<TransferHandle> open(const Url &url, std::uint64_t resumeOffset) override;

    /**
     * Size of the staged file. Only known while the handle open() returned is alive.
     *
     * @throws TransportError if `url` has not been transferred or its handle is closed
     */
    std::uint64_t size(const Url &url) override;

    bool chunked() const override { return false; }

    /**
     * Command line used to fetch `url` into `target`.
     */
    std::vector<std::string> buildCommand(const Url &url, const std::filesystem::path &target) const;

private:
    FaspOptions options_;
    std::filesystem::path stagingDirectory_;
    std::map<std::string, std::filesystem::path> staged_; // Open handles only
};
