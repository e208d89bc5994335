#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "protocol.hpp"

/**
 * Any failure talking to a remote endpoint (DNS, refusal, authentication,
 * protocol error, missing object). The engine does not distinguish kinds.
 */
class TransportError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * An opened remote object, positioned for sequential reading.
 */
class TransferHandle
{
public:
    virtual ~TransferHandle() = default;

    /**
     * Read the next piece of the object.
     *
     * @param blockSize Upper bound on the returned size
     * @return Up to blockSize bytes; an empty string at end of object
     * @throws TransportError if the transfer fails
     */
    virtual std::string readChunk(size_t blockSize) = 0;

    /**
     * Offset the transfer actually starts from. Equals the requested resume
     * offset unless the remote side cannot resume, in which case it is 0.
     */
    virtual std::uint64_t startOffset() const = 0;
};

/**
 * Capability set shared by every protocol: open-with-resume, size, chunked read.
 */
class ProtocolTransport
{
public:
    virtual ~ProtocolTransport() = default;

    virtual Protocol protocol() const = 0;

    /**
     * Establish (or reuse) a connection and position at resumeOffset.
     *
     * @throws TransportError if the endpoint cannot serve the object
     */
    virtual std::unique_ptr<TransferHandle> open(const Url &url, std::uint64_t resumeOffset) = 0;

    /**
     * Total byte length of the remote object, 0 if the server does not say.
     *
     * @throws TransportError on failure
     */
    virtual std::uint64_t size(const Url &url) = 0;

    /**
     * False for transports that move the whole file in one step; the engine
     * reports no per-chunk progress for them.
     */
    virtual bool chunked() const { return true; }
};

/**
 * Owns one transport per protocol; the engine looks them up by protocol.
 */
class TransportRegistry
{
public:
    /**
     * Register a transport, replacing any earlier one for the same protocol.
     */
    void add(std::unique_ptr<ProtocolTransport> transport);

    /**
     * @return The transport for `protocol`, or nullptr if none is registered
     */
    ProtocolTransport *find(Protocol protocol) const;

private:
    std::vector<std::unique_ptr<ProtocolTransport>> transports_;
};
