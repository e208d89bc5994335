#pragma once

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "transport.hpp"

/**
 * In-memory transport: serves fixed content per URL and records every call.
 */
class FakeTransport : public ProtocolTransport
{
public:
    explicit FakeTransport(Protocol protocol, bool chunked = true)
        : protocol_(protocol), chunked_(chunked) {}

    void serve(const std::string &url, const std::string &content) { content_[url] = content; }
    void refuse(const std::string &url) { refused_.insert(url); }

    // Fail every read after this many successful ones (-1: never)
    void failReadsAfter(int reads) { readsBeforeFailure_ = reads; }

    // Start from 0 no matter what offset is requested
    void ignoreResume() { ignoreResume_ = true; }

    Protocol protocol() const override { return protocol_; }
    bool chunked() const override { return chunked_; }

    std::unique_ptr<TransferHandle> open(const Url &url, std::uint64_t resumeOffset) override
    {
        opens.push_back(url.text);
        openOffsets.push_back(resumeOffset);

        auto it = content_.find(url.text);
        if (refused_.count(url.text) || it == content_.end())
        {
            throw TransportError(url.text + ": connection refused");
        }

        std::uint64_t start = ignoreResume_ ? 0 : resumeOffset;
        return std::make_unique<Handle>(*this, it->second, start);
    }

    std::uint64_t size(const Url &url) override
    {
        ++sizeCalls;
        auto it = content_.find(url.text);
        if (it == content_.end())
        {
            throw TransportError(url.text + ": no such object");
        }
        return it->second.size();
    }

    std::vector<std::string> opens;
    std::vector<std::uint64_t> openOffsets;
    std::vector<size_t> chunkSizes;
    int sizeCalls = 0;

private:
    class Handle : public TransferHandle
    {
    public:
        Handle(FakeTransport &owner, std::string content, std::uint64_t start)
            : owner_(owner), content_(std::move(content)), start_(start), position_(start) {}

        std::string readChunk(size_t blockSize) override
        {
            if (owner_.readsBeforeFailure_ == 0)
            {
                throw TransportError("connection reset");
            }
            if (owner_.readsBeforeFailure_ > 0)
            {
                --owner_.readsBeforeFailure_;
            }

            if (position_ >= content_.size())
            {
                return {};
            }
            size_t take = std::min<size_t>(blockSize, content_.size() - position_);
            std::string chunk = content_.substr(position_, take);
            position_ += take;
            owner_.chunkSizes.push_back(chunk.size());
            return chunk;
        }

        std::uint64_t startOffset() const override { return start_; }

    private:
        FakeTransport &owner_;
        std::string content_;
        std::uint64_t start_;
        size_t position_;
    };

    Protocol protocol_;
    bool chunked_;
    std::map<std::string, std::string> content_;
    std::set<std::string> refused_;
    int readsBeforeFailure_ = -1;
    bool ignoreResume_ = false;
};
