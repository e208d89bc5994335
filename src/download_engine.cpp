#include "download_engine.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "checksum.hpp"
#include "logger.hpp"

ResumableDownloadEngine::ResumableDownloadEngine(const EndpointSelector &selector,
                                                 const TransportRegistry &transports,
                                                 ProgressReporter &progress,
                                                 EngineOptions options)
    : selector_(selector), transports_(transports), progress_(progress), options_(std::move(options))
{
    if (options_.blockSize == 0)
    {
        throw std::invalid_argument("Block size must be positive");
    }
}

OutcomeCode ResumableDownloadEngine::run(const ManifestEntry &entry)
{
    stage_ = Stage::NotStarted;

    // 1. Rank the candidate URLs
    enter(Stage::Selecting, entry);
    auto candidates = selector_.select(entry.urls);
    if (candidates.empty())
    {
        logger::warn("No valid URL found in the manifest for file ID {}", entry.id);
        return fail(OutcomeCode::NoValidEndpoint, entry);
    }

    TransferState state;
    state.destinationPath = options_.destination / candidates.front().url.basename();
    state.partialPath = state.destinationPath;
    state.partialPath += ".partial";

    // 2. Nothing to do if a previous run already finished this file
    if (std::filesystem::is_regular_file(state.destinationPath))
    {
        logger::info("File ID {} already present at {}", entry.id, state.destinationPath.string());
        enter(Stage::Complete, entry);
        return OutcomeCode::Success;
    }
    if (std::filesystem::exists(state.destinationPath))
    {
        logger::error("Cannot store file ID {}: {} exists and is not a regular file",
                      entry.id, state.destinationPath.string());
        return fail(OutcomeCode::EndpointUnreachable, entry);
    }

    // 3. Resume from whatever a previous run left behind
    enter(Stage::Opening, entry);
    std::filesystem::create_directories(options_.destination);
    if (std::filesystem::exists(state.partialPath))
    {
        state.resumeOffset = static_cast<std::uint64_t>(std::filesystem::file_size(state.partialPath));
        logger::debug("Found {} bytes of partial data in {}", state.resumeOffset, state.partialPath.string());
    }

    ProtocolTransport *transport = nullptr;
    auto handle = openFirstAvailable(candidates, state, transport);
    if (!handle)
    {
        std::vector<std::string> attempted;
        for (const auto &candidate : candidates)
        {
            attempted.push_back(protocolName(candidate.protocol));
        }
        logger::warn("Skipping file ID {} as none of the URLs [{}] succeeded.",
                     entry.id, fmt::join(attempted, ", "));
        return fail(OutcomeCode::EndpointUnreachable, entry);
    }

    // 4. Pull the remaining bytes
    enter(Stage::Transferring, entry);
    try
    {
        state.totalSize = transport->size(*state.activeUrl);
        transfer(state, *handle, transport->chunked());
    }
    catch (const TransportError &e)
    {
        progress_.finish();
        logger::error("Transfer of file ID {} from {} failed after {} bytes: {}",
                      entry.id, state.activeUrl->text, state.transferred, e.what());
        return fail(OutcomeCode::EndpointUnreachable, entry);
    }
    handle.reset();

    // 5. Only a verified file gets its final name
    enter(Stage::Verifying, entry);
    return verify(entry, state);
}

std::unique_ptr<TransferHandle> ResumableDownloadEngine::openFirstAvailable(
    const std::vector<EndpointCandidate> &candidates,
    TransferState &state,
    ProtocolTransport *&transport) const
{
    for (const auto &candidate : candidates)
    {
        ProtocolTransport *candidateTransport = transports_.find(candidate.protocol);
        if (!candidateTransport)
        {
            logger::warn("No {} transport available for {}", protocolName(candidate.protocol), candidate.url.text);
            continue;
        }

        try
        {
            auto handle = candidateTransport->open(candidate.url, state.resumeOffset);
            transport = candidateTransport;
            state.activeProtocol = candidate.protocol;
            state.activeUrl = candidate.url;
            return handle;
        }
        catch (const TransportError &e)
        {
            logger::warn("Cannot open {}: {}", candidate.url.text, e.what());
        }
    }
    return nullptr;
}

void ResumableDownloadEngine::transfer(TransferState &state, TransferHandle &handle, bool reportProgress)
{
    std::ofstream outFile(state.partialPath, std::ios::binary | std::ios::app);
    if (!outFile)
    {
        throw std::runtime_error(fmt::format("Cannot open file for writing: {}", state.partialPath.string()));
    }

    logger::info("Downloading file (via {}): {} | total bytes = {}",
                 protocolName(*state.activeProtocol), state.destinationPath.string(), state.totalSize);

    if (options_.blockSize > state.totalSize && state.totalSize > 0)
    {
        logger::info("Block size greater than total file size, pulling in entire file.");
    }

    // The remote side may start from 0 instead of the requested offset;
    // it does so before sending any data, so the partial file is simply emptied
    std::uint64_t sessionStart = state.resumeOffset;
    auto syncStartOffset = [&]()
    {
        if (handle.startOffset() == sessionStart)
        {
            return;
        }
        logger::info("Discarding {} bytes of partial data in {}", state.resumeOffset, state.partialPath.string());
        outFile.close();
        outFile.open(state.partialPath, std::ios::binary | std::ios::trunc);
        if (!outFile)
        {
            throw std::runtime_error(fmt::format("Cannot reopen file for writing: {}", state.partialPath.string()));
        }
        sessionStart = handle.startOffset();
        state.resumeOffset = sessionStart;
    };

    syncStartOffset();

    if (state.totalSize > 0 && state.resumeOffset >= state.totalSize)
    {
        logger::info("Partial file {} already holds all {} bytes", state.partialPath.string(), state.totalSize);
        return;
    }

    while (true)
    {
        std::string chunk = handle.readChunk(options_.blockSize);
        syncStartOffset();

        if (chunk.empty())
        {
            break;
        }

        outFile.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!outFile)
        {
            throw std::runtime_error(fmt::format("Write failed: {}", state.partialPath.string()));
        }

        state.resumeOffset += chunk.size();
        state.transferred += chunk.size();

        if (reportProgress)
        {
            progress_.report(ProgressReporter::formatProgress(state.resumeOffset, state.totalSize));
        }
    }

    outFile.close();
    if (!outFile)
    {
        throw std::runtime_error(fmt::format("Cannot flush {}", state.partialPath.string()));
    }

    progress_.finish();
}

OutcomeCode ResumableDownloadEngine::verify(const ManifestEntry &entry, const TransferState &state)
{
    bool matches = false;
    try
    {
        matches = ChecksumVerifier::verify(state.partialPath, entry.md5);
    }
    catch (const std::runtime_error &e)
    {
        logger::error("Cannot verify file ID {}: {}", entry.id, e.what());
    }

    if (matches)
    {
        // Same directory, so the rename is atomic
        std::filesystem::rename(state.partialPath, state.destinationPath);
        logger::info("Completed file ID {}: {}", entry.id, state.destinationPath.string());
        enter(Stage::Complete, entry);
        return OutcomeCode::Success;
    }

    logger::error("MD5 check failed for the file ID {}, data may be corrupted.", entry.id);

    if (options_.mismatchPolicy == MismatchPolicy::Discard)
    {
        std::error_code ec;
        std::filesystem::remove(state.partialPath, ec);
        if (ec)
        {
            logger::warn("Cannot remove {}: {}", state.partialPath.string(), ec.message());
        }
        else
        {
            logger::info("Removed {}; the next run starts over", state.partialPath.string());
        }
    }

    return fail(OutcomeCode::ChecksumMismatch, entry);
}

void ResumableDownloadEngine::enter(Stage stage, const ManifestEntry &entry)
{
    logger::debug("File ID {}: {} -> {}", entry.id, stageName(stage_), stageName(stage));
    stage_ = stage;
}

OutcomeCode ResumableDownloadEngine::fail(OutcomeCode code, const ManifestEntry &entry)
{
    enter(Stage::Failed, entry);
    return code;
}

const char *stageName(ResumableDownloadEngine::Stage stage)
{
    using Stage = ResumableDownloadEngine::Stage;
    switch (stage)
    {
    case Stage::NotStarted:
        return "not started";
    case Stage::Selecting:
        return "selecting";
    case Stage::Opening:
        return "opening";
    case Stage::Transferring:
        return "transferring";
    case Stage::Verifying:
        return "verifying";
    case Stage::Complete:
        return "complete";
    case Stage::Failed:
        return "failed";
    }
    return "unknown";
}
