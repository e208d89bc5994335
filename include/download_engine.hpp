#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "config.hpp"
#include "endpoint_selector.hpp"
#include "manifest.hpp"
#include "progress_reporter.hpp"
#include "transport.hpp"

/**
 * Mutable state of one entry while it is being processed.
 */
struct TransferState
{
    std::filesystem::path destinationPath; // <destination>/<basename>
    std::filesystem::path partialPath;     // <destinationPath>.partial

    std::uint64_t resumeOffset = 0; // Bytes on disk in the partial file
    std::uint64_t totalSize = 0;    // Remote size, 0 if unknown
    std::uint64_t transferred = 0;  // Bytes fetched during this run

    std::optional<Protocol> activeProtocol;
    std::optional<Url> activeUrl;
};

struct EngineOptions
{
    std::filesystem::path destination;
    size_t blockSize = 1024 * 1024;
    MismatchPolicy mismatchPolicy = MismatchPolicy::Keep;
};

/**
 * Takes one manifest entry from candidate selection to a verified file.
 *
 * Stages: NotStarted -> Selecting -> Opening -> Transferring -> Verifying
 * -> Complete | Failed. A final file that already exists short-circuits to
 * Complete. Bytes are appended to "<name>.partial", which is renamed to
 * "<name>" only after its digest matches, and survives any failure so the
 * next run resumes from its end.
 */
class ResumableDownloadEngine
{
public:
    enum class Stage
    {
        NotStarted,
        Selecting,
        Opening,
        Transferring,
        Verifying,
        Complete,
        Failed
    };

    ResumableDownloadEngine(const EndpointSelector &selector,
                            const TransportRegistry &transports,
                            ProgressReporter &progress,
                            EngineOptions options);

    /**
     * Process one entry.
     *
     * Transport failures are folded into the returned code.
     *
     * @throws std::runtime_error / std::filesystem::filesystem_error on local I/O failure
     */
    OutcomeCode run(const ManifestEntry &entry);

    /**
     * Stage the most recent run() ended in.
     */
    Stage stage() const { return stage_; }

private:
    void enter(Stage stage, const ManifestEntry &entry);
    OutcomeCode fail(OutcomeCode code, const ManifestEntry &entry);

    /**
     * Try each candidate in order; the first successful open wins.
     */
    std::unique_ptr<TransferHandle> openFirstAvailable(const std::vector<EndpointCandidate> &candidates,
                                                       TransferState &state,
                                                       ProtocolTransport *&transport) const;

    /**
     * Chunk loop: append to the partial file, advance the offset, report progress.
     */
    void transfer(TransferState &state, TransferHandle &handle, bool reportProgress);

    OutcomeCode verify(const ManifestEntry &entry, const TransferState &state);

    const EndpointSelector &selector_;
    const TransportRegistry &transports_;
    ProgressReporter &progress_;
    EngineOptions options_;
    Stage stage_ = Stage::NotStarted;
};

const char *stageName(ResumableDownloadEngine::Stage stage);
