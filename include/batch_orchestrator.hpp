#pragma once

#include <cstdio>
#include <memory>
#include <vector>

#include "config.hpp"
#include "connection_pool.hpp"
#include "download_engine.hpp"
#include "endpoint_selector.hpp"
#include "manifest.hpp"
#include "progress_reporter.hpp"
#include "transport.hpp"

/**
 * Runs every manifest entry through the engine, one at a time, and collects
 * one OutcomeCode per entry in manifest order. A failing entry never stops
 * the batch.
 *
 * Owns the connection pool and the transports built on it, so connections
 * live exactly as long as the batch.
 */
class BatchOrchestrator
{
public:
    /**
     * Build the network transports (HTTP, FTP, S3, FASP) from `config`.
     */
    explicit BatchOrchestrator(BatchConfig config, std::FILE *progressOut = stdout);

    /**
     * Use caller-supplied transports and selector instead of the network stack.
     */
    BatchOrchestrator(BatchConfig config, TransportRegistry transports,
                      EndpointSelector selector, std::FILE *progressOut = stdout);

    BatchOrchestrator(const BatchOrchestrator &) = delete;
    BatchOrchestrator &operator=(const BatchOrchestrator &) = delete;

    /**
     * @return Exactly one code per entry, in manifest order
     */
    std::vector<OutcomeCode> run(const std::vector<ManifestEntry> &manifest);

private:
    BatchConfig config_;
    std::unique_ptr<ConnectionPool> pool_; // Null when transports are supplied
    TransportRegistry transports_;
    EndpointSelector selector_;
    ProgressReporter progress_;
    ResumableDownloadEngine engine_;
};
