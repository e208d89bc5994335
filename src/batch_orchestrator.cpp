#include "batch_orchestrator.hpp"

#include <exception>

#include "fasp_transport.hpp"
#include "ftp_transport.hpp"
#include "http_transport.hpp"
#include "logger.hpp"
#include "object_storage_transport.hpp"

namespace
{

TransportRegistry makeNetworkTransports(ConnectionPool &pool, const BatchConfig &config)
{
    TransportRegistry transports;
    transports.add(std::make_unique<HttpTransport>(pool));
    transports.add(std::make_unique<FtpTransport>(pool));
    transports.add(std::make_unique<ObjectStorageTransport>(pool, config.objectStorageEndpoint));
    transports.add(std::make_unique<FaspTransport>(config.fasp, config.destination));
    return transports;
}

EndpointSelector makeSelector(const BatchConfig &config)
{
    std::string metadataUrl = config.metadataUrl;
    EndpointSelector selector(parsePriorityList(config.priorities),
                              [metadataUrl]
                              { return queryInstanceMetadata(metadataUrl); });
    if (config.demoUrlRewrite)
    {
        selector.setUrlRewrite(rewriteDemoObjectUrl);
    }
    return selector;
}

EngineOptions makeEngineOptions(const BatchConfig &config)
{
    EngineOptions options;
    options.destination = config.destination;
    options.blockSize = config.blockSize;
    options.mismatchPolicy = config.mismatchPolicy;
    return options;
}

} // namespace

BatchOrchestrator::BatchOrchestrator(BatchConfig config, std::FILE *progressOut)
    : config_(std::move(config)),
      pool_(std::make_unique<ConnectionPool>(config_.curl)),
      transports_(makeNetworkTransports(*pool_, config_)),
      selector_(makeSelector(config_)),
      progress_(progressOut),
      engine_(selector_, transports_, progress_, makeEngineOptions(config_))
{
}

BatchOrchestrator::BatchOrchestrator(BatchConfig config, TransportRegistry transports,
                                     EndpointSelector selector, std::FILE *progressOut)
    : config_(std::move(config)),
      transports_(std::move(transports)),
      selector_(std::move(selector)),
      progress_(progressOut),
      engine_(selector_, transports_, progress_, makeEngineOptions(config_))
{
}

std::vector<OutcomeCode> BatchOrchestrator::run(const std::vector<ManifestEntry> &manifest)
{
    std::vector<OutcomeCode> outcomes;
    outcomes.reserve(manifest.size());

    for (size_t i = 0; i < manifest.size(); ++i)
    {
        const ManifestEntry &entry = manifest[i];
        logger::debug("Processing file ID {} ({}/{})", entry.id, i + 1, manifest.size());

        OutcomeCode code;
        try
        {
            code = engine_.run(entry);
        }
        catch (const std::exception &e)
        {
            // Local I/O trouble: the file did not arrive, but the batch goes on
            progress_.finish();
            logger::error("File ID {} failed: {}", entry.id, e.what());
            code = OutcomeCode::EndpointUnreachable;
        }

        outcomes.push_back(code);
    }

    return outcomes;
}
