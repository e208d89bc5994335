#include "batch_orchestrator.hpp"
#include <fmt/core.h>

#include "fake_transport.hpp"
#include "logger.hpp"
#include "test_support.hpp"

int main()
{
    TestRun run;
    logger::setLevel(logger::Level::Error);

    try
    {
        ScratchDir scratch("batch");
        const std::string content = "0123456789abcdef";
        const std::string md5 = "4032af8d61035123906e58e067140cc5";

        BatchConfig config;
        config.destination = (scratch.path() / "out").string();
        config.blockSize = 8;

        auto http = std::make_unique<FakeTransport>(Protocol::Http);
        FakeTransport *httpRaw = http.get();
        http->serve("http://h/good.bin", content);
        http->serve("http://h/corrupt.bin", "not the content!");
        http->serve("http://h/second.bin", content);

        TransportRegistry transports;
        transports.add(std::move(http));

        std::FILE *progressOut = std::tmpfile();
        if (!progressOut)
        {
            fmt::print(stderr, "❌ Error: cannot create temporary file\n");
            return 1;
        }

        std::vector<ManifestEntry> manifest = {
            {"A", {"http://h/good.bin"}, md5},
            {"B", {}, md5},
            {"C", {"http://h/down.bin"}, md5},
            {"D", {"http://h/corrupt.bin"}, md5},
            {"E", {"ftp://f/other.bin"}, md5},
            {"F", {"http://h/second.bin"}, md5},
        };

        // The orchestrator owns the transports: read what they recorded while it is alive
        std::vector<OutcomeCode> outcomes;
        std::vector<std::string> opened;
        {
            BatchOrchestrator orchestrator(config, std::move(transports),
                                           EndpointSelector(PriorityList{"http"}), progressOut);
            outcomes = orchestrator.run(manifest);
            opened = httpRaw->opens;
        }
        std::fclose(progressOut);

        // Test 1: One outcome per entry, in manifest order
        run.check(outcomes.size() == manifest.size(), "One outcome per entry");
        run.check(outcomes == std::vector<OutcomeCode>({OutcomeCode::Success,
                                                        OutcomeCode::NoValidEndpoint,
                                                        OutcomeCode::EndpointUnreachable,
                                                        OutcomeCode::ChecksumMismatch,
                                                        OutcomeCode::NoValidEndpoint,
                                                        OutcomeCode::Success}),
                  "Outcomes follow manifest order");

        // Test 2: Failures do not stop the batch
        run.check(!opened.empty() && opened.back() == "http://h/second.bin",
                  "Entries after failures are still processed");
        run.check(readFile(scratch.path() / "out" / "good.bin") == content, "First file is complete");
        run.check(readFile(scratch.path() / "out" / "second.bin") == content, "Last file is complete");
        run.check(!std::filesystem::exists(scratch.path() / "out" / "corrupt.bin"), "Corrupt file is not renamed");

        // Test 3: A URL naming a directory never counts as downloaded
        {
            std::vector<ManifestEntry> directoryOnly = {{"I", {"http://h/"}, "00000000000000000000000000000000"}};
            for (int pass = 1; pass <= 2; ++pass)
            {
                TransportRegistry dirTransports;
                auto dirHttp = std::make_unique<FakeTransport>(Protocol::Http);
                dirHttp->serve("http://h/", content);
                FakeTransport *dirRaw = dirHttp.get();
                dirTransports.add(std::move(dirHttp));

                BatchOrchestrator orchestrator(config, std::move(dirTransports),
                                               EndpointSelector(PriorityList{"http"}), stdout);
                auto dirOutcomes = orchestrator.run(directoryOnly);
                run.check(dirOutcomes == std::vector<OutcomeCode>({OutcomeCode::NoValidEndpoint}),
                          fmt::format("Directory URL is not a valid endpoint (run {})", pass));
                run.check(dirRaw->opens.empty(), fmt::format("Directory URL is never fetched (run {})", pass));
            }
        }

        // Test 4: Empty manifest
        {
            BatchOrchestrator empty(config, TransportRegistry(), EndpointSelector(PriorityList{"http"}),
                                    stdout);
            run.check(empty.run({}).empty(), "Empty manifest gives no outcomes");
        }

        // Test 5: Local I/O failure is contained to its entry
        {
            auto blocked = scratch.path() / "blocked";
            writeFile(blocked, "a file where a directory is expected");

            BatchConfig blockedConfig = config;
            blockedConfig.destination = blocked.string();

            TransportRegistry blockedTransports;
            auto blockedHttp = std::make_unique<FakeTransport>(Protocol::Http);
            blockedHttp->serve("http://h/good.bin", content);
            blockedTransports.add(std::move(blockedHttp));

            BatchOrchestrator orchestrator(blockedConfig, std::move(blockedTransports),
                                           EndpointSelector(PriorityList{"http"}), stdout);
            auto blockedOutcomes = orchestrator.run({{"G", {"http://h/good.bin"}, md5},
                                                     {"H", {}, md5}});
            run.check(blockedOutcomes == std::vector<OutcomeCode>({OutcomeCode::EndpointUnreachable,
                                                                   OutcomeCode::NoValidEndpoint}),
                      "Unwritable destination fails only its entry");
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return run.finish();
}
