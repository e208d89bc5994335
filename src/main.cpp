#include <map>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include <curl/curl.h>
#include "batch_orchestrator.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "manifest.hpp"

namespace
{

// curl_global_init must run before any other libcurl call, once per process
struct CurlGlobal
{
    CurlGlobal() : status(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal()
    {
        if (status == CURLE_OK)
        {
            curl_global_cleanup();
        }
    }
    CURLcode status;
};

void printVersion()
{
    fmt::print("manifetch v1.0\n");
    fmt::print("Built with:\n");
    fmt::print("  - libcurl: HTTP/HTTPS, FTP and S3 transfers\n");
    fmt::print("  - OpenSSL: MD5/SHA checksums\n");
    fmt::print("  - CLI11: Command-line parsing\n");
    fmt::print("  - fmt: Modern string formatting\n");
}

} // namespace

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            printVersion();
            return 0;
        }
    }

    CLI::App app{"manifetch - fetch the files of a manifest over HTTP, FTP, S3 or FASP"};

    BatchConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("-m,--manifest", config.manifestPath,
                   "Tab-separated manifest with id, md5 and urls columns")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("-d,--destination", config.destination, "Directory to place downloaded files in")
        ->default_val(".");

    app.add_option("-e,--endpoint-priority", config.priorities,
                   "Comma-separated protocol order, e.g. 'ftp,http,s3' (default: from environment)");

    app.add_option("-b,--block-size", config.blockSize,
                   "Bytes fetched per chunk; a finished chunk survives an interruption")
        ->check(CLI::PositiveNumber)
        ->default_val(1024 * 1024);

    app.add_option("--connect-timeout", config.curl.connectTimeoutSeconds,
                   "Seconds allowed to establish a connection")
        ->check(CLI::PositiveNumber)
        ->default_val(30);

    app.add_option("--stall-timeout", config.curl.lowSpeedTimeSeconds,
                   "Abort a transfer that receives nothing for this many seconds")
        ->check(CLI::PositiveNumber)
        ->default_val(60);

    app.add_option("--ftp-user", config.curl.ftpUser, "FTP login name (default: anonymous)");

    app.add_option("--s3-endpoint", config.objectStorageEndpoint,
                   "Object storage host (s3://bucket/key -> https://bucket.<host>/key) "
                   "or base URL (-> <url>/bucket/key)")
        ->default_val("s3.amazonaws.com");

    std::map<std::string, MismatchPolicy> policies{
        {"keep", MismatchPolicy::Keep},
        {"discard", MismatchPolicy::Discard}};
    app.add_option("--on-mismatch", config.mismatchPolicy,
                   "Partial file after a failed checksum: keep (resume later) or discard")
        ->transform(CLI::CheckedTransformer(policies, CLI::ignore_case))
        ->default_str("keep");

    app.add_option("--ascp", config.fasp.ascpPath, "Aspera ascp client for fasp:// URLs")
        ->default_val("ascp");
    app.add_option("--fasp-user", config.fasp.user, "FASP login name");
    app.add_option("--fasp-key", config.fasp.keyFile, "FASP private key file")
        ->check(CLI::ExistingFile);
    app.add_option("--fasp-rate", config.fasp.targetRate, "FASP target rate (ascp -l)")
        ->default_val("300m");

    app.add_flag("--demo-url-rewrite", config.demoUrlRewrite,
                 "Map demo-dataset s3:// URLs onto their bucket/key layout");

    app.add_flag("--verbose", config.verbose, "Log every step");

    // Optional flag: --version (for help display only, actual handling is done above)
    app.add_flag("-v,--version", config.showVersion, "Display version information");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    if (config.verbose)
    {
        logger::setLevel(logger::Level::Debug);
    }

    CurlGlobal curlGlobal;
    if (curlGlobal.status != CURLE_OK)
    {
        fmt::print(stderr, "✗ Failed to initialize libcurl: {}\n", curl_easy_strerror(curlGlobal.status));
        return 1;
    }

    // ====================================================================
    // RUN THE BATCH
    // ====================================================================

    try
    {
        auto manifest = readManifest(config.manifestPath);
        logger::info("Manifest {} lists {} files", config.manifestPath, manifest.size());

        BatchOrchestrator orchestrator(config);
        auto outcomes = orchestrator.run(manifest);

        std::map<OutcomeCode, size_t> counts;
        for (OutcomeCode code : outcomes)
        {
            ++counts[code];
        }

        fmt::print("\n");
        for (const auto &[code, count] : counts)
        {
            fmt::print("{:>6}  {}\n", count, outcomeName(code));
        }

        bool allSucceeded = counts[OutcomeCode::Success] == outcomes.size();
        if (allSucceeded)
        {
            fmt::print("✓ All {} files downloaded and verified\n", outcomes.size());
            return 0;
        }

        fmt::print(stderr, "✗ {} of {} files failed\n",
                   outcomes.size() - counts[OutcomeCode::Success], outcomes.size());
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
