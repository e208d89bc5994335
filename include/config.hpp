#pragma once

#include <string>

#include "connection_pool.hpp"
#include "fasp_transport.hpp"

/**
 * What to do with the partial file when the finished transfer fails its
 * checksum.
 */
enum class MismatchPolicy
{
    Keep,   // Leave it; the next run resumes from its end
    Discard // Delete it; the next run starts from byte 0
};

/**
 * Configuration for one batch run.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct BatchConfig
{
    // Required parameters
    std::string manifestPath;
    std::string destination = ".";

    // Comma-separated protocol order; empty means "decide from the environment"
    std::string priorities;

    size_t blockSize = 1024 * 1024;

    MismatchPolicy mismatchPolicy = MismatchPolicy::Keep;

    // Network settings shared by the libcurl transports
    CurlOptions curl;

    // s3://bucket/key is fetched from https://bucket.<objectStorageEndpoint>/key,
    // or from <objectStorageEndpoint>/bucket/key when it is a full base URL
    std::string objectStorageEndpoint = "s3.amazonaws.com";

    FaspOptions fasp;

    // Rewrite demo-dataset s3:// URLs into their bucket/key layout
    bool demoUrlRewrite = false;

    std::string metadataUrl = "http://169.254.169.254/latest/meta-data/";

    // Flags
    bool verbose = false;
    bool showVersion = false;
};
