#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

/**
 * One file to retrieve: candidate source URLs plus the expected digest.
 */
struct ManifestEntry
{
    std::string id;
    std::vector<std::string> urls; // May be empty (private or incomplete records)
    std::string md5;               // Hex digest of the full file content
};

/**
 * Per-entry result of a batch run. Values are part of the caller contract.
 */
enum class OutcomeCode : int
{
    Success = 0,
    NoValidEndpoint = 1,
    EndpointUnreachable = 2,
    ChecksumMismatch = 3
};

const char *outcomeName(OutcomeCode code);

/**
 * Read a tab-separated manifest with a header row.
 * Columns are looked up by name: "id" (or "file_id"), "md5" and "urls";
 * any other column is ignored. "urls" is a comma-separated list.
 *
 * @throws std::runtime_error if the stream has no header or a required column is missing
 */
std::vector<ManifestEntry> parseManifest(std::istream &input);

/**
 * @throws std::runtime_error if the file cannot be opened, or as parseManifest()
 */
std::vector<ManifestEntry> readManifest(const std::filesystem::path &manifestPath);

/**
 * Split a comma-separated URL list, trimming whitespace and dropping blanks.
 */
std::vector<std::string> splitUrlList(const std::string &urls);
