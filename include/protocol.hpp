#pragma once

#include <optional>
#include <string>

/**
 * Transfer protocols a manifest URL can name.
 */
enum class Protocol
{
    Http,          // http:// and https://
    Ftp,           // ftp://
    ObjectStorage, // s3://bucket/key
    Fasp           // fasp://host/path (high-throughput UDP)
};

/**
 * Map a scheme or priority token to a protocol (case-insensitive).
 *
 * @param token "http", "https", "ftp", "s3" or "fasp"
 * @return The protocol, or std::nullopt for an unknown token
 */
std::optional<Protocol> protocolFromToken(const std::string &token);

/**
 * Upper-case display name ("HTTP", "FTP", "S3", "FASP").
 */
const char *protocolName(Protocol protocol);

/**
 * A parsed candidate URL.
 */
struct Url
{
    std::string text;   // Original text, as listed in the manifest
    std::string scheme; // Lower-case scheme token
    std::string host;   // Host (and optional :port); bucket name for s3://
    std::string path;   // Remainder starting with '/', "/" when absent

    Protocol protocol = Protocol::Http;

    /**
     * Last '/'-separated component of the path (used as the local file name).
     */
    std::string basename() const;

    /**
     * True if basename() can name a local file (not empty, "." or "..").
     */
    bool hasFileName() const;
};

/**
 * Split "scheme://host/path" into its parts.
 *
 * @return std::nullopt if there is no "://", no host, or the scheme is unknown
 */
std::optional<Url> parseUrl(const std::string &text);
