#pragma once

#include <string>
#include <vector>
#include <filesystem>

/**
 * File integrity verification using cryptographic hashes.
 * Manifests carry bare MD5 hex digests; "algorithm:hexhash" is accepted too.
 */
class ChecksumVerifier
{
public:
    /**
     * Supported hash algorithms.
     */
    enum class Algorithm
    {
        MD5,
        SHA1,
        SHA256
    };

    /**
     * Compute the digest of a file.
     * Reads the file in fixed-size chunks so it never has to fit in memory.
     *
     * @param filePath Path to file to hash
     * @param algorithm Hash to compute
     * @return Lower-case hex digest
     * @throws std::runtime_error if the file cannot be read or OpenSSL fails
     */
    static std::string computeDigest(const std::filesystem::path &filePath, Algorithm algorithm);

    static std::string computeMD5(const std::filesystem::path &filePath)
    {
        return computeDigest(filePath, Algorithm::MD5);
    }

    /**
     * Verify a file matches an expected checksum.
     *
     * @param filePath Path to file to verify
     * @param expectedChecksum Bare hex digest (algorithm inferred from length,
     *                         32 = MD5, 40 = SHA-1, 64 = SHA-256) or "algorithm:hexhash"
     * @return true if checksums match (case-insensitive), false otherwise
     * @throws std::runtime_error if the expected checksum is malformed
     */
    static bool verify(const std::filesystem::path &filePath,
                       const std::string &expectedChecksum);

    /**
     * Parse checksum string into algorithm and normalized hash.
     *
     * @param checksumStr "algorithm:hexhash" or a bare hex digest
     * @return Pair of (algorithm, lower-case hex hash)
     * @throws std::runtime_error if format, algorithm or length is invalid
     */
    static std::pair<Algorithm, std::string> parseChecksum(const std::string &checksumStr);

private:
    static std::string toHex(const std::vector<unsigned char> &data);

    /**
     * Convert hex string to lowercase and remove whitespace.
     * Makes comparison case-insensitive.
     */
    static std::string normalizeHex(const std::string &hex);

    static size_t hexLength(Algorithm algorithm);

    static constexpr size_t CHUNK_SIZE = 4096;
};
