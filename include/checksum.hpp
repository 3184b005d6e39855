#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

/**
 * Integrity check of torrent descriptors fetched from the network.
 * Catalogs publish the digest next to the .torrent link; a mismatch means
 * a truncated or substituted file that must not reach the engine.
 *
 * Checksums are written "algorithm:hex", e.g. "sha256:ba7816bf...".
 * Separators (':', '-', spaces) and case in the hex part are ignored.
 */
class ChecksumVerifier
{
public:
    enum class Algorithm
    {
        SHA256,
        SHA1
    };

    /**
     * Lowercase hex digest of a file, read in chunks.
     * @throws std::runtime_error if the file cannot be read
     */
    static std::string computeDigest(const std::filesystem::path &filePath, Algorithm algorithm);

    static std::string computeDigest(const std::vector<char> &data, Algorithm algorithm);

    /**
     * @return false on a digest mismatch
     * @throws std::runtime_error for a malformed checksum or an unreadable file
     */
    static bool verify(const std::filesystem::path &filePath, const std::string &expectedChecksum);

    /**
     * Split and validate "algorithm:hex".
     * @return Algorithm and normalized (lowercase, no separators) hex digest
     * @throws std::runtime_error if format, algorithm or length is invalid
     */
    static std::pair<Algorithm, std::string> parseChecksum(const std::string &checksum);

private:
    static std::string normalizeHex(const std::string &hex);

    static constexpr size_t CHUNK_SIZE = 64 * 1024;
};
