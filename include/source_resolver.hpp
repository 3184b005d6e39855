#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "http_client.hpp"
#include "media_types.hpp"

/**
 * Turns the SOURCE argument of the command line into a SourceDescriptor.
 *
 *   magnet:?xt=...          -> MagnetUri
 *   http(s)://.../x.torrent -> fetched into the descriptor directory, TorrentFilePath
 *   anything else           -> local TorrentFilePath (must exist)
 *
 * An optional "algorithm:hex" checksum is verified against the .torrent file.
 */
class SourceResolver
{
public:
    SourceResolver(HttpClient &http, std::filesystem::path descriptorDirectory, int timeoutSeconds = 60);

    /**
     * @throws ConfigurationError for a missing file, a checksum on a magnet
     *         link, a malformed checksum or a mismatching digest
     * @throws std::runtime_error if a remote descriptor cannot be fetched
     */
    SourceDescriptor resolve(const std::string &argument,
                             const std::optional<std::string> &expectedChecksum = std::nullopt);

    static bool isMagnetUri(const std::string &argument);
    static bool isRemoteUrl(const std::string &argument);

    /**
     * Local file name for a remote descriptor: last path segment of the
     * URL without query string, with a ".torrent" extension.
     */
    static std::string descriptorFileName(const std::string &url);

private:
    void verifyChecksum(const std::filesystem::path &descriptor, const std::string &expectedChecksum) const;

    HttpClient &http_;
    std::filesystem::path descriptorDirectory_;
    int timeoutSeconds_;
};
