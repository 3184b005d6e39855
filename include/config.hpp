#pragma once

#include <string>
#include <optional>

#include "media_types.hpp"

/**
 * Configuration of the streamer.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct StreamConfig
{
    // Required: magnet link, .torrent path or http(s) URL of a .torrent
    std::string source;

    MediaKind mediaKind = MediaKind::Unknown;
    std::string title;

    // Transfer limits in KB/s, 0 = unlimited
    int uploadLimitKBps = 0;
    int downloadLimitKBps = 0;

    // Empty: CacheDirectories::defaultRoot()
    std::string cacheDir;

    BufferingThresholds thresholds;

    // Verified against the .torrent file, format "sha256:abc123..." or "sha1:..."
    std::optional<std::string> expectedChecksum;

    // Remote descriptor fetching
    int maxRetries = 3;
    int timeoutSeconds = 60;

    std::string listenInterfaces = "0.0.0.0:6881,[::]:6881";

    // Cancel the download as soon as the media is playable
    bool stopWhenBuffered = false;

    bool showVersion = false;
};
