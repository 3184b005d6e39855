#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "media_types.hpp"

/**
 * One active transfer inside a session.
 * Released (but not removed from the session) when destroyed.
 */
class TransferHandle
{
public:
    virtual ~TransferHandle() = default;

    // Limits are in bytes per second, 0 = unlimited
    virtual void setUploadLimit(int bytesPerSec) = 0;
    virtual void setDownloadLimit(int bytesPerSec) = 0;
    virtual void setSequentialDownload(bool enabled) = 0;

    virtual TransferStatus status() const = 0;

    /**
     * File manifest of the torrent.
     * @return Empty until the engine has received the metadata
     */
    virtual std::optional<TorrentManifest> torrentFile() const = 0;

    /**
     * Bytes downloaded per file, indexed like the manifest.
     * Counted in whole pieces (piece granularity).
     */
    virtual std::vector<std::int64_t> fileProgress() const = 0;

    // 0 = do not download
    virtual void setFilePriority(int fileIndex, int priority) = 0;
};

/**
 * Group of transfers sharing one engine instance.
 * Destroying the session releases every handle obtained from it.
 */
class TransferSession
{
public:
    virtual ~TransferSession() = default;

    /**
     * Register a local .torrent descriptor.
     * @return nullptr on failure, see getLastError()
     */
    virtual std::unique_ptr<TransferHandle> addTorrentFile(const std::filesystem::path &descriptor,
                                                           const std::filesystem::path &savePath) = 0;

    /**
     * Parse a magnet link with the engine's parser and register it.
     * @return nullptr when the link cannot be parsed or added, see getLastError()
     */
    virtual std::unique_ptr<TransferHandle> addMagnet(const std::string &uri,
                                                      const std::filesystem::path &savePath) = 0;

    virtual void removeTorrent(TransferHandle &handle) = 0;

    virtual std::string getLastError() const = 0;
};

/**
 * Factory for sessions. Each download owns its own session.
 */
class TransferEngine
{
public:
    virtual ~TransferEngine() = default;

    virtual std::unique_ptr<TransferSession> createSession() = 0;
};
