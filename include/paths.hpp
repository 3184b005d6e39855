#pragma once

#include <filesystem>
#include <string>

#include "media_types.hpp"

/**
 * Decides where the engine stores the files of a download.
 */
class SavePathProvider
{
public:
    virtual ~SavePathProvider() = default;

    /**
     * @throws ConfigurationError if the kind is not recognized
     */
    virtual std::filesystem::path savePathFor(MediaKind kind) const = 0;
};

/**
 * Save paths under one cache root:
 *   <root>/Movies, <root>/Shows, <root>/Dropped
 * Torrent descriptors fetched from the network go to <root>/Torrents.
 */
class CacheDirectories : public SavePathProvider
{
public:
    explicit CacheDirectories(std::filesystem::path root);

    std::filesystem::path savePathFor(MediaKind kind) const override;

    std::filesystem::path movieDownloads() const { return root_ / "Movies"; }
    std::filesystem::path showDownloads() const { return root_ / "Shows"; }
    std::filesystem::path droppedDownloads() const { return root_ / "Dropped"; }
    std::filesystem::path torrentDescriptors() const { return root_ / "Torrents"; }

    /**
     * Create every cache directory (like mkdir -p).
     * @return false if one of them could not be created, see getLastError()
     */
    bool ensureCreated();

    std::string getLastError() const { return lastError_; }

    /**
     * $XDG_CACHE_HOME/torrent_streamer, falling back to
     * $HOME/.cache/torrent_streamer, then to the temp directory.
     */
    static std::filesystem::path defaultRoot();

private:
    std::filesystem::path root_;
    std::string lastError_;
};

/**
 * Turns the engine's full path of a file into a path usable by the player.
 */
class PathResolver
{
public:
    virtual ~PathResolver() = default;

    /**
     * @return Usable path, or an empty string if the file cannot be reached yet
     */
    virtual std::string resolveUsablePath(const std::filesystem::path &longPath) const = 0;
};

/**
 * Resolves against the real filesystem. The parent directory must already
 * exist (the engine creates it when the first piece is written) and the
 * canonical result must fit in the platform's path length limit.
 */
class FilesystemPathResolver : public PathResolver
{
public:
    std::string resolveUsablePath(const std::filesystem::path &longPath) const override;
};
