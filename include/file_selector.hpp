#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "media_types.hpp"
#include "paths.hpp"
#include "transfer_engine.hpp"

/**
 * Index of the largest file of the manifest.
 * Ties go to the first file seen; files of size 0 never qualify.
 *
 * @return Index, or FileSelection::kUnresolved if no file has a positive size
 */
int findLargestFile(const TorrentManifest &manifest);

/**
 * Which file of a torrent is played, and where it lives on disk.
 *
 * Selection happens once: the largest file is kept, every other file gets
 * priority 0 and its size is removed from the wanted total. The disk path
 * may only become resolvable later, so resolvePath() can be retried on
 * every tick until it succeeds.
 */
class FileSelection
{
public:
    static constexpr int kUnresolved = -1;

    /**
     * Pick the media file and ignore all others on the handle.
     * Does nothing if a file is already selected.
     *
     * @return false if the torrent has no candidate file
     */
    bool select(const TorrentManifest &manifest, TransferHandle &handle);

    /**
     * Try to turn the selected file into a usable path under savePath.
     * @return true once a path is known (also on later calls)
     */
    bool resolvePath(const TorrentManifest &manifest,
                     const std::filesystem::path &savePath,
                     const PathResolver &resolver);

    bool hasMediaIndex() const { return mediaIndex_ != kUnresolved; }
    bool hasPath() const { return !resolvedPath_.empty(); }

    int mediaIndex() const { return mediaIndex_; }
    const std::string &resolvedPath() const { return resolvedPath_; }
    std::int64_t maxSizeSeen() const { return maxSizeSeen_; }
    std::int64_t totalSizeExcludingIgnored() const { return totalSizeExcludingIgnored_; }

private:
    int mediaIndex_ = kUnresolved;
    std::string resolvedPath_;
    std::int64_t maxSizeSeen_ = 0;
    std::int64_t totalSizeExcludingIgnored_ = 0;
};
