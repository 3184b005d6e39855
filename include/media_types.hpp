#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * Kind of media a torrent is expected to contain.
 * Unknown is used for torrents dropped by the user (no catalog entry).
 */
enum class MediaKind
{
    Movie,
    Show,
    Unknown
};

std::string toString(MediaKind kind);

// Local .torrent descriptor on disk
struct TorrentFilePath
{
    std::filesystem::path path;
};

// magnet:?xt=urn:btih:... link
struct MagnetUri
{
    std::string uri;
};

using SourceDescriptor = std::variant<TorrentFilePath, MagnetUri>;

std::string describeSource(const SourceDescriptor &source);

/**
 * Parameters of one progressive download.
 * Built once by the caller and never modified afterwards.
 */
struct DownloadRequest
{
    SourceDescriptor source;
    MediaKind mediaKind = MediaKind::Unknown;
    int uploadLimitKBps = 0;   // 0 = unlimited
    int downloadLimitKBps = 0; // 0 = unlimited
};

/**
 * The playable asset the caller wants to watch.
 * filePath stays empty until the monitor resolves the media file on disk.
 */
struct MediaFile
{
    std::string title;
    std::string filePath;
};

using Seconds = std::chrono::duration<double>;

/**
 * One bandwidth reading, rebuilt every tick.
 * eta is empty when it cannot be estimated yet (nothing transferred).
 */
struct BandwidthSample
{
    double downloadRateKBps = 0.0;
    double uploadRateKBps = 0.0;
    std::optional<Seconds> eta;
};

/**
 * Snapshot of the engine-side transfer state, read once per tick.
 */
struct TransferStatus
{
    bool hasMetadata = false;
    std::int64_t downloadRateBytesPerSec = 0;
    std::int64_t uploadRateBytesPerSec = 0;
    int numSeeds = 0;
    int numPeers = 0;
};

struct ManifestFile
{
    std::int64_t size = 0;
    std::string relativePath; // relative to the save path, includes the torrent's root folder
    std::string name;
};

/**
 * File list of a torrent once its metadata is known.
 */
struct TorrentManifest
{
    std::int64_t totalSize = 0;
    std::vector<ManifestFile> files;

    int numFiles() const { return static_cast<int>(files.size()); }
    std::int64_t fileSize(int index) const { return files.at(static_cast<size_t>(index)).size; }
    const std::string &fileName(int index) const { return files.at(static_cast<size_t>(index)).name; }

    std::filesystem::path filePath(int index, const std::filesystem::path &savePath) const
    {
        return savePath / files.at(static_cast<size_t>(index)).relativePath;
    }
};

/**
 * Minimum progress (percent of the selected file) before playback may start.
 */
struct BufferingThresholds
{
    double movie = 10.0;
    double show = 5.0;
    double unknown = 10.0;
};

double minimumBufferingFor(MediaKind kind, const BufferingThresholds &thresholds);
