#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "file_selector.hpp"
#include "media_types.hpp"
#include "notifications.hpp"
#include "paths.hpp"
#include "transfer_engine.hpp"

/**
 * Observers fed on every tick. Any of them may be left empty.
 */
struct ProgressObservers
{
    std::function<void(double)> downloadProgress; // percent, 0..100
    std::function<void(const BandwidthSample &)> bandwidthRate;
    std::function<void(int)> seedCount;
    std::function<void(int)> peerCount;
};

/**
 * Progress stream handed to the player once the media is buffered.
 * Carries the same values as the download observers, from the buffered
 * tick onwards.
 */
class PlaybackFeed
{
public:
    using ProgressObserver = std::function<void(double)>;
    using BandwidthObserver = std::function<void(const BandwidthSample &)>;

    void subscribe(ProgressObserver progress, BandwidthObserver bandwidth = nullptr);

    void publish(double progress, const BandwidthSample &sample) const;

private:
    std::vector<ProgressObserver> progressObservers_;
    std::vector<BandwidthObserver> bandwidthObservers_;
};

struct DownloadCallbacks
{
    // Progress reached the buffering threshold. Fires at most once and
    // does not guarantee the media path is known, see DownloadResult.
    std::function<void()> buffered;

    // The download was cancelled. Fires at most once.
    std::function<void()> cancelled;

    // The media file is playable; called once, right after `buffered`.
    // The feed belongs to the running download and is valid until the
    // download ends; do not keep the reference past that point.
    std::function<void(const MediaFile &, PlaybackFeed &)> mediaBuffered;
};

enum class MonitorState
{
    AwaitingMetadata,
    SelectingFile,
    Streaming,
    Buffered,
    NoMediaFound,
    Cancelled
};

std::string toString(MonitorState state);

enum class DownloadOutcome
{
    Cancelled,
    NoMediaFound
};

/**
 * How a download ended.
 * buffered tells whether the `buffered` callback fired; mediaPath is empty
 * when no playable file was ever resolved, even if buffered is true.
 */
struct DownloadResult
{
    DownloadOutcome outcome = DownloadOutcome::Cancelled;
    bool buffered = false;
    std::string mediaPath;
    Seconds elapsed{0.0};
};

struct MonitorSettings
{
    std::filesystem::path savePath;
    MediaKind mediaKind = MediaKind::Unknown;
    int uploadLimitKBps = 0;
    int downloadLimitKBps = 0;
    double minimumBuffering = 10.0; // percent
    std::chrono::milliseconds tickInterval{1000};
};

/**
 * Polling loop driving one progressive download.
 *
 * Once per tick it reads the transfer status, selects and prioritizes the
 * media file when the metadata arrives, reports progress, bandwidth, seeds
 * and peers, and signals `buffered` when the threshold is reached. The loop
 * keeps feeding the observers after buffering and only ends on
 * cancellation or when the torrent turns out to contain no media.
 *
 * Engine exceptions are not caught and end the loop.
 */
class BufferingMonitor
{
public:
    BufferingMonitor(TransferSession &session,
                     TransferHandle &handle,
                     MediaFile &media,
                     MonitorSettings settings,
                     ProgressObservers observers,
                     DownloadCallbacks callbacks,
                     NotificationSink &notifications,
                     const PathResolver &resolver,
                     Clock &clock);

    BufferingMonitor(const BufferingMonitor &) = delete;
    BufferingMonitor &operator=(const BufferingMonitor &) = delete;

    DownloadResult run(CancellationToken &token);

    MonitorState state() const { return state_; }

private:
    // false when the torrent has no candidate file
    bool updateSelection();

    double reportProgress(const TransferStatus &status);

    // false when buffering could not be completed (no usable path)
    bool signalBuffered();

    void finishWithoutMedia();
    void finishCancelled();

    Seconds elapsed() const;

    TransferSession &session_;
    TransferHandle &handle_;
    MediaFile &media_;
    MonitorSettings settings_;
    ProgressObservers observers_;
    DownloadCallbacks callbacks_;
    NotificationSink &notifications_;
    const PathResolver &resolver_;
    Clock &clock_;

    MonitorState state_ = MonitorState::AwaitingMetadata;
    std::optional<TorrentManifest> manifest_;
    FileSelection selection_;
    PlaybackFeed playbackFeed_;
    bool alreadyBuffered_ = false;
    double lastProgress_ = 0.0;
    std::int64_t transferred_ = 0;
    Clock::TimePoint startTime_{};
    DownloadResult result_;
};
