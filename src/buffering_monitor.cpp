#include "buffering_monitor.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

#include <fmt/core.h>

#include "bandwidth.hpp"
#include "errors.hpp"

namespace
{
    template <typename Callback, typename... Args>
    void notify(const Callback &callback, Args &&...args)
    {
        if (callback)
        {
            callback(std::forward<Args>(args)...);
        }
    }
}

void PlaybackFeed::subscribe(ProgressObserver progress, BandwidthObserver bandwidth)
{
    if (progress)
    {
        progressObservers_.push_back(std::move(progress));
    }
    if (bandwidth)
    {
        bandwidthObservers_.push_back(std::move(bandwidth));
    }
}

void PlaybackFeed::publish(double progress, const BandwidthSample &sample) const
{
    for (const auto &observer : progressObservers_)
    {
        observer(progress);
    }
    for (const auto &observer : bandwidthObservers_)
    {
        observer(sample);
    }
}

std::string toString(MonitorState state)
{
    switch (state)
    {
    case MonitorState::AwaitingMetadata:
        return "awaiting metadata";
    case MonitorState::SelectingFile:
        return "selecting file";
    case MonitorState::Streaming:
        return "streaming";
    case MonitorState::Buffered:
        return "buffered";
    case MonitorState::NoMediaFound:
        return "no media found";
    case MonitorState::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

BufferingMonitor::BufferingMonitor(TransferSession &session,
                                   TransferHandle &handle,
                                   MediaFile &media,
                                   MonitorSettings settings,
                                   ProgressObservers observers,
                                   DownloadCallbacks callbacks,
                                   NotificationSink &notifications,
                                   const PathResolver &resolver,
                                   Clock &clock)
    : session_(session),
      handle_(handle),
      media_(media),
      settings_(std::move(settings)),
      observers_(std::move(observers)),
      callbacks_(std::move(callbacks)),
      notifications_(notifications),
      resolver_(resolver),
      clock_(clock)
{
}

DownloadResult BufferingMonitor::run(CancellationToken &token)
{
    handle_.setUploadLimit(settings_.uploadLimitKBps * 1024);
    handle_.setDownloadLimit(settings_.downloadLimitKBps * 1024);
    handle_.setSequentialDownload(true);

    startTime_ = clock_.now();

    while (true)
    {
        if (token.isCancelled())
        {
            finishCancelled();
            break;
        }

        TransferStatus status = handle_.status();
        double progress = 0.0;

        if (status.hasMetadata)
        {
            if (!updateSelection())
            {
                finishWithoutMedia();
                break;
            }
            progress = reportProgress(status);
        }

        // Nothing is playable (nor on disk) before the first piece of the file arrives
        if (selection_.hasMediaIndex() && transferred_ > 0 &&
            progress >= settings_.minimumBuffering && !alreadyBuffered_)
        {
            if (!signalBuffered())
            {
                finishWithoutMedia();
                break;
            }
        }

        if (!clock_.sleepFor(settings_.tickInterval, token))
        {
            finishCancelled();
            break;
        }
    }

    result_.elapsed = elapsed();
    return result_;
}

bool BufferingMonitor::updateSelection()
{
    if (!manifest_)
    {
        manifest_ = handle_.torrentFile();
        if (!manifest_)
        {
            throw EngineError("Engine reported metadata but returned no file manifest");
        }
        state_ = MonitorState::SelectingFile;
    }

    if (!selection_.select(*manifest_, handle_))
    {
        return false;
    }

    // The directory appears once the engine writes the first piece
    selection_.resolvePath(*manifest_, settings_.savePath, resolver_);

    if (state_ == MonitorState::SelectingFile)
    {
        state_ = MonitorState::Streaming;
    }
    return true;
}

double BufferingMonitor::reportProgress(const TransferStatus &status)
{
    auto perFile = handle_.fileProgress();
    auto index = static_cast<size_t>(selection_.mediaIndex());
    if (index >= perFile.size())
    {
        throw EngineError(fmt::format("Engine returned progress for {} files, media file is #{}",
                                      perFile.size(), index));
    }

    std::int64_t transferred = perFile[index];
    transferred_ = std::max(transferred_, transferred);
    std::int64_t total = selection_.totalSizeExcludingIgnored();

    // Piece rechecks can make the engine count go back; the user never sees it
    double progress = std::max(lastProgress_, progressPercent(transferred, total));
    lastProgress_ = progress;

    BandwidthSample sample = makeBandwidthSample(status, elapsed(), transferred, total);

    notify(observers_.seedCount, status.numSeeds);
    notify(observers_.peerCount, status.numPeers);
    notify(observers_.downloadProgress, progress);
    notify(observers_.bandwidthRate, sample);

    if (alreadyBuffered_)
    {
        playbackFeed_.publish(progress, sample);
    }
    return progress;
}

bool BufferingMonitor::signalBuffered()
{
    notify(callbacks_.buffered);
    result_.buffered = true;

    if (!selection_.hasPath())
    {
        return false;
    }

    alreadyBuffered_ = true;
    state_ = MonitorState::Buffered;
    media_.filePath = selection_.resolvedPath();
    result_.mediaPath = media_.filePath;

    notify(callbacks_.mediaBuffered, media_, playbackFeed_);
    return true;
}

void BufferingMonitor::finishWithoutMedia()
{
    state_ = MonitorState::NoMediaFound;
    result_.outcome = DownloadOutcome::NoMediaFound;

    try
    {
        session_.removeTorrent(handle_);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: Could not remove torrent without media: {}\n", e.what());
    }

    notifications_.publish(makeFailureEvent(settings_.mediaKind == MediaKind::Unknown
                                                ? FailureKind::NoMediaInDroppedTorrent
                                                : FailureKind::NoMediaInTorrent));
}

void BufferingMonitor::finishCancelled()
{
    state_ = MonitorState::Cancelled;
    result_.outcome = DownloadOutcome::Cancelled;

    notify(callbacks_.cancelled);

    try
    {
        session_.removeTorrent(handle_);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "Warning: Could not remove torrent after cancellation: {}\n", e.what());
    }
}

Seconds BufferingMonitor::elapsed() const
{
    return std::chrono::duration_cast<Seconds>(clock_.now() - startTime_);
}
