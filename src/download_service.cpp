#include "download_service.hpp"

#include <cstdio>
#include <memory>
#include <utility>
#include <variant>

#include <fmt/core.h>

#include "errors.hpp"

DownloadService::DownloadService(TransferEngine &engine,
                                 const SavePathProvider &savePaths,
                                 NotificationSink &notifications,
                                 const PathResolver &resolver,
                                 Clock &clock,
                                 BufferingThresholds thresholds)
    : engine_(engine),
      savePaths_(savePaths),
      notifications_(notifications),
      resolver_(resolver),
      clock_(clock),
      thresholds_(thresholds)
{
}

DownloadResult DownloadService::download(const DownloadRequest &request,
                                         MediaFile &media,
                                         const ProgressObservers &observers,
                                         const DownloadCallbacks &callbacks,
                                         CancellationToken &token)
{
    fmt::print(stderr, "Start downloading: {}\n", describeSource(request.source));

    // Observers never start from an undefined state
    if (observers.downloadProgress)
        observers.downloadProgress(0.0);
    if (observers.bandwidthRate)
        observers.bandwidthRate(BandwidthSample{});
    if (observers.seedCount)
        observers.seedCount(0);
    if (observers.peerCount)
        observers.peerCount(0);

    // Both throw ConfigurationError before the engine is touched
    std::filesystem::path savePath = savePaths_.savePathFor(request.mediaKind);
    double minimumBuffering = minimumBufferingFor(request.mediaKind, thresholds_);

    std::unique_ptr<TransferSession> session = engine_.createSession();
    if (!session)
    {
        throw EngineError("Transfer engine could not create a session");
    }

    std::unique_ptr<TransferHandle> handle;
    if (const auto *file = std::get_if<TorrentFilePath>(&request.source))
    {
        handle = session->addTorrentFile(file->path, savePath);
        if (!handle)
        {
            throw ConfigurationError(fmt::format("Cannot load torrent file {}: {}",
                                                 file->path.string(), session->getLastError()));
        }
    }
    else
    {
        const auto &magnet = std::get<MagnetUri>(request.source);
        handle = session->addMagnet(magnet.uri, savePath);
        if (!handle)
        {
            throw ConfigurationError(fmt::format("Invalid magnet URI: {}", session->getLastError()));
        }
    }

    MonitorSettings settings;
    settings.savePath = savePath;
    settings.mediaKind = request.mediaKind;
    settings.uploadLimitKBps = request.uploadLimitKBps;
    settings.downloadLimitKBps = request.downloadLimitKBps;
    settings.minimumBuffering = minimumBuffering;
    settings.tickInterval = tickInterval_;

    BufferingMonitor monitor(*session, *handle, media, std::move(settings), observers, callbacks,
                             notifications_, resolver_, clock_);
    DownloadResult result = monitor.run(token);

    fmt::print(stderr, "Download ended ({}) after {:.0f}s\n", toString(monitor.state()), result.elapsed.count());

    // handle is released before session (reverse declaration order)
    return result;
}

std::future<DownloadResult> DownloadService::downloadAsync(DownloadRequest request,
                                                           MediaFile &media,
                                                           ProgressObservers observers,
                                                           DownloadCallbacks callbacks,
                                                           CancellationToken &token)
{
    return std::async(std::launch::async,
                      [this, request = std::move(request), &media,
                       observers = std::move(observers), callbacks = std::move(callbacks), &token]()
                      { return download(request, media, observers, callbacks, token); });
}
