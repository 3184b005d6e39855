#pragma once

#include <chrono>
#include <future>

#include "buffering_monitor.hpp"
#include "cancellation.hpp"
#include "media_types.hpp"
#include "notifications.hpp"
#include "paths.hpp"
#include "transfer_engine.hpp"

/**
 * Entry point of a progressive download.
 *
 * Opens a dedicated engine session, registers the torrent and hands the
 * handle to a BufferingMonitor. The session and handle are scoped to the
 * call and released on every exit path, including exceptions.
 */
class DownloadService
{
public:
    DownloadService(TransferEngine &engine,
                    const SavePathProvider &savePaths,
                    NotificationSink &notifications,
                    const PathResolver &resolver,
                    Clock &clock,
                    BufferingThresholds thresholds = {});

    /**
     * Run a download until it is cancelled or turns out to hold no media.
     *
     * @param request Source, media kind and transfer limits
     * @param media Receives the playable file path once buffered
     * @param observers Progress, bandwidth, seed and peer observers
     * @param callbacks buffered / cancelled / mediaBuffered callbacks
     * @param token Cancels the download when triggered
     * @return How the download ended
     * @throws ConfigurationError for an unknown media kind or an invalid source
     * @throws EngineError (or any engine exception) raised while polling
     */
    DownloadResult download(const DownloadRequest &request,
                            MediaFile &media,
                            const ProgressObservers &observers,
                            const DownloadCallbacks &callbacks,
                            CancellationToken &token);

    /**
     * Same as download(), on its own thread.
     * media, token and this service must outlive the returned future.
     */
    std::future<DownloadResult> downloadAsync(DownloadRequest request,
                                              MediaFile &media,
                                              ProgressObservers observers,
                                              DownloadCallbacks callbacks,
                                              CancellationToken &token);

    // Tick period of the monitors started by this service
    void setTickInterval(std::chrono::milliseconds interval) { tickInterval_ = interval; }

private:
    TransferEngine &engine_;
    const SavePathProvider &savePaths_;
    NotificationSink &notifications_;
    const PathResolver &resolver_;
    Clock &clock_;
    BufferingThresholds thresholds_;
    std::chrono::milliseconds tickInterval_{1000};
};
