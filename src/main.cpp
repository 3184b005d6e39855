#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <map>

#include <fmt/core.h>
#include <CLI/CLI.hpp>

#include "config.hpp"
#include "download_service.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "libtorrent_engine.hpp"
#include "paths.hpp"
#include "progress_view.hpp"
#include "source_resolver.hpp"
#include "checksum.hpp"

namespace
{
    std::atomic<bool> interrupted{false};

    // Only flips a flag: the main thread turns it into a cancellation
    void onSignal(int)
    {
        interrupted.store(true);
    }

    constexpr int EXIT_NO_MEDIA = 2;
}

int main(int argc, char *argv[])
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            fmt::print("Torrent Streamer v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - libtorrent-rasterbar: BitTorrent engine\n");
            fmt::print("  - libcurl: .torrent fetching\n");
            fmt::print("  - OpenSSL: checksum verification\n");
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt: Modern string formatting\n");
            return 0;
        }
    }

    CLI::App app{"Torrent Streamer v1.0 - Progressive torrent downloader for media playback"};

    StreamConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("SOURCE", config.source, "Magnet link, .torrent file or http(s) URL of a .torrent")
        ->required();

    std::map<std::string, MediaKind> kinds{
        {"movie", MediaKind::Movie},
        {"show", MediaKind::Show},
        {"unknown", MediaKind::Unknown}};
    app.add_option("-k,--kind", config.mediaKind, "Kind of media in the torrent (movie, show, unknown)")
        ->transform(CLI::CheckedTransformer(kinds, CLI::ignore_case))
        ->default_str("unknown");

    app.add_option("--title", config.title, "Title shown when the media is ready");

    app.add_option("-u,--upload-limit", config.uploadLimitKBps, "Upload limit in KB/s (0 = unlimited)")
        ->check(CLI::NonNegativeNumber)
        ->default_val(0);

    app.add_option("-d,--download-limit", config.downloadLimitKBps, "Download limit in KB/s (0 = unlimited)")
        ->check(CLI::NonNegativeNumber)
        ->default_val(0);

    app.add_option("--cache-dir", config.cacheDir, "Root directory of downloads and fetched .torrent files")
        ->envname("TORRENT_STREAMER_CACHE");

    app.add_option("--movie-buffering", config.thresholds.movie, "Percent to buffer before a movie is playable")
        ->check(CLI::Range(0.0, 100.0))
        ->default_val(config.thresholds.movie);

    app.add_option("--show-buffering", config.thresholds.show, "Percent to buffer before an episode is playable")
        ->check(CLI::Range(0.0, 100.0))
        ->default_val(config.thresholds.show);

    app.add_option("--unknown-buffering", config.thresholds.unknown, "Percent to buffer for dropped torrents")
        ->check(CLI::Range(0.0, 100.0))
        ->default_val(config.thresholds.unknown);

    app.add_option("-c,--checksum", config.expectedChecksum,
                   "Expected .torrent checksum as 'algorithm:hexhash' (sha256 or sha1)")
        ->check([](const std::string &cs) -> std::string
                {
            if (cs.empty()) return "";
            try {
                ChecksumVerifier::parseChecksum(cs);
                return "";
            } catch (const std::exception &e) {
                return std::string("Invalid checksum format: ") + e.what();
            } });

    app.add_option("-r,--retry-count", config.maxRetries, "Maximum retry attempts when fetching a .torrent")
        ->check(CLI::Range(0, 10))
        ->default_val(3);

    app.add_option("-t,--timeout", config.timeoutSeconds, "Timeout in seconds when fetching a .torrent")
        ->check(CLI::PositiveNumber)
        ->default_val(60);

    app.add_option("--listen", config.listenInterfaces, "Interfaces the engine listens on")
        ->default_val(config.listenInterfaces);

    app.add_flag("--stop-when-buffered", config.stopWhenBuffered,
                 "Stop downloading once the media is playable");

    app.add_flag("-v,--version", config.showVersion, "Display version information");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    // ====================================================================
    // PREPARE
    // ====================================================================

    CacheDirectories cache(config.cacheDir.empty() ? CacheDirectories::defaultRoot()
                                                   : std::filesystem::path(config.cacheDir));
    if (!cache.ensureCreated())
    {
        fmt::print(stderr, "✗ {}\n", cache.getLastError());
        return 1;
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try
    {
        HttpClient http;
        http.setMaxAttempts(config.maxRetries + 1);

        SourceResolver resolver(http, cache.torrentDescriptors(), config.timeoutSeconds);

        DownloadRequest request;
        request.source = resolver.resolve(config.source, config.expectedChecksum);
        request.mediaKind = config.mediaKind;
        request.uploadLimitKBps = config.uploadLimitKBps;
        request.downloadLimitKBps = config.downloadLimitKBps;

        fmt::print("Torrent Streamer v1.0\n");
        fmt::print("====================================\n\n");
        fmt::print("  Source:      {}\n", describeSource(request.source));
        fmt::print("  Kind:        {}\n", toString(request.mediaKind));
        fmt::print("  Save path:   {}\n", cache.savePathFor(request.mediaKind).string());
        fmt::print("  Buffering:   {:.1f}%\n", minimumBufferingFor(request.mediaKind, config.thresholds));
        fmt::print("  Limits:      down {} KB/s, up {} KB/s (0 = unlimited)\n\n",
                   request.downloadLimitKBps, request.uploadLimitKBps);

        EngineSettings engineSettings;
        engineSettings.listenInterfaces = config.listenInterfaces;
        LibtorrentEngine engine(engineSettings);

        ConsoleNotificationSink notifications;
        FilesystemPathResolver pathResolver;
        SteadyClock clock;
        DownloadService service(engine, cache, notifications, pathResolver, clock, config.thresholds);

        ConsoleProgressView view;
        CancellationToken token;
        MediaFile media{config.title, {}};

        ProgressObservers observers;
        observers.downloadProgress = [&view](double percent)
        { view.setProgress(percent); };
        observers.bandwidthRate = [&view](const BandwidthSample &sample)
        { view.setBandwidth(sample); };
        observers.seedCount = [&view](int seeds)
        { view.setSeeds(seeds); };
        observers.peerCount = [&view](int peers)
        { view.setPeers(peers); };

        DownloadCallbacks callbacks;
        callbacks.buffered = [&view]()
        { view.message("✓ Buffering threshold reached"); };
        callbacks.cancelled = [&view]()
        { view.message("Download cancelled."); };
        callbacks.mediaBuffered = [&view, &token, &config](const MediaFile &file, PlaybackFeed &)
        {
            view.message(fmt::format("✓ Ready to play{}: {}",
                                     file.title.empty() ? "" : " " + file.title, file.filePath));
            if (config.stopWhenBuffered)
            {
                token.cancel();
            }
        };

        auto pending = service.downloadAsync(request, media, observers, callbacks, token);
        while (pending.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready)
        {
            if (interrupted.load() && !token.isCancelled())
            {
                token.cancel();
            }
        }

        DownloadResult result = pending.get();
        view.finish();

        if (result.outcome == DownloadOutcome::NoMediaFound)
        {
            return EXIT_NO_MEDIA;
        }
        if (!result.mediaPath.empty())
        {
            fmt::print("Media file: {}\n", result.mediaPath);
        }
        return 0;
    }
    catch (const ConfigurationError &e)
    {
        fmt::print(stderr, "✗ Invalid input: {}\n", e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
