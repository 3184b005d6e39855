#include "errors.hpp"
#include "media_types.hpp"
#include "notifications.hpp"
#include "paths.hpp"
#include "test_support.hpp"

#include <fstream>
#include <string>

namespace
{
    template <typename Function>
    bool throwsConfigurationError(Function &&function)
    {
        try
        {
            function();
        }
        catch (const ConfigurationError &)
        {
            return true;
        }
        return false;
    }
}

int main()
{
    TempDirectory temp("torrent_streamer_paths");

    try
    {
        section("Cache layout");
        CacheDirectories cache(temp.path() / "cache");
        check(cache.savePathFor(MediaKind::Movie) == temp.path() / "cache" / "Movies", "movies under Movies");
        check(cache.savePathFor(MediaKind::Show) == temp.path() / "cache" / "Shows", "shows under Shows");
        check(cache.savePathFor(MediaKind::Unknown) == temp.path() / "cache" / "Dropped", "dropped torrents under Dropped");
        check(throwsConfigurationError([&] { cache.savePathFor(static_cast<MediaKind>(7)); }),
              "unrecognized kind has no save path");

        check(cache.ensureCreated(), "cache directories created");
        check(std::filesystem::is_directory(cache.movieDownloads()) &&
                  std::filesystem::is_directory(cache.showDownloads()) &&
                  std::filesystem::is_directory(cache.droppedDownloads()) &&
                  std::filesystem::is_directory(cache.torrentDescriptors()),
              "all four directories exist");
        check(cache.ensureCreated(), "creating them again is not an error");

        auto blocker = temp.path() / "blocker";
        {
            std::ofstream out(blocker);
            out << "not a directory";
        }
        CacheDirectories blocked(blocker);
        check(!blocked.ensureCreated(), "a file in place of the root fails");
        check(!blocked.getLastError().empty(), "failure explained by getLastError()");

        check(!CacheDirectories::defaultRoot().empty(), "default root always available");
        check(CacheDirectories::defaultRoot().filename() == "torrent_streamer", "default root named after the program");

        section("Buffering thresholds");
        BufferingThresholds defaults;
        check(minimumBufferingFor(MediaKind::Movie, defaults) == 10.0, "movies buffer 10%");
        check(minimumBufferingFor(MediaKind::Show, defaults) == 5.0, "shows buffer 5%");
        check(minimumBufferingFor(MediaKind::Unknown, defaults) == 10.0, "dropped torrents buffer like movies");

        BufferingThresholds custom{20.0, 2.5, 15.0};
        check(minimumBufferingFor(MediaKind::Show, custom) == 2.5, "custom thresholds honored");
        check(throwsConfigurationError([&] { minimumBufferingFor(static_cast<MediaKind>(7), defaults); }),
              "unrecognized kind has no threshold");

        section("Usable paths");
        FilesystemPathResolver resolver;
        auto movieDir = cache.movieDownloads() / "Sintel (2010)";
        auto longPath = movieDir / "sintel.mkv";
        check(resolver.resolveUsablePath(longPath).empty(), "nothing until the engine creates the directory");

        std::filesystem::create_directories(movieDir);
        auto usable = resolver.resolveUsablePath(longPath);
        check(!usable.empty(), "resolved once the directory exists");
        check(usable == (std::filesystem::canonical(movieDir) / "sintel.mkv").string(), "resolved path is canonical");

        auto dotted = cache.movieDownloads() / "." / "Sintel (2010)" / ".." / "Sintel (2010)" / "sintel.mkv";
        check(resolver.resolveUsablePath(dotted) == usable, "dot segments collapsed");

        std::string tooLong(5000, 'a');
        check(resolver.resolveUsablePath(movieDir / tooLong).empty(), "over-long path rejected");
        check(resolver.resolveUsablePath("sintel.mkv").empty(), "bare file name rejected");

        section("Failure messages");
        check(localizedMessage("NoMediaInTorrent", "en") == "No media file found in this torrent.", "English message");
        check(localizedMessage("NoMediaInTorrent", "fr_FR.UTF-8") == "Aucun fichier média trouvé dans ce torrent.",
              "French message from a full locale name");
        check(localizedMessage("NoMediaInDroppedTorrent", "xx_YY") ==
                  localizedMessage("NoMediaInDroppedTorrent", "en"),
              "unknown locale falls back to English");
        check(localizedMessage("SomethingElse", "fr") == "SomethingElse", "unknown key returned as is");

        auto dropped = makeFailureEvent(FailureKind::NoMediaInDroppedTorrent, "en");
        check(dropped.kind == FailureKind::NoMediaInDroppedTorrent, "event keeps its kind");
        check(dropped.messageKey == "NoMediaInDroppedTorrent", "dropped torrent key");
        check(dropped.message == "No media file found in the dropped torrent.", "dropped torrent message");

        auto catalog = makeFailureEvent(FailureKind::NoMediaInTorrent, "es");
        check(catalog.messageKey == "NoMediaInTorrent", "catalog torrent key");
        check(catalog.message == localizedMessage("NoMediaInTorrent", "es"), "Spanish message");
        check(!currentLocale().empty(), "process locale never empty");
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return finish();
}
