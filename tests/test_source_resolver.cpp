#include "errors.hpp"
#include "source_resolver.hpp"
#include "test_support.hpp"

#include <fstream>
#include <stdexcept>
#include <variant>

namespace
{
    const std::string ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    const std::string MAGNET = "magnet:?xt=urn:btih:0123456789abcdef0123456789abcdef01234567&dn=Sintel";

    template <typename Exception, typename Function>
    bool throwsAs(Function &&function)
    {
        try
        {
            function();
        }
        catch (const Exception &)
        {
            return true;
        }
        catch (const std::exception &)
        {
            return false;
        }
        return false;
    }
}

int main()
{
    TempDirectory temp("torrent_streamer_sources");
    auto descriptor = temp.path() / "sintel.torrent";
    {
        std::ofstream out(descriptor, std::ios::binary);
        out << "abc";
    }

    try
    {
        HttpClient http;
        http.setMaxAttempts(1);
        SourceResolver resolver(http, temp.path() / "Torrents", 5);

        section("Source detection");
        check(SourceResolver::isMagnetUri(MAGNET), "magnet link detected");
        check(SourceResolver::isMagnetUri("MAGNET:?xt=urn:btih:abc"), "magnet scheme is case-insensitive");
        check(!SourceResolver::isMagnetUri("magnet.torrent"), "file named magnet is not a magnet link");
        check(SourceResolver::isRemoteUrl("https://example.org/sintel.torrent"), "https URL detected");
        check(SourceResolver::isRemoteUrl("HTTP://example.org/sintel.torrent"), "http scheme is case-insensitive");
        check(!SourceResolver::isRemoteUrl("/srv/http/sintel.torrent"), "local path is not a URL");

        section("Descriptor file names");
        check(SourceResolver::descriptorFileName("https://example.org/files/sintel.torrent") == "sintel.torrent",
              "last path segment kept");
        check(SourceResolver::descriptorFileName("https://example.org/get/sintel.torrent?key=1#top") == "sintel.torrent",
              "query and fragment dropped");
        check(SourceResolver::descriptorFileName("https://example.org/download/1234") == "1234.torrent",
              ".torrent extension added");
        check(SourceResolver::descriptorFileName("https://example.org/") == "download.torrent",
              "URL without a file name falls back to download.torrent");
        check(SourceResolver::descriptorFileName("https://example.org") == "download.torrent",
              "bare host falls back to download.torrent");
        check(SourceResolver::descriptorFileName("https://example.org/a%20b:c.TORRENT") == "a_20b_c.TORRENT",
              "unsafe characters replaced, existing extension kept");

        section("Magnet links");
        {
            auto source = resolver.resolve(MAGNET);
            const auto *magnet = std::get_if<MagnetUri>(&source);
            check(magnet && magnet->uri == MAGNET, "magnet passed through unchanged");
        }
        check(throwsAs<ConfigurationError>([&] { resolver.resolve(MAGNET, "sha256:" + ABC_SHA256); }),
              "checksum on a magnet link is a configuration error");

        section("Local descriptors");
        {
            auto source = resolver.resolve(descriptor.string());
            const auto *file = std::get_if<TorrentFilePath>(&source);
            check(file && file->path == descriptor, "existing file resolved to a torrent file path");
        }
        {
            auto source = resolver.resolve(descriptor.string(), "sha256:" + ABC_SHA256);
            check(std::holds_alternative<TorrentFilePath>(source), "matching checksum accepted");
        }
        check(throwsAs<ConfigurationError>([&] { resolver.resolve(descriptor.string(), "sha256:" + std::string(64, 'f')); }),
              "mismatching checksum is a configuration error");
        check(throwsAs<ConfigurationError>([&] { resolver.resolve(descriptor.string(), "crc32:352441c2"); }),
              "malformed checksum is a configuration error");
        check(throwsAs<ConfigurationError>([&] { resolver.resolve((temp.path() / "missing.torrent").string()); }),
              "missing file is a configuration error");
        check(throwsAs<ConfigurationError>([&] { resolver.resolve(temp.path().string()); }),
              "directory is not a torrent file");
        check(throwsAs<ConfigurationError>([&] { resolver.resolve(""); }), "empty source rejected");

        section("Remote descriptors");
        {
            // Port 1 on loopback refuses the connection
            bool fetchFailed = throwsAs<std::runtime_error>([&] { resolver.resolve("http://127.0.0.1:1/sintel.torrent"); });
            check(fetchFailed, "unreachable server reported as a runtime error");
            check(!std::filesystem::exists(temp.path() / "Torrents" / "sintel.torrent"), "nothing left on disk");
            check(!std::filesystem::exists(temp.path() / "Torrents" / "sintel.torrent.part"), "partial file removed");
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return finish();
}
