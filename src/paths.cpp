#include "paths.hpp"

#include <climits>
#include <cstdlib>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "errors.hpp"

#ifndef PATH_MAX
#define PATH_MAX 4096
#endif

CacheDirectories::CacheDirectories(std::filesystem::path root)
    : root_(std::move(root))
{
}

std::filesystem::path CacheDirectories::savePathFor(MediaKind kind) const
{
    switch (kind)
    {
    case MediaKind::Movie:
        return movieDownloads();
    case MediaKind::Show:
        return showDownloads();
    case MediaKind::Unknown:
        return droppedDownloads();
    }
    throw ConfigurationError(
        fmt::format("No download directory for media kind {}", static_cast<int>(kind)));
}

bool CacheDirectories::ensureCreated()
{
    for (const auto &directory : {movieDownloads(), showDownloads(), droppedDownloads(), torrentDescriptors()})
    {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec)
        {
            lastError_ = fmt::format("Failed to create directory {}: {}", directory.string(), ec.message());
            return false;
        }
    }
    return true;
}

std::filesystem::path CacheDirectories::defaultRoot()
{
    if (const char *xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg)
    {
        return std::filesystem::path(xdg) / "torrent_streamer";
    }
    if (const char *home = std::getenv("HOME"); home && *home)
    {
        return std::filesystem::path(home) / ".cache" / "torrent_streamer";
    }

    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    return (ec ? std::filesystem::path("/tmp") : temp) / "torrent_streamer";
}

std::string FilesystemPathResolver::resolveUsablePath(const std::filesystem::path &longPath) const
{
    std::error_code ec;
    auto directory = longPath.parent_path();
    if (directory.empty() || !std::filesystem::is_directory(directory, ec))
    {
        return {};
    }

    auto canonicalDirectory = std::filesystem::canonical(directory, ec);
    if (ec)
    {
        return {};
    }

    auto usable = (canonicalDirectory / longPath.filename()).string();
    if (usable.size() >= PATH_MAX)
    {
        return {};
    }
    return usable;
}
