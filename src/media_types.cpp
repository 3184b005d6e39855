#include "media_types.hpp"

#include <fmt/core.h>

#include "errors.hpp"

std::string toString(MediaKind kind)
{
    switch (kind)
    {
    case MediaKind::Movie:
        return "movie";
    case MediaKind::Show:
        return "show";
    case MediaKind::Unknown:
        return "unknown";
    }
    return fmt::format("invalid({})", static_cast<int>(kind));
}

std::string describeSource(const SourceDescriptor &source)
{
    if (const auto *file = std::get_if<TorrentFilePath>(&source))
    {
        return file->path.string();
    }
    return std::get<MagnetUri>(source).uri;
}

double minimumBufferingFor(MediaKind kind, const BufferingThresholds &thresholds)
{
    switch (kind)
    {
    case MediaKind::Show:
        return thresholds.show;
    case MediaKind::Unknown:
        return thresholds.unknown;
    case MediaKind::Movie:
        return thresholds.movie;
    }
    throw ConfigurationError(
        fmt::format("Unrecognized media kind: {}", static_cast<int>(kind)));
}
