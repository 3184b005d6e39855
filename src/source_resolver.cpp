#include "source_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "checksum.hpp"
#include "errors.hpp"

namespace
{
    bool startsWithNoCase(const std::string &value, const std::string &prefix)
    {
        if (value.size() < prefix.size())
        {
            return false;
        }
        return std::equal(prefix.begin(), prefix.end(), value.begin(), [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    }
}

SourceResolver::SourceResolver(HttpClient &http, std::filesystem::path descriptorDirectory, int timeoutSeconds)
    : http_(http),
      descriptorDirectory_(std::move(descriptorDirectory)),
      timeoutSeconds_(timeoutSeconds)
{
}

bool SourceResolver::isMagnetUri(const std::string &argument)
{
    return startsWithNoCase(argument, "magnet:?");
}

bool SourceResolver::isRemoteUrl(const std::string &argument)
{
    return startsWithNoCase(argument, "http://") || startsWithNoCase(argument, "https://");
}

std::string SourceResolver::descriptorFileName(const std::string &url)
{
    std::string path = url.substr(0, url.find_first_of("?#"));

    auto schemeEnd = path.find("://");
    auto hostStart = schemeEnd == std::string::npos ? 0 : schemeEnd + 3;
    auto slash = path.find_last_of('/');

    std::string name;
    if (slash != std::string::npos && slash >= hostStart && slash + 1 < path.size())
    {
        name = path.substr(slash + 1);
    }
    if (name.empty() || path.find('/', hostStart) == std::string::npos)
    {
        name = "download";
    }

    std::replace_if(name.begin(), name.end(), [](char ch)
                    { return ch == '\\' || ch == ':' || ch == '%'; }, '_');

    std::string extension = ".torrent";
    bool hasExtension = name.size() > extension.size() &&
                        startsWithNoCase(name.substr(name.size() - extension.size()), extension);
    return hasExtension ? name : name + extension;
}

SourceDescriptor SourceResolver::resolve(const std::string &argument,
                                         const std::optional<std::string> &expectedChecksum)
{
    if (argument.empty())
    {
        throw ConfigurationError("Empty torrent source");
    }

    if (isMagnetUri(argument))
    {
        if (expectedChecksum)
        {
            throw ConfigurationError("A checksum can only be verified for .torrent files, not magnet links");
        }
        return MagnetUri{argument};
    }

    std::filesystem::path descriptor;
    if (isRemoteUrl(argument))
    {
        descriptor = descriptorDirectory_ / descriptorFileName(argument);
        fmt::print(stderr, "Fetching torrent: {}\n", argument);
        if (!http_.fetchFile(argument, descriptor, timeoutSeconds_))
        {
            throw std::runtime_error(fmt::format("Cannot fetch torrent {}: {}", argument, http_.getLastError()));
        }
        if (http_.getRetryCount() > 0)
        {
            fmt::print(stderr, "Fetched torrent after {} failed attempt(s)\n", http_.getRetryCount());
        }
    }
    else
    {
        descriptor = argument;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(descriptor, ec))
        {
            throw ConfigurationError(fmt::format("Torrent file not found: {}", descriptor.string()));
        }
    }

    if (expectedChecksum)
    {
        verifyChecksum(descriptor, *expectedChecksum);
    }
    return TorrentFilePath{descriptor};
}

void SourceResolver::verifyChecksum(const std::filesystem::path &descriptor, const std::string &expectedChecksum) const
{
    bool valid = false;
    try
    {
        valid = ChecksumVerifier::verify(descriptor, expectedChecksum);
    }
    catch (const std::runtime_error &e)
    {
        throw ConfigurationError(fmt::format("Checksum verification error: {}", e.what()));
    }

    if (!valid)
    {
        throw ConfigurationError(fmt::format("Checksum mismatch for {} (expected {})",
                                             descriptor.string(), expectedChecksum));
    }
}
