#include "notifications.hpp"

#include <cstdio>
#include <cstdlib>
#include <map>

#include <fmt/core.h>

namespace
{
    using Catalog = std::map<std::string, std::string>;

    const std::map<std::string, Catalog> &catalogs()
    {
        static const std::map<std::string, Catalog> messages = {
            {"en",
             {{"NoMediaInTorrent", "No media file found in this torrent."},
              {"NoMediaInDroppedTorrent", "No media file found in the dropped torrent."}}},
            {"fr",
             {{"NoMediaInTorrent", "Aucun fichier média trouvé dans ce torrent."},
              {"NoMediaInDroppedTorrent", "Aucun fichier média trouvé dans le torrent déposé."}}},
            {"es",
             {{"NoMediaInTorrent", "No se encontró ningún archivo multimedia en este torrent."},
              {"NoMediaInDroppedTorrent", "No se encontró ningún archivo multimedia en el torrent soltado."}}},
        };
        return messages;
    }

    // "fr_FR.UTF-8" -> "fr"
    std::string languageOf(const std::string &locale)
    {
        auto end = locale.find_first_of("_.@");
        return locale.substr(0, end);
    }
}

std::string localizedMessage(const std::string &key, const std::string &locale)
{
    const auto &all = catalogs();

    auto catalog = all.find(languageOf(locale));
    if (catalog == all.end())
    {
        catalog = all.find("en");
    }

    auto message = catalog->second.find(key);
    if (message != catalog->second.end())
    {
        return message->second;
    }

    const auto &english = all.at("en");
    auto fallback = english.find(key);
    return fallback != english.end() ? fallback->second : key;
}

std::string currentLocale()
{
    for (const char *variable : {"LC_ALL", "LC_MESSAGES", "LANG"})
    {
        const char *value = std::getenv(variable);
        if (value && *value && std::string(value) != "C" && std::string(value) != "POSIX")
        {
            return value;
        }
    }
    return "en";
}

FailureEvent makeFailureEvent(FailureKind kind, const std::string &locale)
{
    std::string key = kind == FailureKind::NoMediaInDroppedTorrent ? "NoMediaInDroppedTorrent"
                                                                   : "NoMediaInTorrent";
    return FailureEvent{kind, key, localizedMessage(key, locale)};
}

void ConsoleNotificationSink::publish(const FailureEvent &event)
{
    fmt::print(stderr, "Error: {}\n", event.message);
}
