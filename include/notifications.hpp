#pragma once

#include <string>

/**
 * Why a download ended without anything to play.
 */
enum class FailureKind
{
    NoMediaInDroppedTorrent, // torrent dropped by the user
    NoMediaInTorrent         // torrent picked from the catalog
};

struct FailureEvent
{
    FailureKind kind;
    std::string messageKey;
    std::string message; // already localized
};

/**
 * Localized text for a message key ("NoMediaInTorrent", ...).
 * Unknown locales fall back to English, unknown keys to the key itself.
 *
 * @param key Message key
 * @param locale Language code such as "en" or "fr_FR.UTF-8"
 */
std::string localizedMessage(const std::string &key, const std::string &locale = "en");

/**
 * Locale of the process, read from LC_ALL / LC_MESSAGES / LANG.
 */
std::string currentLocale();

FailureEvent makeFailureEvent(FailureKind kind, const std::string &locale = currentLocale());

/**
 * Receives the structured failures raised by a download.
 */
class NotificationSink
{
public:
    virtual ~NotificationSink() = default;

    virtual void publish(const FailureEvent &event) = 0;
};

// Prints events on stderr
class ConsoleNotificationSink : public NotificationSink
{
public:
    void publish(const FailureEvent &event) override;
};
