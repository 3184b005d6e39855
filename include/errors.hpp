#pragma once

#include <stdexcept>
#include <string>

/**
 * Invalid input detected before (or while) registering a torrent:
 * unknown media kind, unreadable descriptor, malformed magnet link,
 * checksum mismatch.
 */
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

/**
 * Failure reported by the transfer engine while a download is active.
 */
class EngineError : public std::runtime_error
{
public:
    explicit EngineError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};
