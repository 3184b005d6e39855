#pragma once

#include <memory>
#include <string>

#include "transfer_engine.hpp"

/**
 * Session-wide settings applied to every libtorrent session.
 */
struct EngineSettings
{
    std::string listenInterfaces = "0.0.0.0:6881,[::]:6881";
    std::string userAgent = "TorrentStreamer/1.0";
    bool enableDht = true;
};

/**
 * TransferEngine backed by libtorrent-rasterbar.
 */
class LibtorrentEngine : public TransferEngine
{
public:
    explicit LibtorrentEngine(EngineSettings settings = {});

    std::unique_ptr<TransferSession> createSession() override;

private:
    EngineSettings settings_;
};
