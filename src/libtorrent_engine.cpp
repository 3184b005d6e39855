#include "libtorrent_engine.hpp"

#include <cstdint>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert.hpp>
#include <libtorrent/download_priority.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/torrent_flags.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>

#include "errors.hpp"

namespace
{
    class LibtorrentHandle : public TransferHandle
    {
    public:
        explicit LibtorrentHandle(lt::torrent_handle handle)
            : handle_(std::move(handle))
        {
        }

        // libtorrent uses -1 for "unlimited"
        void setUploadLimit(int bytesPerSec) override
        {
            handle_.set_upload_limit(bytesPerSec > 0 ? bytesPerSec : -1);
        }

        void setDownloadLimit(int bytesPerSec) override
        {
            handle_.set_download_limit(bytesPerSec > 0 ? bytesPerSec : -1);
        }

        void setSequentialDownload(bool enabled) override
        {
            if (enabled)
            {
                handle_.set_flags(lt::torrent_flags::sequential_download);
            }
            else
            {
                handle_.unset_flags(lt::torrent_flags::sequential_download);
            }
        }

        TransferStatus status() const override
        {
            lt::torrent_status ts = handle_.status();

            TransferStatus status;
            status.hasMetadata = ts.has_metadata;
            status.downloadRateBytesPerSec = ts.download_rate;
            status.uploadRateBytesPerSec = ts.upload_rate;
            status.numSeeds = ts.num_seeds;
            status.numPeers = ts.num_peers;
            return status;
        }

        std::optional<TorrentManifest> torrentFile() const override
        {
            std::shared_ptr<const lt::torrent_info> info = handle_.torrent_file();
            if (!info)
            {
                return std::nullopt;
            }

            const lt::file_storage &storage = info->files();

            TorrentManifest manifest;
            manifest.totalSize = info->total_size();
            manifest.files.reserve(static_cast<size_t>(storage.num_files()));
            for (lt::file_index_t i : storage.file_range())
            {
                ManifestFile file;
                file.size = storage.file_size(i);
                file.relativePath = storage.file_path(i);
                file.name = std::string(storage.file_name(i));
                manifest.files.push_back(std::move(file));
            }
            return manifest;
        }

        std::vector<std::int64_t> fileProgress() const override
        {
            std::vector<std::int64_t> progress;
            handle_.file_progress(progress, lt::torrent_handle::piece_granularity);
            return progress;
        }

        void setFilePriority(int fileIndex, int priority) override
        {
            auto value = priority <= 0 ? lt::dont_download
                                       : lt::download_priority_t(static_cast<std::uint8_t>(priority));
            handle_.file_priority(lt::file_index_t(fileIndex), value);
        }

        const lt::torrent_handle &native() const { return handle_; }

    private:
        lt::torrent_handle handle_;
    };

    class LibtorrentSession : public TransferSession
    {
    public:
        explicit LibtorrentSession(const lt::settings_pack &pack)
            : session_(lt::session_params(pack))
        {
        }

        std::unique_ptr<TransferHandle> addTorrentFile(const std::filesystem::path &descriptor,
                                                       const std::filesystem::path &savePath) override
        {
            lt::error_code ec;
            auto info = std::make_shared<lt::torrent_info>(descriptor.string(), ec);
            if (ec)
            {
                lastError_ = ec.message();
                return nullptr;
            }

            lt::add_torrent_params params;
            params.ti = std::move(info);
            params.save_path = savePath.string();
            return add(std::move(params));
        }

        std::unique_ptr<TransferHandle> addMagnet(const std::string &uri,
                                                  const std::filesystem::path &savePath) override
        {
            lt::add_torrent_params params;
            lt::error_code ec;
            lt::parse_magnet_uri(uri, params, ec);
            if (ec)
            {
                lastError_ = fmt::format("{} ({})", ec.message(), uri);
                return nullptr;
            }

            params.save_path = savePath.string();
            return add(std::move(params));
        }

        void removeTorrent(TransferHandle &handle) override
        {
            auto *native = dynamic_cast<LibtorrentHandle *>(&handle);
            if (!native)
            {
                throw EngineError("Handle does not belong to a libtorrent session");
            }
            session_.remove_torrent(native->native());
        }

        std::string getLastError() const override { return lastError_; }

    private:
        std::unique_ptr<TransferHandle> add(lt::add_torrent_params params)
        {
            lt::error_code ec;
            lt::torrent_handle handle = session_.add_torrent(std::move(params), ec);
            if (ec || !handle.is_valid())
            {
                lastError_ = ec ? ec.message() : std::string("engine returned an invalid handle");
                return nullptr;
            }
            return std::make_unique<LibtorrentHandle>(std::move(handle));
        }

        lt::session session_;
        std::string lastError_;
    };
}

LibtorrentEngine::LibtorrentEngine(EngineSettings settings)
    : settings_(std::move(settings))
{
}

std::unique_ptr<TransferSession> LibtorrentEngine::createSession()
{
    lt::settings_pack pack;
    pack.set_str(lt::settings_pack::listen_interfaces, settings_.listenInterfaces);
    pack.set_str(lt::settings_pack::user_agent, settings_.userAgent);
    pack.set_bool(lt::settings_pack::enable_dht, settings_.enableDht);
    pack.set_bool(lt::settings_pack::enable_lsd, true);
    pack.set_bool(lt::settings_pack::enable_upnp, true);
    pack.set_bool(lt::settings_pack::enable_natpmp, true);
    pack.set_int(lt::settings_pack::alert_mask, lt::alert_category::error);

    return std::make_unique<LibtorrentSession>(pack);
}
