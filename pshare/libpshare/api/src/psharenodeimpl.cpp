#include "psharenodeimpl.hpp"

#include <filesystem>
#include <sstream>
#include <utility>
#include <vector>

#include <glog/logging.h>

#include "chunkerimpl.hpp"
#include "chunkfetcherimpl.hpp"
#include "chunkserverimpl.hpp"
#include "chunkstoreimpl.hpp"
#include "defaultconfigvalues.hpp"
#include "downloadflowimpl.hpp"
#include "hexencoderimpl.hpp"
#include "iothreadpool.hpp"
#include "jsonconfigloader.hpp"
#include "manifestcodecimpl.hpp"
#include "messageserializerimpl.hpp"
#include "seedflow.hpp"
#include "sha256hasherimpl.hpp"
#include "trackerclientimpl.hpp"

namespace pshare
{
namespace
{
std::string describe_failure(const flows::DownloadResult &result)
{
    std::ostringstream ss;
    ss << "Download failed (" << result.status << ')';
    if (result.failed_chunk_index)
    {
        ss << " at chunk " << *result.failed_chunk_index;
    }
    else if (result.status == utils::ErrorCode::INTEGRITY_ERROR)
    {
        ss << ": the downloaded file does not match the manifest file hash";
    }
    ss << ", check the log file for details";
    return ss.str();
}
}  // namespace

PShareNodeImpl::PShareNodeImpl(const std::string &config_file_path)
    : cfg_ {config::JSONConfigLoader {config_file_path}, std::make_unique<DefaultConfigValues>()}
    , hasher_ {std::make_shared<crypto::SHA256HasherImpl>()}
    , hex_encoder_ {std::make_shared<crypto::HexEncoderImpl>()}
    , chunker_ {std::make_shared<storage::ChunkerImpl>(hasher_, hex_encoder_)}
    , chunk_store_ {std::make_shared<storage::ChunkStoreImpl>(hasher_, hex_encoder_)}
    , manifest_codec_ {std::make_shared<storage::ManifestCodecImpl>()}
    , message_serializer_ {std::make_shared<protocol::MessageSerializerImpl>()}
    , download_flow_ {std::make_unique<flows::DownloadFlowImpl>(
          std::make_shared<network::ChunkFetcherImpl>(message_serializer_), chunk_store_,
          chunker_)}
    , download_flow_listener_ {std::make_shared<DownloadFlowListenerDelegate>()}
{
    auto tracker_port = cfg_.get_integer(config::ConfigKey::TRACKER_PORT);
    if (tracker_port > 0 && tracker_port <= 65535)
    {
        tracker_client_ = std::make_unique<tracker::TrackerClientImpl>(
            network::PeerAddress {cfg_.get_string(config::ConfigKey::TRACKER_ADDRESS),
                static_cast<unsigned short>(tracker_port)},
            message_serializer_);
    }
    else
    {
        LOG(ERROR) << "Invalid tracker_port in configuration: " << tracker_port;
    }

    download_flow_listener_->set_on_transfer_progress_changed_cb(
        [this](size_t bytes_transferred, size_t total_bytes) {
            on_transfer_progress_changed(bytes_transferred, total_bytes);
        });
    download_flow_listener_->set_on_download_completed_cb(
        [this](const std::string &output_path) { on_download_completed(output_path); });
    download_flow_listener_->register_as_listener(*download_flow_);
}

PShareNodeImpl::~PShareNodeImpl()
{
    download_flow_listener_->unregister_as_listener(*download_flow_);
    stop_sharing();
}

bool PShareNodeImpl::register_listener(const std::shared_ptr<PShareNodeListener> &listener)
{
    return listener_group_.add(listener);
}

bool PShareNodeImpl::unregister_listener(const std::shared_ptr<PShareNodeListener> &listener)
{
    return listener_group_.remove(listener);
}

bool PShareNodeImpl::share_file(const std::string &file_path, std::string &error_string)
{
    if (!check_tracker_client(error_string))
    {
        return false;
    }

    std::string                      manifest_path;
    std::string                      file_hash;
    std::shared_ptr<flows::SeedFlow> seed_flow;
    network::PeerAddress             self;
    {
        std::lock_guard lock {sharing_mutex_};

        if (seed_flow_)
        {
            error_string = "Already sharing " + seed_flow_->file_path() + ", stop sharing it first";
            return false;
        }

        auto chunk_size = cfg_.get_integer(config::ConfigKey::CHUNK_SIZE);
        if (chunk_size <= 0)
        {
            error_string = "Invalid chunk_size in configuration: " + std::to_string(chunk_size);
            return false;
        }

        storage::Manifest manifest;
        auto status = chunker_->build_manifest(file_path, size_t(chunk_size), manifest);
        if (status != utils::ErrorCode::OK)
        {
            error_string = "Cannot chunk " + file_path + " (" + utils::to_string(status) + ')';
            return false;
        }

        manifest_path = storage::manifest_file_path(file_path);
        status        = manifest_codec_->save(manifest, manifest_path);
        if (status != utils::ErrorCode::OK)
        {
            error_string = "Cannot save manifest to " + manifest_path;
            return false;
        }
        LOG(INFO) << "Manifest for " << file_path << " saved to " << manifest_path << " ("
                  << manifest.chunks.size() << " chunks, hash " << manifest.file_hash << ')';

        file_hash = manifest.file_hash;
        seed_flow = std::make_shared<flows::SeedFlow>(
            std::filesystem::absolute(file_path).string(), std::move(manifest), chunk_store_);
        if (!start_serving(seed_flow, error_string))
        {
            return false;
        }

        self = {cfg_.get_string(config::ConfigKey::ANNOUNCE_ADDRESS), chunk_server_->port()};
    }

    // The tracker request blocks, so the node stays stoppable while it is in flight
    auto status = tracker_client_->announce(file_hash, self);
    if (status != utils::ErrorCode::OK)
    {
        std::lock_guard lock {sharing_mutex_};
        if (seed_flow_ == seed_flow)
        {
            stop_serving();
        }
        error_string = "Cannot announce the file to the tracker, check the log file for details";
        return false;
    }

    {
        std::lock_guard lock {sharing_mutex_};
        if (seed_flow_ != seed_flow)
        {
            error_string = "Sharing was stopped before the tracker answered";
            return false;
        }
    }

    LOG(INFO) << "Sharing " << file_path << " as " << self;
    listener_group_.notify(
        &PShareNodeListener::on_sharing_started, manifest_path, file_hash, self.port);
    return true;
}

bool PShareNodeImpl::stop_sharing()
{
    std::lock_guard lock {sharing_mutex_};
    if (!seed_flow_)
    {
        return false;
    }

    LOG(INFO) << "No longer sharing " << seed_flow_->file_path() << " ("
              << seed_flow_->chunks_served() << " chunks served)";
    stop_serving();
    return true;
}

bool PShareNodeImpl::is_sharing() const
{
    std::lock_guard lock {sharing_mutex_};
    return seed_flow_ != nullptr;
}

bool PShareNodeImpl::download_file(const std::string &manifest_path, std::string &error_string)
{
    if (!check_tracker_client(error_string))
    {
        return false;
    }

    storage::Manifest manifest;
    auto              status = manifest_codec_->load(manifest_path, manifest);
    if (status != utils::ErrorCode::OK)
    {
        error_string = "Cannot load manifest " + manifest_path + " (" + utils::to_string(status) + ')';
        return false;
    }

    std::vector<network::PeerAddress> peers;
    status = tracker_client_->get_peers(manifest.file_hash, peers);
    if (status != utils::ErrorCode::OK)
    {
        error_string = "Cannot query the tracker, check the log file for details";
        return false;
    }

    if (peers.empty())
    {
        LOG(WARNING) << "No peers for " << manifest.file_hash << " (" << utils::ErrorCode::NOT_FOUND
                     << ')';
        error_string = "no peers available";
        return false;
    }

    const auto &peer = peers.front();
    listener_group_.notify(&PShareNodeListener::on_peer_found, peer.to_string());

    auto output_path = (std::filesystem::path {cfg_.get_string(config::ConfigKey::DOWNLOADS_DIR)} /
                        manifest.file_name)
                           .string();
    auto result      = download_flow_->download(manifest, peer, output_path);
    if (!result.ok())
    {
        error_string = describe_failure(result);
        return false;
    }

    return true;
}

bool PShareNodeImpl::check_tracker_client(std::string &error_string) const
{
    if (!tracker_client_)
    {
        error_string = "Invalid tracker_port in configuration: " +
                       std::to_string(cfg_.get_integer(config::ConfigKey::TRACKER_PORT));
        return false;
    }
    return true;
}

bool PShareNodeImpl::start_serving(
    std::shared_ptr<flows::SeedFlow> seed_flow, std::string &error_string)
{
    auto max_uploads = cfg_.get_integer(config::ConfigKey::MAX_CONCURRENT_UPLOADS);
    auto port        = cfg_.get_integer(config::ConfigKey::PORT);
    if (port < 0 || port > 65535)
    {
        error_string = "Invalid port in configuration: " + std::to_string(port);
        return false;
    }

    chunk_server_io_ctx_ = std::make_unique<boost::asio::io_context>();
    io_thread_pool_      = std::make_shared<utils::IOThreadPool>();
    chunk_server_        = std::make_unique<network::ChunkServerImpl>(*chunk_server_io_ctx_,
        static_cast<unsigned short>(port), seed_flow, message_serializer_, io_thread_pool_,
        max_uploads > 0 ? size_t(max_uploads) : 0);

    if (!chunk_server_->start())
    {
        chunk_server_.reset();
        io_thread_pool_.reset();
        chunk_server_io_ctx_.reset();
        error_string = "Cannot listen on port " + std::to_string(port) +
                       ", check the log file for details";
        return false;
    }

    io_thread_pool_->add_job(
        [io_ctx = chunk_server_io_ctx_.get()](const utils::CompletionToken &) { io_ctx->run(); });
    seed_flow_ = std::move(seed_flow);
    return true;
}

void PShareNodeImpl::stop_serving()
{
    if (chunk_server_)
    {
        chunk_server_->stop();
    }
    if (chunk_server_io_ctx_)
    {
        chunk_server_io_ctx_->stop();
    }

    if (io_thread_pool_)
    {
        // Event loop and in-flight uploads
        io_thread_pool_->wait_until_all_jobs_done();
    }
    chunk_server_.reset();
    io_thread_pool_.reset();
    chunk_server_io_ctx_.reset();
    seed_flow_.reset();
}

void PShareNodeImpl::on_transfer_progress_changed(size_t bytes_transferred, size_t total_bytes)
{
    listener_group_.notify(
        &PShareNodeListener::on_transfer_progress_changed, bytes_transferred, total_bytes);
}

void PShareNodeImpl::on_download_completed(const std::string &output_path)
{
    listener_group_.notify(&PShareNodeListener::on_download_completed, output_path);
}
}  // namespace pshare
