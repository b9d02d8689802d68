#ifndef PSHARE_API_PSHARENODEIMPL_HPP_
#define PSHARE_API_PSHARENODEIMPL_HPP_

#include <memory>
#include <mutex>
#include <string>

#include <boost/asio.hpp>

#include "config.hpp"
#include "downloadflowlistenerdelegate.hpp"
#include "listenergroup.hpp"
#include "psharenodelistener.hpp"

namespace pshare
{
namespace utils
{
// Forward declarations
class IOThreadPool;
}  // namespace utils

namespace crypto
{
// Forward declarations
class SHA256Hasher;
class HexEncoder;
}  // namespace crypto

namespace storage
{
// Forward declarations
class Chunker;
class ChunkStore;
class ManifestCodec;
}  // namespace storage

namespace protocol
{
// Forward declarations
class MessageSerializer;
}  // namespace protocol

namespace network
{
// Forward declarations
class ChunkServer;
}  // namespace network

namespace tracker
{
// Forward declarations
class TrackerClient;
}  // namespace tracker

namespace flows
{
// Forward declarations
class DownloadFlow;
class SeedFlow;
}  // namespace flows

class PShareNodeImpl
{
public:
    explicit PShareNodeImpl(const std::string &config_file_path);
    ~PShareNodeImpl();

    bool register_listener(const std::shared_ptr<PShareNodeListener> &listener);
    bool unregister_listener(const std::shared_ptr<PShareNodeListener> &listener);

    bool               share_file(const std::string &file_path, std::string &error_string);
    bool               stop_sharing();
    [[nodiscard]] bool is_sharing() const;
    bool               download_file(const std::string &manifest_path, std::string &error_string);

private:
    bool check_tracker_client(std::string &error_string) const;
    bool start_serving(std::shared_ptr<flows::SeedFlow> seed_flow, std::string &error_string);
    void stop_serving();
    void on_transfer_progress_changed(size_t bytes_transferred, size_t total_bytes);
    void on_download_completed(const std::string &output_path);

    config::Config                                     cfg_;
    utils::ListenerGroup<PShareNodeListener>           listener_group_;
    std::shared_ptr<const crypto::SHA256Hasher>        hasher_;
    std::shared_ptr<const crypto::HexEncoder>          hex_encoder_;
    std::shared_ptr<const storage::Chunker>            chunker_;
    std::shared_ptr<const storage::ChunkStore>         chunk_store_;
    std::shared_ptr<const storage::ManifestCodec>      manifest_codec_;
    std::shared_ptr<const protocol::MessageSerializer> message_serializer_;
    std::unique_ptr<tracker::TrackerClient>            tracker_client_;
    std::unique_ptr<flows::DownloadFlow>               download_flow_;
    std::shared_ptr<DownloadFlowListenerDelegate>      download_flow_listener_;
    std::unique_ptr<boost::asio::io_context>           chunk_server_io_ctx_;
    std::shared_ptr<utils::IOThreadPool>               io_thread_pool_;
    std::unique_ptr<network::ChunkServer>              chunk_server_;
    std::shared_ptr<flows::SeedFlow>                   seed_flow_;
    mutable std::mutex                                 sharing_mutex_;
};
}  // namespace pshare

#endif  // PSHARE_API_PSHARENODEIMPL_HPP_
