#ifndef PSHARE_FLOWS_DOWNLOADFLOWIMPL_HPP_
#define PSHARE_FLOWS_DOWNLOADFLOWIMPL_HPP_

#include <memory>
#include <mutex>

#include "downloadflow.hpp"
#include "downloadflowlistener.hpp"
#include "listenergroup.hpp"

namespace pshare::network
{
// Forward declarations
class ChunkFetcher;
}  // namespace pshare::network

namespace pshare::storage
{
// Forward declarations
class ChunkStore;
class Chunker;
}  // namespace pshare::storage

namespace pshare::flows
{
// Fetches the chunks of a manifest one at a time, in index order, from a single peer. Every
// chunk is verified before it is appended; the first failure ends the download and leaves the
// partial output behind. Once all chunks are in, the whole output file is digested again and
// compared with the manifest file hash.
class DownloadFlowImpl : public DownloadFlow
{
public:
    DownloadFlowImpl(std::shared_ptr<const network::ChunkFetcher> chunk_fetcher,
        std::shared_ptr<const storage::ChunkStore>                chunk_store,
        std::shared_ptr<const storage::Chunker>                   chunker);

    bool register_listener(std::shared_ptr<DownloadFlowListener> listener) override;
    bool unregister_listener(std::shared_ptr<DownloadFlowListener> listener) override;
    [[nodiscard]] State state() const override;
    DownloadResult      download(const storage::Manifest &manifest,
             const network::PeerAddress &peer, const std::string &output_path) override;

private:
    DownloadResult run(const storage::Manifest &manifest, const network::PeerAddress &peer,
        const std::string &output_path);
    DownloadResult fail(DownloadResult result, utils::ErrorCode status,
        std::optional<size_t> chunk_index = std::nullopt);
    void           set_state(State new_state, size_t chunk_index);

    std::shared_ptr<const network::ChunkFetcher> chunk_fetcher_;
    std::shared_ptr<const storage::ChunkStore>   chunk_store_;
    std::shared_ptr<const storage::Chunker>      chunker_;
    utils::ListenerGroup<DownloadFlowListener>   listener_group_;
    State                                        state_;
    bool                                         busy_;
    mutable std::mutex                           mutex_;
};
}  // namespace pshare::flows

#endif  // PSHARE_FLOWS_DOWNLOADFLOWIMPL_HPP_
