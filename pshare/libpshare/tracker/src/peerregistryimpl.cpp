#include "peerregistryimpl.hpp"

#include <algorithm>
#include <mutex>

#include <glog/logging.h>

namespace pshare::tracker
{
utils::ErrorCode PeerRegistryImpl::announce(
    const std::string &file_hash, const network::PeerAddress &peer)
{
    if (file_hash.empty() || !peer.is_valid())
    {
        LOG(WARNING) << "Rejecting announce of \"" << file_hash << "\" by \"" << peer << "\"";
        return utils::ErrorCode::INVALID_ARGUMENT;
    }

    {
        std::unique_lock lock {mutex_};
        auto &           peers = peers_[file_hash];
        if (std::find(peers.cbegin(), peers.cend(), peer) != peers.cend())
        {
            return utils::ErrorCode::OK;
        }
        peers.push_back(peer);
    }

    LOG(INFO) << "Peer " << peer << " announced " << file_hash;
    return utils::ErrorCode::OK;
}

std::vector<network::PeerAddress> PeerRegistryImpl::lookup(const std::string &file_hash) const
{
    std::shared_lock lock {mutex_};
    auto             it = peers_.find(file_hash);
    if (it == peers_.cend())
    {
        return {};
    }
    return it->second;
}
}  // namespace pshare::tracker
