#ifndef PSHARE_TRACKER_PEERREGISTRYIMPL_HPP_
#define PSHARE_TRACKER_PEERREGISTRYIMPL_HPP_

#include <map>
#include <shared_mutex>

#include "peerregistry.hpp"

namespace pshare::tracker
{
class PeerRegistryImpl : public PeerRegistry
{
public:
    utils::ErrorCode announce(
        const std::string &file_hash, const network::PeerAddress &peer) override;
    [[nodiscard]] std::vector<network::PeerAddress> lookup(
        const std::string &file_hash) const override;

private:
    std::map<std::string, std::vector<network::PeerAddress>> peers_;
    mutable std::shared_mutex                                mutex_;
};
}  // namespace pshare::tracker

#endif  // PSHARE_TRACKER_PEERREGISTRYIMPL_HPP_
