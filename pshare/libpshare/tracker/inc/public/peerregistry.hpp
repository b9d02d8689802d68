#ifndef PSHARE_TRACKER_PEERREGISTRY_HPP_
#define PSHARE_TRACKER_PEERREGISTRY_HPP_

#include <string>
#include <vector>

#include "address.hpp"
#include "errorcode.hpp"

namespace pshare::tracker
{
class PeerRegistry
{
public:
    virtual ~PeerRegistry() = default;

    // Idempotent. Empty hashes, empty addresses and port 0 are rejected with INVALID_ARGUMENT.
    virtual utils::ErrorCode announce(
        const std::string &file_hash, const network::PeerAddress &peer) = 0;

    // Snapshot of the peers announced for file_hash, empty if there are none
    [[nodiscard]] virtual std::vector<network::PeerAddress> lookup(
        const std::string &file_hash) const = 0;
};
}  // namespace pshare::tracker

#endif  // PSHARE_TRACKER_PEERREGISTRY_HPP_
