#ifndef PSHARE_TRACKER_TRACKERCLIENT_HPP_
#define PSHARE_TRACKER_TRACKERCLIENT_HPP_

#include <string>
#include <vector>

#include "address.hpp"
#include "errorcode.hpp"

namespace pshare::tracker
{
class TrackerClient
{
public:
    virtual ~TrackerClient() = default;

    virtual utils::ErrorCode announce(
        const std::string &file_hash, const network::PeerAddress &peer) const = 0;
    virtual utils::ErrorCode get_peers(
        const std::string &file_hash, std::vector<network::PeerAddress> &out) const = 0;
};
}  // namespace pshare::tracker

#endif  // PSHARE_TRACKER_TRACKERCLIENT_HPP_
