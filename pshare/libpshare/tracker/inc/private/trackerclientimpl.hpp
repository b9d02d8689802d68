#ifndef PSHARE_TRACKER_TRACKERCLIENTIMPL_HPP_
#define PSHARE_TRACKER_TRACKERCLIENTIMPL_HPP_

#include <memory>

#include <boost/beast/http.hpp>

#include "trackerclient.hpp"

namespace pshare::protocol
{
// Forward declarations
class MessageSerializer;
}  // namespace pshare::protocol

namespace pshare::tracker
{
class TrackerClientImpl : public TrackerClient
{
public:
    TrackerClientImpl(network::PeerAddress                 tracker_address,
        std::shared_ptr<const protocol::MessageSerializer> message_serializer);

    utils::ErrorCode announce(
        const std::string &file_hash, const network::PeerAddress &peer) const override;
    utils::ErrorCode get_peers(
        const std::string &file_hash, std::vector<network::PeerAddress> &out) const override;

private:
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    bool send_request(boost::beast::http::verb method, const std::string &target,
        const std::string &body, Response &response) const;

    const network::PeerAddress                         tracker_address_;
    std::shared_ptr<const protocol::MessageSerializer> message_serializer_;
};
}  // namespace pshare::tracker

#endif  // PSHARE_TRACKER_TRACKERCLIENTIMPL_HPP_
