#include "trackerclientimpl.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <glog/logging.h>

#include "httputils.hpp"
#include "messages.hpp"
#include "messageserializer.hpp"

namespace http = boost::beast::http;

namespace pshare::tracker
{
TrackerClientImpl::TrackerClientImpl(network::PeerAddress tracker_address,
    std::shared_ptr<const protocol::MessageSerializer>    message_serializer)
    : tracker_address_ {std::move(tracker_address)}
    , message_serializer_ {std::move(message_serializer)}
{}

utils::ErrorCode TrackerClientImpl::announce(
    const std::string &file_hash, const network::PeerAddress &peer) const
{
    Response response;
    if (!send_request(http::verb::post, "/announce",
            message_serializer_->serialize(protocol::AnnounceRequest {file_hash, peer}), response))
    {
        return utils::ErrorCode::IO_ERROR;
    }

    if (response.result() != http::status::ok)
    {
        LOG(ERROR) << "Tracker refused announce of " << file_hash << " by " << peer << ": "
                   << response.result_int() << ' ' << response.body();
        return utils::ErrorCode::IO_ERROR;
    }

    return utils::ErrorCode::OK;
}

utils::ErrorCode TrackerClientImpl::get_peers(
    const std::string &file_hash, std::vector<network::PeerAddress> &out) const
{
    Response response;
    if (!send_request(http::verb::get, "/peers?fileHash=" + httputils::url_encode(file_hash), {},
            response))
    {
        return utils::ErrorCode::IO_ERROR;
    }

    if (response.result() != http::status::ok)
    {
        LOG(ERROR) << "Tracker peer lookup for " << file_hash << " failed: "
                   << response.result_int() << ' ' << response.body();
        return utils::ErrorCode::IO_ERROR;
    }

    protocol::PeersReply reply;
    if (!message_serializer_->deserialize(response.body(), reply))
    {
        LOG(ERROR) << "Cannot decode the tracker peer list";
        return utils::ErrorCode::IO_ERROR;
    }

    out = std::move(reply.peers);
    return utils::ErrorCode::OK;
}

bool TrackerClientImpl::send_request(http::verb method, const std::string &target,
    const std::string &body, Response &response) const
{
    try
    {
        boost::asio::io_context        io_ctx;
        boost::asio::ip::tcp::resolver resolver {io_ctx};
        boost::asio::ip::tcp::socket   socket {io_ctx};
        boost::asio::connect(
            socket, resolver.resolve(tracker_address_.address, std::to_string(tracker_address_.port)));

        http::request<http::string_body> request {method, target, 11};
        request.set(http::field::host, tracker_address_.address);
        request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        if (method == http::verb::post)
        {
            request.set(http::field::content_type, "application/json");
        }
        request.body() = body;
        request.prepare_payload();
        http::write(socket, request);

        boost::beast::flat_buffer buffer;
        http::read(socket, buffer, response);

        boost::system::error_code ec;
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
    catch (const boost::system::system_error &e)
    {
        LOG(ERROR) << "Request " << target << " to tracker " << tracker_address_
                   << " failed: " << e.what();
        return false;
    }

    return true;
}
}  // namespace pshare::tracker
