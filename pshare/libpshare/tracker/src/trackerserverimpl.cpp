#include "trackerserverimpl.hpp"

#include <glog/logging.h>

#include "trackerrequestrouter.hpp"
#include "trackersession.hpp"

namespace pshare::tracker
{
TrackerServerImpl::TrackerServerImpl(boost::asio::io_context &io_ctx, unsigned short port,
    std::shared_ptr<PeerRegistry>                               registry,
    std::shared_ptr<const protocol::MessageSerializer>          message_serializer)
    : io_ctx_ {io_ctx}
    , requested_port_ {port}
    , router_ {std::make_shared<TrackerRequestRouter>(
          std::move(registry), std::move(message_serializer))}
    , acceptor_ {io_ctx_}
    , bound_port_ {0}
{}

TrackerServerImpl::~TrackerServerImpl() = default;

bool TrackerServerImpl::start()
{
    boost::asio::ip::tcp::endpoint endpoint {boost::asio::ip::tcp::v4(), requested_port_};
    try
    {
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        bound_port_ = acceptor_.local_endpoint().port();
    }
    catch (const boost::system::system_error &e)
    {
        LOG(ERROR) << "Cannot start tracker on port " << requested_port_ << ": " << e.what();
        boost::system::error_code ec;
        acceptor_.close(ec);
        return false;
    }

    LOG(INFO) << "Tracker listening on port " << bound_port_.load();

    boost::asio::post(io_ctx_, [this] { accept_loop(); });
    return true;
}

void TrackerServerImpl::stop()
{
    boost::asio::post(io_ctx_, [this] {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
}

unsigned short TrackerServerImpl::port() const
{
    return bound_port_;
}

void TrackerServerImpl::accept_loop()
{
    acceptor_.async_accept(
        [this](const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket) {
            if (!ec)
            {
                std::make_shared<TrackerSession>(std::move(socket), router_)->start();
            }
            else if (ec != boost::asio::error::operation_aborted)
            {
                LOG(WARNING) << "Accept failed: " << ec.message();
            }

            if (acceptor_.is_open())
            {
                accept_loop();
            }
        });
}
}  // namespace pshare::tracker
