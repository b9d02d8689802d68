#include "trackersession.hpp"

#include <glog/logging.h>

namespace http = boost::beast::http;

namespace pshare::tracker
{
TrackerSession::TrackerSession(
    boost::asio::ip::tcp::socket socket, std::shared_ptr<const TrackerRequestRouter> router)
    : socket_ {std::move(socket)}
    , router_ {std::move(router)}
{}

void TrackerSession::start()
{
    http::async_read(socket_, buffer_, request_,
        [self = shared_from_this()](const boost::system::error_code &ec, std::size_t /*bytes*/) {
            self->on_read(ec);
        });
}

void TrackerSession::on_read(const boost::system::error_code &ec)
{
    if (ec)
    {
        if (ec != http::error::end_of_stream)
        {
            LOG(WARNING) << "Failed to read tracker request: " << ec.message();
        }
        boost::system::error_code close_ec;
        socket_.close(close_ec);
        return;
    }

    response_ = router_->route(request_);
    LOG(INFO) << request_.method_string() << ' ' << request_.target() << " -> "
              << response_.result_int();

    http::async_write(socket_, response_,
        [self = shared_from_this()](const boost::system::error_code &ec, std::size_t /*bytes*/) {
            self->on_write(ec);
        });
}

void TrackerSession::on_write(const boost::system::error_code &ec)
{
    if (ec)
    {
        LOG(WARNING) << "Failed to write tracker response: " << ec.message();
    }

    boost::system::error_code shutdown_ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, shutdown_ec);
}
}  // namespace pshare::tracker
