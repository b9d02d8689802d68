#ifndef PSHARE_TRACKER_TRACKERSESSION_HPP_
#define PSHARE_TRACKER_TRACKERSESSION_HPP_

#include <memory>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "trackerrequestrouter.hpp"

namespace pshare::tracker
{
// One HTTP exchange: read a request, answer it, shut the connection down
class TrackerSession : public std::enable_shared_from_this<TrackerSession>
{
public:
    TrackerSession(boost::asio::ip::tcp::socket socket,
        std::shared_ptr<const TrackerRequestRouter> router);

    void start();

private:
    void on_read(const boost::system::error_code &ec);
    void on_write(const boost::system::error_code &ec);

    boost::asio::ip::tcp::socket                socket_;
    std::shared_ptr<const TrackerRequestRouter> router_;
    boost::beast::flat_buffer                   buffer_;
    TrackerRequestRouter::Request               request_;
    TrackerRequestRouter::Response              response_;
};
}  // namespace pshare::tracker

#endif  // PSHARE_TRACKER_TRACKERSESSION_HPP_
