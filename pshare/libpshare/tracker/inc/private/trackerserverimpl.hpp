#ifndef PSHARE_TRACKER_TRACKERSERVERIMPL_HPP_
#define PSHARE_TRACKER_TRACKERSERVERIMPL_HPP_

#include <atomic>
#include <memory>

#include <boost/asio.hpp>

#include "trackerserver.hpp"

namespace pshare::protocol
{
// Forward declarations
class MessageSerializer;
}  // namespace pshare::protocol

namespace pshare::tracker
{
// Forward declarations
class PeerRegistry;
class TrackerRequestRouter;

class TrackerServerImpl : public TrackerServer
{
public:
    TrackerServerImpl(boost::asio::io_context &io_ctx, unsigned short port,
        std::shared_ptr<PeerRegistry>                      registry,
        std::shared_ptr<const protocol::MessageSerializer> message_serializer);
    ~TrackerServerImpl() override;

    bool                         start() override;
    void                         stop() override;
    [[nodiscard]] unsigned short port() const override;

private:
    void accept_loop();

    boost::asio::io_context &                   io_ctx_;
    const unsigned short                        requested_port_;
    std::shared_ptr<const TrackerRequestRouter> router_;
    boost::asio::ip::tcp::acceptor              acceptor_;
    std::atomic<unsigned short>                 bound_port_;
};
}  // namespace pshare::tracker

#endif  // PSHARE_TRACKER_TRACKERSERVERIMPL_HPP_
