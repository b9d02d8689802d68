#ifndef PSHARE_NETWORK_CHUNKSERVERIMPL_HPP_
#define PSHARE_NETWORK_CHUNKSERVERIMPL_HPP_

#include <atomic>
#include <memory>

#include <boost/asio.hpp>

#include "chunkserver.hpp"

namespace pshare::protocol
{
// Forward declarations
class MessageSerializer;
}  // namespace pshare::protocol

namespace pshare::utils
{
// Forward declarations
class Executer;
}  // namespace pshare::utils

namespace pshare::network
{
// Forward declarations
class ChunkRequestHandler;

// Serves the chunk transfer protocol: one request line per connection, answered with the raw
// chunk bytes or with a bare close. Each accepted connection is handled as a separate job on
// connection_executer. With max_concurrent_connections != 0, connections accepted while that
// many are in flight are closed right away. The io_context must be stopped before the server
// is destroyed; connection jobs may outlive it.
class ChunkServerImpl : public ChunkServer
{
public:
    ChunkServerImpl(boost::asio::io_context &io_ctx, unsigned short port,
        std::shared_ptr<ChunkRequestHandler>          request_handler,
        std::shared_ptr<const protocol::MessageSerializer> message_serializer,
        std::shared_ptr<utils::Executer> connection_executer, size_t max_concurrent_connections = 0);
    ~ChunkServerImpl() override;

    bool                         start() override;
    void                         stop() override;
    [[nodiscard]] unsigned short port() const override;
    [[nodiscard]] size_t         active_connection_count() const override;

private:
    void        accept_loop();
    static void handle_connection(boost::asio::ip::tcp::socket &socket,
        ChunkRequestHandler &request_handler, const protocol::MessageSerializer &message_serializer);

    boost::asio::io_context &                          io_ctx_;
    const unsigned short                               requested_port_;
    std::shared_ptr<ChunkRequestHandler>               request_handler_;
    std::shared_ptr<const protocol::MessageSerializer> message_serializer_;
    std::shared_ptr<utils::Executer>                   connection_executer_;
    const size_t                                       max_concurrent_connections_;
    boost::asio::ip::tcp::acceptor                     acceptor_;
    std::atomic<unsigned short>                        bound_port_;
    std::shared_ptr<std::atomic<size_t>>               active_connections_;
};
}  // namespace pshare::network

#endif  // PSHARE_NETWORK_CHUNKSERVERIMPL_HPP_
