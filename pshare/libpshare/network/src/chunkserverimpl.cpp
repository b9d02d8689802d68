#include "chunkserverimpl.hpp"

#include <istream>
#include <string>
#include <vector>

#include <glog/logging.h>

#include "chunkrequesthandler.hpp"
#include "defer.hpp"
#include "executer.hpp"
#include "messages.hpp"
#include "messageserializer.hpp"

namespace pshare::network
{
ChunkServerImpl::ChunkServerImpl(boost::asio::io_context &io_ctx, unsigned short port,
    std::shared_ptr<ChunkRequestHandler>               request_handler,
    std::shared_ptr<const protocol::MessageSerializer> message_serializer,
    std::shared_ptr<utils::Executer> connection_executer, size_t max_concurrent_connections)
    : io_ctx_ {io_ctx}
    , requested_port_ {port}
    , request_handler_ {std::move(request_handler)}
    , message_serializer_ {std::move(message_serializer)}
    , connection_executer_ {std::move(connection_executer)}
    , max_concurrent_connections_ {max_concurrent_connections}
    , acceptor_ {io_ctx_}
    , bound_port_ {0}
    , active_connections_ {std::make_shared<std::atomic<size_t>>(0)}
{}

ChunkServerImpl::~ChunkServerImpl() = default;

bool ChunkServerImpl::start()
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
        LOG(ERROR) << "Cannot listen for chunk requests on port " << requested_port_ << ": "
                   << e.what();
        boost::system::error_code ec;
        acceptor_.close(ec);
        return false;
    }

    LOG(INFO) << "Serving chunks on port " << bound_port_.load();

    boost::asio::post(io_ctx_, [this] { accept_loop(); });
    return true;
}

void ChunkServerImpl::stop()
{
    boost::asio::post(io_ctx_, [this] {
        if (acceptor_.is_open())
        {
            boost::system::error_code ec;
            acceptor_.close(ec);
        }
    });
}

unsigned short ChunkServerImpl::port() const
{
    return bound_port_;
}

size_t ChunkServerImpl::active_connection_count() const
{
    return active_connections_->load();
}

void ChunkServerImpl::accept_loop()
{
    acceptor_.async_accept(
        [this](const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket) {
            if (ec)
            {
                if (ec != boost::asio::error::operation_aborted)
                {
                    LOG(WARNING) << "Accept failed: " << ec.message();
                }
                if (!acceptor_.is_open())
                {
                    return;
                }
                accept_loop();
                return;
            }

            if (max_concurrent_connections_ != 0 &&
                *active_connections_ >= max_concurrent_connections_)
            {
                LOG(WARNING) << "Rejecting connection, " << active_connections_->load()
                             << " chunk transfers already in progress";
                boost::system::error_code close_ec;
                socket.close(close_ec);
                accept_loop();
                return;
            }

            ++*active_connections_;
            auto connection = std::make_shared<boost::asio::ip::tcp::socket>(std::move(socket));
            connection_executer_->add_job(
                [connection, counter = active_connections_, handler = request_handler_,
                    serializer = message_serializer_](const utils::CompletionToken &) {
                    DEFER(--*counter);
                    handle_connection(*connection, *handler, *serializer);
                });

            accept_loop();
        });
}

void ChunkServerImpl::handle_connection(boost::asio::ip::tcp::socket &socket,
    ChunkRequestHandler &request_handler, const protocol::MessageSerializer &message_serializer)
{
    DEFER({
        boost::system::error_code ec;
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);
    });

    boost::system::error_code ec;
    auto                      remote = socket.remote_endpoint(ec);
    if (ec)
    {
        LOG(WARNING) << "Peer disconnected before sending a request: " << ec.message();
        return;
    }

    boost::asio::streambuf request_buffer {protocol::max_chunk_request_size};
    boost::asio::read_until(socket, request_buffer, protocol::chunk_request_delimiter, ec);
    if (ec)
    {
        LOG(WARNING) << "Failed to read chunk request from " << remote << ": " << ec.message();
        return;
    }

    std::string  request_line;
    std::istream request_stream {&request_buffer};
    std::getline(request_stream, request_line, protocol::chunk_request_delimiter);

    protocol::ChunkRequest request;
    if (!message_serializer.deserialize(request_line, request))
    {
        LOG(WARNING) << "Malformed chunk request from " << remote;
        return;
    }

    std::vector<uint8_t> payload;
    auto status = request_handler.on_chunk_requested(request.chunk_index, payload);
    if (status != utils::ErrorCode::OK)
    {
        LOG(WARNING) << "Chunk " << request.chunk_index << " requested by " << remote
                     << " not served: " << status;
        return;
    }

    boost::asio::write(socket, boost::asio::buffer(payload), ec);
    if (ec)
    {
        LOG(WARNING) << "Failed to send chunk " << request.chunk_index << " to " << remote << ": "
                     << ec.message();
    }
}
}  // namespace pshare::network
