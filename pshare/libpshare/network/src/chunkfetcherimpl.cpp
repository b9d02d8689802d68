#include "chunkfetcherimpl.hpp"

#include <string>

#include <boost/asio.hpp>
#include <glog/logging.h>

#include "messages.hpp"
#include "messageserializer.hpp"

namespace pshare::network
{
ChunkFetcherImpl::ChunkFetcherImpl(
    std::shared_ptr<const protocol::MessageSerializer> message_serializer)
    : message_serializer_ {std::move(message_serializer)}
{}

utils::ErrorCode ChunkFetcherImpl::fetch_chunk(const PeerAddress &peer, long long chunk_index,
    size_t expected_size, std::vector<uint8_t> &out, const StageCallback &on_stage_changed) const
{
    auto notify = [&on_stage_changed](Stage stage) {
        if (on_stage_changed)
        {
            on_stage_changed(stage);
        }
    };

    boost::asio::io_context        io_ctx;
    boost::asio::ip::tcp::resolver resolver {io_ctx};
    boost::asio::ip::tcp::socket   socket {io_ctx};
    boost::system::error_code      ec;

    notify(Stage::CONNECTING);
    auto endpoints = resolver.resolve(peer.address, std::to_string(peer.port), ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot resolve " << peer << ": " << ec.message();
        return utils::ErrorCode::IO_ERROR;
    }
    boost::asio::connect(socket, endpoints, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot connect to " << peer << ": " << ec.message();
        return utils::ErrorCode::IO_ERROR;
    }

    notify(Stage::REQUESTING);
    auto request = message_serializer_->serialize(protocol::ChunkRequest {chunk_index});
    boost::asio::write(socket, boost::asio::buffer(request), ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot send request for chunk " << chunk_index << " to " << peer << ": "
                   << ec.message();
        return utils::ErrorCode::IO_ERROR;
    }

    notify(Stage::RECEIVING);
    std::vector<uint8_t> data(expected_size);
    size_t bytes_read = boost::asio::read(socket, boost::asio::buffer(data), ec);
    if (bytes_read != expected_size)
    {
        LOG(ERROR) << "Transfer of chunk " << chunk_index << " from " << peer << " failed after "
                   << bytes_read << " of " << expected_size
                   << " bytes: " << (ec ? ec.message() : "connection closed");
        return utils::ErrorCode::IO_ERROR;
    }

    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);

    out = std::move(data);
    return utils::ErrorCode::OK;
}
}  // namespace pshare::network
