#ifndef PSHARE_NETWORK_CHUNKFETCHERIMPL_HPP_
#define PSHARE_NETWORK_CHUNKFETCHERIMPL_HPP_

#include <memory>

#include "chunkfetcher.hpp"

namespace pshare::protocol
{
// Forward declarations
class MessageSerializer;
}  // namespace pshare::protocol

namespace pshare::network
{
class ChunkFetcherImpl : public ChunkFetcher
{
public:
    explicit ChunkFetcherImpl(std::shared_ptr<const protocol::MessageSerializer> message_serializer);

    utils::ErrorCode fetch_chunk(const PeerAddress &peer, long long chunk_index,
        size_t expected_size, std::vector<uint8_t> &out,
        const StageCallback &on_stage_changed) const override;

private:
    std::shared_ptr<const protocol::MessageSerializer> message_serializer_;
};
}  // namespace pshare::network

#endif  // PSHARE_NETWORK_CHUNKFETCHERIMPL_HPP_
