#ifndef PSHARE_NETWORK_CHUNKFETCHER_HPP_
#define PSHARE_NETWORK_CHUNKFETCHER_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "address.hpp"
#include "errorcode.hpp"

namespace pshare::network
{
class ChunkFetcher
{
public:
    enum class Stage
    {
        CONNECTING,
        REQUESTING,
        RECEIVING
    };

    using StageCallback = std::function<void(Stage)>;

    virtual ~ChunkFetcher() = default;

    // Opens a fresh connection to peer, requests one chunk and reads exactly expected_size
    // bytes. A connection closed early yields IO_ERROR, never a shorter payload.
    virtual utils::ErrorCode fetch_chunk(const PeerAddress &peer, long long chunk_index,
        size_t expected_size, std::vector<uint8_t> &out,
        const StageCallback &on_stage_changed = {}) const = 0;
};

constexpr const char *to_string(ChunkFetcher::Stage stage)
{
    switch (stage)
    {
        case ChunkFetcher::Stage::CONNECTING: return "CONNECTING";
        case ChunkFetcher::Stage::REQUESTING: return "REQUESTING";
        case ChunkFetcher::Stage::RECEIVING: return "RECEIVING";
        default: return "INVALID_STAGE";
    }
}
}  // namespace pshare::network

#endif  // PSHARE_NETWORK_CHUNKFETCHER_HPP_
