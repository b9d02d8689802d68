#ifndef PSHARE_NETWORK_CHUNKREQUESTHANDLER_HPP_
#define PSHARE_NETWORK_CHUNKREQUESTHANDLER_HPP_

#include <cstdint>
#include <vector>

#include "errorcode.hpp"

namespace pshare::network
{
class ChunkRequestHandler
{
public:
    virtual ~ChunkRequestHandler() = default;

    // Called from connection threads, possibly concurrently
    virtual utils::ErrorCode on_chunk_requested(long long chunk_index, std::vector<uint8_t> &out) = 0;
};
}  // namespace pshare::network

#endif  // PSHARE_NETWORK_CHUNKREQUESTHANDLER_HPP_
