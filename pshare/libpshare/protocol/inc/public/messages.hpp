#ifndef PSHARE_PROTOCOL_MESSAGES_HPP_
#define PSHARE_PROTOCOL_MESSAGES_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include "address.hpp"

namespace pshare::protocol
{
// Peer to peer: asks for one chunk, one request per connection
struct ChunkRequest
{
    long long chunk_index = 0;
};

// Peer to tracker: POST /announce body
struct AnnounceRequest
{
    std::string          file_hash;
    network::PeerAddress peer;
};

// Tracker to peer: GET /peers reply body
struct PeersReply
{
    std::vector<network::PeerAddress> peers;
};

// A chunk request line is never longer than this, newline included
constexpr size_t max_chunk_request_size = 4096;
constexpr char   chunk_request_delimiter = '\n';
}  // namespace pshare::protocol

#endif  // PSHARE_PROTOCOL_MESSAGES_HPP_
