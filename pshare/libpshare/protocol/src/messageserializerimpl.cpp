#include "messageserializerimpl.hpp"

#include <limits>

#include <glog/logging.h>

namespace pshare::protocol
{
namespace
{
constexpr char const *key_chunk_index = "chunkIndex";
constexpr char const *key_file_hash   = "fileHash";
constexpr char const *key_address     = "address";
constexpr char const *key_port        = "port";
constexpr char const *key_peers       = "peers";
}  // namespace

std::string MessageSerializerImpl::serialize(const ChunkRequest &message) const
{
    nlohmann::json json;
    json[key_chunk_index] = message.chunk_index;
    return json.dump() + chunk_request_delimiter;
}

std::string MessageSerializerImpl::serialize(const AnnounceRequest &message) const
{
    nlohmann::json json;
    json[key_file_hash] = message.file_hash;
    json[key_address]   = message.peer.address;
    json[key_port]      = message.peer.port;
    return json.dump();
}

std::string MessageSerializerImpl::serialize(const PeersReply &message) const
{
    nlohmann::json peers = nlohmann::json::array();
    for (const auto &peer : message.peers)
    {
        peers.push_back({{key_address, peer.address}, {key_port, peer.port}});
    }

    nlohmann::json json;
    json[key_peers] = std::move(peers);
    return json.dump();
}

bool MessageSerializerImpl::deserialize(const std::string &text, ChunkRequest &message) const
{
    nlohmann::json json;
    if (!parse_object(text, json))
    {
        return false;
    }

    auto it = json.find(key_chunk_index);
    if (it == json.end() || !it->is_number_integer())
    {
        LOG(WARNING) << "Chunk request without an integer " << key_chunk_index;
        return false;
    }

    if (it->is_number_unsigned() &&
        it->get<unsigned long long>() > (unsigned long long)(std::numeric_limits<long long>::max()))
    {
        LOG(WARNING) << "Chunk index out of the representable range";
        return false;
    }

    message.chunk_index = it->get<long long>();
    return true;
}

bool MessageSerializerImpl::deserialize(const std::string &text, AnnounceRequest &message) const
{
    nlohmann::json json;
    if (!parse_object(text, json))
    {
        return false;
    }

    auto file_hash = json.find(key_file_hash);
    if (file_hash == json.end() || !file_hash->is_string())
    {
        LOG(WARNING) << "Announce request without a string " << key_file_hash;
        return false;
    }

    network::PeerAddress peer;
    if (!parse_peer(json, peer))
    {
        return false;
    }

    message.file_hash = file_hash->get<std::string>();
    message.peer      = std::move(peer);
    return true;
}

bool MessageSerializerImpl::deserialize(const std::string &text, PeersReply &message) const
{
    nlohmann::json json;
    if (!parse_object(text, json))
    {
        return false;
    }

    auto peers = json.find(key_peers);
    if (peers == json.end() || !(peers->is_array() || peers->is_null()))
    {
        LOG(WARNING) << "Peers reply without a " << key_peers << " array";
        return false;
    }

    std::vector<network::PeerAddress> parsed;
    if (peers->is_array())
    {
        for (const auto &item : *peers)
        {
            network::PeerAddress peer;
            if (!item.is_object() || !parse_peer(item, peer))
            {
                return false;
            }
            parsed.push_back(std::move(peer));
        }
    }

    message.peers = std::move(parsed);
    return true;
}

bool MessageSerializerImpl::parse_object(const std::string &text, nlohmann::json &out)
{
    out = nlohmann::json::parse(text, nullptr, false);
    if (out.is_discarded() || !out.is_object())
    {
        LOG(WARNING) << "Message is not a JSON object";
        return false;
    }
    return true;
}

bool MessageSerializerImpl::parse_peer(const nlohmann::json &json, network::PeerAddress &out)
{
    auto address = json.find(key_address);
    auto port    = json.find(key_port);
    if (address == json.end() || !address->is_string() || port == json.end() ||
        !port->is_number_unsigned() ||
        port->get<unsigned long long>() > std::numeric_limits<unsigned short>::max())
    {
        LOG(WARNING) << "Malformed peer address";
        return false;
    }

    out.address = address->get<std::string>();
    out.port    = port->get<unsigned short>();
    return true;
}
}  // namespace pshare::protocol
