#ifndef PSHARE_PROTOCOL_MESSAGESERIALIZERIMPL_HPP_
#define PSHARE_PROTOCOL_MESSAGESERIALIZERIMPL_HPP_

#include <nlohmann/json.hpp>

#include "messageserializer.hpp"

namespace pshare::protocol
{
class MessageSerializerImpl : public MessageSerializer
{
public:
    [[nodiscard]] std::string serialize(const ChunkRequest &message) const override;
    [[nodiscard]] std::string serialize(const AnnounceRequest &message) const override;
    [[nodiscard]] std::string serialize(const PeersReply &message) const override;

    bool deserialize(const std::string &text, ChunkRequest &message) const override;
    bool deserialize(const std::string &text, AnnounceRequest &message) const override;
    bool deserialize(const std::string &text, PeersReply &message) const override;

private:
    static bool parse_object(const std::string &text, nlohmann::json &out);
    static bool parse_peer(const nlohmann::json &json, network::PeerAddress &out);
};
}  // namespace pshare::protocol

#endif  // PSHARE_PROTOCOL_MESSAGESERIALIZERIMPL_HPP_
