#ifndef PSHARE_PROTOCOL_MESSAGESERIALIZER_HPP_
#define PSHARE_PROTOCOL_MESSAGESERIALIZER_HPP_

#include <string>

#include "messages.hpp"

namespace pshare::protocol
{
class MessageSerializer
{
public:
    virtual ~MessageSerializer() = default;

    [[nodiscard]] virtual std::string serialize(const ChunkRequest &message) const    = 0;
    [[nodiscard]] virtual std::string serialize(const AnnounceRequest &message) const = 0;
    [[nodiscard]] virtual std::string serialize(const PeersReply &message) const      = 0;

    virtual bool deserialize(const std::string &text, ChunkRequest &message) const    = 0;
    virtual bool deserialize(const std::string &text, AnnounceRequest &message) const = 0;
    virtual bool deserialize(const std::string &text, PeersReply &message) const      = 0;
};
}  // namespace pshare::protocol

#endif  // PSHARE_PROTOCOL_MESSAGESERIALIZER_HPP_
