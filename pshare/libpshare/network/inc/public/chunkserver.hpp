#ifndef PSHARE_NETWORK_CHUNKSERVER_HPP_
#define PSHARE_NETWORK_CHUNKSERVER_HPP_

#include <cstddef>

namespace pshare::network
{
class ChunkServer
{
public:
    virtual ~ChunkServer() = default;

    virtual bool                         start()                         = 0;
    virtual void                         stop()                          = 0;
    [[nodiscard]] virtual unsigned short port() const                    = 0;
    [[nodiscard]] virtual size_t         active_connection_count() const = 0;
};
}  // namespace pshare::network

#endif  // PSHARE_NETWORK_CHUNKSERVER_HPP_
