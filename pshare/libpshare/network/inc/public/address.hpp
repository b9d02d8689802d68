#ifndef PSHARE_NETWORK_ADDRESS_HPP_
#define PSHARE_NETWORK_ADDRESS_HPP_

#include <ostream>
#include <string>
#include <tuple>

namespace pshare::network
{
struct PeerAddress
{
    std::string    address;
    unsigned short port = 0;

    [[nodiscard]] bool is_valid() const
    {
        return !address.empty() && port != 0;
    }

    [[nodiscard]] std::string to_string() const
    {
        return address + ':' + std::to_string(port);
    }
};

inline bool operator==(const PeerAddress &lhs, const PeerAddress &rhs)
{
    return lhs.address == rhs.address && lhs.port == rhs.port;
}

inline bool operator!=(const PeerAddress &lhs, const PeerAddress &rhs)
{
    return !(lhs == rhs);
}

inline bool operator<(const PeerAddress &lhs, const PeerAddress &rhs)
{
    return std::tie(lhs.address, lhs.port) < std::tie(rhs.address, rhs.port);
}

inline std::ostream &operator<<(std::ostream &os, const PeerAddress &peer)
{
    return os << peer.to_string();
}
}  // namespace pshare::network

#endif  // PSHARE_NETWORK_ADDRESS_HPP_
