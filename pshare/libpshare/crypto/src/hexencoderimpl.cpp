#include "hexencoderimpl.hpp"

#include <iomanip>
#include <sstream>

namespace pshare::crypto
{
std::string HexEncoderImpl::encode(const std::vector<Byte> &data) const
{
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (Byte b : data)
    {
        ss << std::setw(2) << int(b);
    }
    return ss.str();
}
}  // namespace pshare::crypto
