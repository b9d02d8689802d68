#ifndef PSHARE_CRYPTO_HEXENCODER_HPP_
#define PSHARE_CRYPTO_HEXENCODER_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace pshare::crypto
{
class HexEncoder
{
public:
    using Byte = uint8_t;

    virtual ~HexEncoder() = default;

    // Lowercase, two digits per byte
    [[nodiscard]] virtual std::string encode(const std::vector<Byte> &data) const = 0;
};
}  // namespace pshare::crypto

#endif  // PSHARE_CRYPTO_HEXENCODER_HPP_
