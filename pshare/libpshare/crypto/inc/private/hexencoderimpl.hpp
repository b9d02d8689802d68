#ifndef PSHARE_CRYPTO_HEXENCODERIMPL_HPP_
#define PSHARE_CRYPTO_HEXENCODERIMPL_HPP_

#include "hexencoder.hpp"

namespace pshare::crypto
{
class HexEncoderImpl : public HexEncoder
{
public:
    [[nodiscard]] std::string encode(const std::vector<Byte> &data) const override;
};
}  // namespace pshare::crypto

#endif  // PSHARE_CRYPTO_HEXENCODERIMPL_HPP_
