#ifndef PSHARE_CRYPTO_SHA256HASHERIMPL_HPP_
#define PSHARE_CRYPTO_SHA256HASHERIMPL_HPP_

#include "sha256hasher.hpp"

namespace pshare::crypto
{
class SHA256HasherImpl : public SHA256Hasher
{
public:
    std::vector<Byte> hash(const Byte *data, size_t len) const override;
    std::vector<Byte> hash(std::istream &is) const override;
    std::vector<Byte> hash(std::istream &is, size_t &bytes_read) const override;

private:
    static constexpr size_t read_buffer_size = 32 * 1024;  // 32 KiB
};
}  // namespace pshare::crypto

#endif  // PSHARE_CRYPTO_SHA256HASHERIMPL_HPP_
