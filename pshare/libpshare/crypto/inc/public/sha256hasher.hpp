#ifndef PSHARE_CRYPTO_SHA256HASHER_HPP_
#define PSHARE_CRYPTO_SHA256HASHER_HPP_

#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

namespace pshare::crypto
{
class SHA256Hasher
{
public:
    using Byte = uint8_t;

    static constexpr size_t digest_size = 32;

    virtual ~SHA256Hasher() = default;

    virtual std::vector<Byte> hash(const Byte *data, size_t len) const = 0;

    // Digests everything until the end of the stream. Returns an empty vector if the stream
    // goes bad before reaching its end.
    virtual std::vector<Byte> hash(std::istream &is) const = 0;
    virtual std::vector<Byte> hash(std::istream &is, size_t &bytes_read) const = 0;
};
}  // namespace pshare::crypto

#endif  // PSHARE_CRYPTO_SHA256HASHER_HPP_
