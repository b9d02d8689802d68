#ifndef PSHARE_STORAGE_CHUNKSTOREIMPL_HPP_
#define PSHARE_STORAGE_CHUNKSTOREIMPL_HPP_

#include <memory>

#include "chunkstore.hpp"

namespace pshare::crypto
{
// Forward declarations
class SHA256Hasher;
class HexEncoder;
}  // namespace pshare::crypto

namespace pshare::storage
{
class ChunkStoreImpl : public ChunkStore
{
public:
    ChunkStoreImpl(std::shared_ptr<const crypto::SHA256Hasher> hasher,
        std::shared_ptr<const crypto::HexEncoder>              hex_encoder);

    utils::ErrorCode read_chunk(const std::string &file_path, const Manifest &manifest,
        long long chunk_index, std::vector<Byte> &out) const override;
    utils::ErrorCode write_chunk(
        std::ostream &out, const Chunk &chunk, const std::vector<Byte> &data) const override;
    [[nodiscard]] bool verify_chunk(const Chunk &chunk, const Byte *data, size_t len) const override;

private:
    std::shared_ptr<const crypto::SHA256Hasher> hasher_;
    std::shared_ptr<const crypto::HexEncoder>   hex_encoder_;
};
}  // namespace pshare::storage

#endif  // PSHARE_STORAGE_CHUNKSTOREIMPL_HPP_
