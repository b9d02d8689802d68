#ifndef PSHARE_STORAGE_CHUNKERIMPL_HPP_
#define PSHARE_STORAGE_CHUNKERIMPL_HPP_

#include <memory>

#include "chunker.hpp"

namespace pshare::crypto
{
// Forward declarations
class SHA256Hasher;
class HexEncoder;
}  // namespace pshare::crypto

namespace pshare::storage
{
class ChunkerImpl : public Chunker
{
public:
    ChunkerImpl(std::shared_ptr<const crypto::SHA256Hasher> hasher,
        std::shared_ptr<const crypto::HexEncoder>           hex_encoder);

    utils::ErrorCode build_manifest(
        const std::string &file_path, size_t chunk_size, Manifest &out) const override;
    utils::ErrorCode hash_file(const std::string &file_path, std::string &out) const override;

private:
    utils::ErrorCode hash_file(
        const std::string &file_path, std::string &out, size_t &bytes_read) const;

    std::shared_ptr<const crypto::SHA256Hasher> hasher_;
    std::shared_ptr<const crypto::HexEncoder>   hex_encoder_;
};
}  // namespace pshare::storage

#endif  // PSHARE_STORAGE_CHUNKERIMPL_HPP_
