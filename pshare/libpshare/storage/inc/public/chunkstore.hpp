#ifndef PSHARE_STORAGE_CHUNKSTORE_HPP_
#define PSHARE_STORAGE_CHUNKSTORE_HPP_

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "errorcode.hpp"
#include "manifest.hpp"

namespace pshare::storage
{
class ChunkStore
{
public:
    using Byte = uint8_t;

    virtual ~ChunkStore() = default;

    // Reads chunk chunk_index of the file described by manifest. The bytes are handed out only
    // if they still match the chunk digest.
    virtual utils::ErrorCode read_chunk(const std::string &file_path, const Manifest &manifest,
        long long chunk_index, std::vector<Byte> &out) const = 0;

    // Appends data to out after checking it against the chunk digest. Nothing is written on a
    // mismatch. Chunks must be written in index order.
    virtual utils::ErrorCode write_chunk(
        std::ostream &out, const Chunk &chunk, const std::vector<Byte> &data) const = 0;

    [[nodiscard]] virtual bool verify_chunk(const Chunk &chunk, const Byte *data, size_t len) const = 0;
};
}  // namespace pshare::storage

#endif  // PSHARE_STORAGE_CHUNKSTORE_HPP_
