#ifndef PSHARE_STORAGE_MANIFEST_HPP_
#define PSHARE_STORAGE_MANIFEST_HPP_

#include <cstddef>
#include <string>
#include <vector>

namespace pshare::storage
{
struct Chunk
{
    size_t      index = 0;
    std::string hash;  // lowercase hex SHA-256 of the chunk bytes
    size_t      size = 0;
};

struct Manifest
{
    std::string        file_name;
    size_t             file_size  = 0;
    size_t             chunk_size = 0;
    std::vector<Chunk> chunks;
    std::string        file_hash;  // lowercase hex SHA-256 of the whole file
};

constexpr size_t default_chunk_size = 1024 * 1024;  // 1 MiB

inline bool operator==(const Chunk &lhs, const Chunk &rhs)
{
    return lhs.index == rhs.index && lhs.hash == rhs.hash && lhs.size == rhs.size;
}

inline bool operator!=(const Chunk &lhs, const Chunk &rhs)
{
    return !(lhs == rhs);
}

inline bool operator==(const Manifest &lhs, const Manifest &rhs)
{
    return lhs.file_name == rhs.file_name && lhs.file_size == rhs.file_size &&
           lhs.chunk_size == rhs.chunk_size && lhs.chunks == rhs.chunks &&
           lhs.file_hash == rhs.file_hash;
}

inline bool operator!=(const Manifest &lhs, const Manifest &rhs)
{
    return !(lhs == rhs);
}

// Path of the manifest saved next to an uploaded file
inline std::string manifest_file_path(const std::string &file_path)
{
    return file_path + ".manifest";
}
}  // namespace pshare::storage

#endif  // PSHARE_STORAGE_MANIFEST_HPP_
