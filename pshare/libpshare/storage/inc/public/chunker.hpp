#ifndef PSHARE_STORAGE_CHUNKER_HPP_
#define PSHARE_STORAGE_CHUNKER_HPP_

#include <cstddef>
#include <string>

#include "errorcode.hpp"
#include "manifest.hpp"

namespace pshare::storage
{
class Chunker
{
public:
    virtual ~Chunker() = default;

    // Splits the file into chunk_size byte ranges (the last one may be shorter) and digests
    // each range and the whole file.
    virtual utils::ErrorCode build_manifest(
        const std::string &file_path, size_t chunk_size, Manifest &out) const = 0;

    virtual utils::ErrorCode hash_file(const std::string &file_path, std::string &out) const = 0;
};
}  // namespace pshare::storage

#endif  // PSHARE_STORAGE_CHUNKER_HPP_
