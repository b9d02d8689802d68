#include "chunkstoreimpl.hpp"

#include <glog/logging.h>

#include "hexencoder.hpp"
#include "openfile.hpp"
#include "sha256hasher.hpp"

namespace pshare::storage
{
ChunkStoreImpl::ChunkStoreImpl(std::shared_ptr<const crypto::SHA256Hasher> hasher,
    std::shared_ptr<const crypto::HexEncoder>                              hex_encoder)
    : hasher_ {std::move(hasher)}
    , hex_encoder_ {std::move(hex_encoder)}
{}

utils::ErrorCode ChunkStoreImpl::read_chunk(const std::string &file_path,
    const Manifest &manifest, long long chunk_index, std::vector<Byte> &out) const
{
    if (chunk_index < 0 || size_t(chunk_index) >= manifest.chunks.size())
    {
        LOG(WARNING) << "Chunk index " << chunk_index << " out of range [0, "
                     << manifest.chunks.size() << ")";
        return utils::ErrorCode::RANGE_ERROR;
    }

    const Chunk &chunk  = manifest.chunks[size_t(chunk_index)];
    size_t       offset = chunk.index * manifest.chunk_size;

    OpenFile file {file_path};
    if (!file)
    {
        return utils::ErrorCode::IO_ERROR;
    }

    std::vector<Byte> data(chunk.size);
    size_t            bytes_read = file.read(offset, chunk.size, data.data());
    if (bytes_read != chunk.size)
    {
        LOG(ERROR) << "Short read on chunk " << chunk.index << " of " << file_path << ": expected "
                   << chunk.size << " bytes, got " << bytes_read;
        return utils::ErrorCode::IO_ERROR;
    }

    if (!verify_chunk(chunk, data.data(), data.size()))
    {
        LOG(ERROR) << "Chunk " << chunk.index << " of " << file_path
                   << " does not match its digest, the file changed since it was chunked";
        return utils::ErrorCode::INTEGRITY_ERROR;
    }

    out = std::move(data);
    return utils::ErrorCode::OK;
}

utils::ErrorCode ChunkStoreImpl::write_chunk(
    std::ostream &out, const Chunk &chunk, const std::vector<Byte> &data) const
{
    if (!verify_chunk(chunk, data.data(), data.size()))
    {
        LOG(WARNING) << "Refusing to write chunk " << chunk.index << ", digest mismatch";
        return utils::ErrorCode::INTEGRITY_ERROR;
    }

    out.write(reinterpret_cast<const char *>(data.data()), std::streamsize(data.size()));
    if (!out)
    {
        LOG(ERROR) << "Failed to append chunk " << chunk.index;
        return utils::ErrorCode::IO_ERROR;
    }

    return utils::ErrorCode::OK;
}

bool ChunkStoreImpl::verify_chunk(const Chunk &chunk, const Byte *data, size_t len) const
{
    return len == chunk.size && hex_encoder_->encode(hasher_->hash(data, len)) == chunk.hash;
}
}  // namespace pshare::storage
