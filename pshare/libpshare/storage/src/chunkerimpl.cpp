#include "chunkerimpl.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

#include <glog/logging.h>

#include "hexencoder.hpp"
#include "sha256hasher.hpp"

namespace pshare::storage
{
ChunkerImpl::ChunkerImpl(std::shared_ptr<const crypto::SHA256Hasher> hasher,
    std::shared_ptr<const crypto::HexEncoder>                        hex_encoder)
    : hasher_ {std::move(hasher)}
    , hex_encoder_ {std::move(hex_encoder)}
{}

utils::ErrorCode ChunkerImpl::build_manifest(
    const std::string &file_path, size_t chunk_size, Manifest &out) const
{
    if (chunk_size == 0)
    {
        LOG(ERROR) << "Chunk size must be positive";
        return utils::ErrorCode::INVALID_ARGUMENT;
    }

    std::error_code ec;
    auto            file_size = std::filesystem::file_size(file_path, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot determine the size of " << file_path << ": " << ec.message();
        return utils::ErrorCode::IO_ERROR;
    }

    Manifest manifest;
    manifest.file_name  = std::filesystem::path {file_path}.filename().string();
    manifest.file_size  = size_t(file_size);
    manifest.chunk_size = chunk_size;

    size_t bytes_hashed = 0;
    auto   status       = hash_file(file_path, manifest.file_hash, bytes_hashed);
    if (status != utils::ErrorCode::OK)
    {
        return status;
    }
    if (bytes_hashed != manifest.file_size)
    {
        LOG(ERROR) << file_path << " changed while being chunked: expected " << manifest.file_size
                   << " bytes, read " << bytes_hashed;
        return utils::ErrorCode::IO_ERROR;
    }

    std::ifstream fs {file_path, std::ios::in | std::ios::binary};
    if (!fs)
    {
        LOG(ERROR) << "Cannot open " << file_path << " for reading";
        return utils::ErrorCode::IO_ERROR;
    }

    size_t               chunk_count = (manifest.file_size + chunk_size - 1) / chunk_size;
    std::vector<uint8_t> buffer(std::min(chunk_size, manifest.file_size));
    manifest.chunks.reserve(chunk_count);

    for (size_t i = 0; i != chunk_count; ++i)
    {
        size_t offset = i * chunk_size;
        size_t len    = std::min(chunk_size, manifest.file_size - offset);

        fs.seekg(std::streamoff(offset));
        fs.read(reinterpret_cast<char *>(buffer.data()), std::streamsize(len));
        if (size_t(fs.gcount()) != len)
        {
            LOG(ERROR) << "Short read on chunk " << i << " of " << file_path << ": expected "
                       << len << " bytes, got " << fs.gcount();
            return utils::ErrorCode::IO_ERROR;
        }

        manifest.chunks.push_back(
            Chunk {i, hex_encoder_->encode(hasher_->hash(buffer.data(), len)), len});
    }

    out = std::move(manifest);
    return utils::ErrorCode::OK;
}

utils::ErrorCode ChunkerImpl::hash_file(const std::string &file_path, std::string &out) const
{
    size_t bytes_read;
    return hash_file(file_path, out, bytes_read);
}

utils::ErrorCode ChunkerImpl::hash_file(
    const std::string &file_path, std::string &out, size_t &bytes_read) const
{
    std::ifstream fs {file_path, std::ios::in | std::ios::binary};
    if (!fs)
    {
        LOG(ERROR) << "Cannot open " << file_path << " for reading";
        return utils::ErrorCode::IO_ERROR;
    }

    auto digest = hasher_->hash(fs, bytes_read);
    if (digest.empty())
    {
        LOG(ERROR) << "Failed to read " << file_path;
        return utils::ErrorCode::IO_ERROR;
    }

    out = hex_encoder_->encode(digest);
    return utils::ErrorCode::OK;
}
}  // namespace pshare::storage
