#include "manifestcodecimpl.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <glog/logging.h>

namespace pshare::storage
{
namespace
{
constexpr char const *key_file_name  = "fileName";
constexpr char const *key_file_size  = "fileSize";
constexpr char const *key_chunk_size = "chunkSize";
constexpr char const *key_chunks     = "chunks";
constexpr char const *key_file_hash  = "fileHash";
constexpr char const *key_hash       = "hash";
constexpr char const *key_size       = "size";
}  // namespace

std::string ManifestCodecImpl::encode(const Manifest &manifest) const
{
    nlohmann::json chunks = nlohmann::json::array();
    for (const auto &chunk : manifest.chunks)
    {
        chunks.push_back({{key_hash, chunk.hash}, {key_size, chunk.size}});
    }

    nlohmann::json root;
    root[key_file_name]  = manifest.file_name;
    root[key_file_size]  = manifest.file_size;
    root[key_chunk_size] = manifest.chunk_size;
    root[key_chunks]     = std::move(chunks);
    root[key_file_hash]  = manifest.file_hash;

    return root.dump(indent);
}

utils::ErrorCode ManifestCodecImpl::decode(const std::string &text, Manifest &out) const
{
    nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object())
    {
        LOG(WARNING) << "Manifest is not a JSON object";
        return utils::ErrorCode::INVALID_ARGUMENT;
    }

    auto file_name  = root.find(key_file_name);
    auto file_size  = root.find(key_file_size);
    auto chunk_size = root.find(key_chunk_size);
    auto chunks     = root.find(key_chunks);
    auto file_hash  = root.find(key_file_hash);

    if (file_name == root.end() || !file_name->is_string() || file_size == root.end() ||
        !file_size->is_number_unsigned() || chunk_size == root.end() || !is_size(*chunk_size) ||
        chunks == root.end() || !chunks->is_array() || file_hash == root.end() ||
        !is_digest(*file_hash))
    {
        LOG(WARNING) << "Manifest has missing or mistyped fields";
        return utils::ErrorCode::INVALID_ARGUMENT;
    }

    Manifest manifest;
    manifest.file_name  = file_name->get<std::string>();
    manifest.file_size  = file_size->get<size_t>();
    manifest.chunk_size = chunk_size->get<size_t>();
    manifest.file_hash  = file_hash->get<std::string>();

    if (manifest.file_name.empty() ||
        std::filesystem::path {manifest.file_name}.filename().string() != manifest.file_name ||
        manifest.file_name == "." || manifest.file_name == "..")
    {
        LOG(WARNING) << "Manifest file name must be a plain file name, got \""
                     << manifest.file_name << "\"";
        return utils::ErrorCode::INVALID_ARGUMENT;
    }

    for (const auto &chunk : *chunks)
    {
        if (!chunk.is_object() || !chunk.contains(key_hash) || !is_digest(chunk[key_hash]) ||
            !chunk.contains(key_size) || !is_size(chunk[key_size]))
        {
            LOG(WARNING) << "Malformed chunk entry at index " << manifest.chunks.size();
            return utils::ErrorCode::INVALID_ARGUMENT;
        }
        manifest.chunks.push_back(Chunk {manifest.chunks.size(),
            chunk[key_hash].get<std::string>(), chunk[key_size].get<size_t>()});
    }

    if (!check_layout(manifest))
    {
        return utils::ErrorCode::INVALID_ARGUMENT;
    }

    out = std::move(manifest);
    return utils::ErrorCode::OK;
}

utils::ErrorCode ManifestCodecImpl::save(const Manifest &manifest, const std::string &path) const
{
    std::ofstream fs {path, std::ios::out | std::ios::trunc};
    if (!fs)
    {
        LOG(ERROR) << "Cannot open " << path << " for writing";
        return utils::ErrorCode::IO_ERROR;
    }

    fs << encode(manifest) << '\n';
    fs.flush();
    if (!fs)
    {
        LOG(ERROR) << "Failed to write manifest to " << path;
        return utils::ErrorCode::IO_ERROR;
    }

    return utils::ErrorCode::OK;
}

utils::ErrorCode ManifestCodecImpl::load(const std::string &path, Manifest &out) const
{
    std::ifstream fs {path};
    if (!fs)
    {
        LOG(ERROR) << "Cannot open " << path << " for reading";
        return utils::ErrorCode::IO_ERROR;
    }

    std::ostringstream ss;
    ss << fs.rdbuf();
    if (fs.bad())
    {
        LOG(ERROR) << "Failed to read " << path;
        return utils::ErrorCode::IO_ERROR;
    }

    auto status = decode(ss.str(), out);
    if (status != utils::ErrorCode::OK)
    {
        LOG(ERROR) << "Invalid manifest " << path;
    }
    return status;
}

bool ManifestCodecImpl::is_digest(const nlohmann::json &value)
{
    if (!value.is_string())
    {
        return false;
    }

    const auto &str = value.get_ref<const std::string &>();
    return str.size() == 64 && std::all_of(str.cbegin(), str.cend(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

bool ManifestCodecImpl::is_size(const nlohmann::json &value)
{
    return value.is_number_unsigned() && value.get<size_t>() > 0;
}

bool ManifestCodecImpl::check_layout(const Manifest &manifest)
{
    size_t expected_count = (manifest.file_size + manifest.chunk_size - 1) / manifest.chunk_size;
    if (manifest.chunks.size() != expected_count)
    {
        LOG(WARNING) << "Manifest lists " << manifest.chunks.size() << " chunks, expected "
                     << expected_count;
        return false;
    }

    size_t total = 0;
    for (const auto &chunk : manifest.chunks)
    {
        bool is_last = chunk.index + 1 == manifest.chunks.size();
        if ((!is_last && chunk.size != manifest.chunk_size) || chunk.size > manifest.chunk_size)
        {
            LOG(WARNING) << "Chunk " << chunk.index << " has unexpected size " << chunk.size;
            return false;
        }
        total += chunk.size;
    }

    if (total != manifest.file_size)
    {
        LOG(WARNING) << "Chunk sizes add up to " << total << ", expected " << manifest.file_size;
        return false;
    }

    return true;
}
}  // namespace pshare::storage
