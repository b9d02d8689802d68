#include "seedflow.hpp"

#include "chunkstore.hpp"

namespace pshare::flows
{
SeedFlow::SeedFlow(std::string file_path, storage::Manifest manifest,
    std::shared_ptr<const storage::ChunkStore> chunk_store)
    : file_path_ {std::move(file_path)}
    , manifest_ {std::move(manifest)}
    , chunk_store_ {std::move(chunk_store)}
    , chunks_served_ {0}
{}

const std::string &SeedFlow::file_path() const
{
    return file_path_;
}

const storage::Manifest &SeedFlow::manifest() const
{
    return manifest_;
}

size_t SeedFlow::chunks_served() const
{
    return chunks_served_;
}

utils::ErrorCode SeedFlow::on_chunk_requested(long long chunk_index, std::vector<uint8_t> &out)
{
    auto status = chunk_store_->read_chunk(file_path_, manifest_, chunk_index, out);
    if (status == utils::ErrorCode::OK)
    {
        ++chunks_served_;
    }
    return status;
}
}  // namespace pshare::flows
