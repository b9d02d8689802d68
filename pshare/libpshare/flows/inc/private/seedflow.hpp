#ifndef PSHARE_FLOWS_SEEDFLOW_HPP_
#define PSHARE_FLOWS_SEEDFLOW_HPP_

#include <atomic>
#include <memory>
#include <string>

#include "chunkrequesthandler.hpp"
#include "manifest.hpp"

namespace pshare::storage
{
// Forward declarations
class ChunkStore;
}  // namespace pshare::storage

namespace pshare::flows
{
// Answers chunk requests for one shared file. The manifest is fixed for the lifetime of the
// object and every served chunk is re-verified against it.
class SeedFlow : public network::ChunkRequestHandler
{
public:
    SeedFlow(std::string file_path, storage::Manifest manifest,
        std::shared_ptr<const storage::ChunkStore> chunk_store);

    [[nodiscard]] const std::string &      file_path() const;
    [[nodiscard]] const storage::Manifest &manifest() const;
    [[nodiscard]] size_t                   chunks_served() const;

    utils::ErrorCode on_chunk_requested(long long chunk_index, std::vector<uint8_t> &out) override;

private:
    const std::string                          file_path_;
    const storage::Manifest                    manifest_;
    std::shared_ptr<const storage::ChunkStore> chunk_store_;
    std::atomic<size_t>                        chunks_served_;
};
}  // namespace pshare::flows

#endif  // PSHARE_FLOWS_SEEDFLOW_HPP_
