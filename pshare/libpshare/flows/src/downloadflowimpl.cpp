#include "downloadflowimpl.hpp"

#include <filesystem>
#include <fstream>
#include <vector>

#include <glog/logging.h>

#include "chunker.hpp"
#include "chunkfetcher.hpp"
#include "chunkstore.hpp"
#include "defer.hpp"

namespace pshare::flows
{
namespace
{
DownloadFlow::State to_flow_state(network::ChunkFetcher::Stage stage)
{
    switch (stage)
    {
        case network::ChunkFetcher::Stage::CONNECTING: return DownloadFlow::State::CONNECTING;
        case network::ChunkFetcher::Stage::REQUESTING: return DownloadFlow::State::REQUESTING;
        case network::ChunkFetcher::Stage::RECEIVING: return DownloadFlow::State::RECEIVING;
    }
    return DownloadFlow::State::FAILED;
}
}  // namespace

DownloadFlowImpl::DownloadFlowImpl(std::shared_ptr<const network::ChunkFetcher> chunk_fetcher,
    std::shared_ptr<const storage::ChunkStore>                                   chunk_store,
    std::shared_ptr<const storage::Chunker>                                      chunker)
    : chunk_fetcher_ {std::move(chunk_fetcher)}
    , chunk_store_ {std::move(chunk_store)}
    , chunker_ {std::move(chunker)}
    , state_ {State::IDLE}
    , busy_ {false}
{}

bool DownloadFlowImpl::register_listener(std::shared_ptr<DownloadFlowListener> listener)
{
    return listener_group_.add(listener);
}

bool DownloadFlowImpl::unregister_listener(std::shared_ptr<DownloadFlowListener> listener)
{
    return listener_group_.remove(listener);
}

DownloadFlow::State DownloadFlowImpl::state() const
{
    std::lock_guard lock {mutex_};
    return state_;
}

DownloadResult DownloadFlowImpl::download(const storage::Manifest &manifest,
    const network::PeerAddress &peer, const std::string &output_path)
{
    {
        std::lock_guard lock {mutex_};
        if (busy_)
        {
            LOG(ERROR) << "A download is already in progress";
            return DownloadResult {utils::ErrorCode::INVALID_ARGUMENT, 0, std::nullopt};
        }
        busy_ = true;
    }
    DEFER({
        std::lock_guard lock {mutex_};
        busy_ = false;
    });

    LOG(INFO) << "Downloading " << manifest.file_name << " (" << manifest.chunks.size()
              << " chunks) from " << peer << " to " << output_path;

    auto result = run(manifest, peer, output_path);
    if (result.ok())
    {
        LOG(INFO) << "Download of " << manifest.file_name << " completed";
        listener_group_.notify(&DownloadFlowListener::on_download_completed, output_path);
    }
    else
    {
        listener_group_.notify(&DownloadFlowListener::on_download_failed, result);
    }
    return result;
}

DownloadResult DownloadFlowImpl::run(const storage::Manifest &manifest,
    const network::PeerAddress &peer, const std::string &output_path)
{
    DownloadResult result;

    auto parent_dir = std::filesystem::path {output_path}.parent_path();
    if (!parent_dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent_dir, ec);
        if (ec)
        {
            LOG(ERROR) << "Cannot create directory " << parent_dir << ": " << ec.message();
            return fail(result, utils::ErrorCode::IO_ERROR);
        }
    }

    {
        std::ofstream out {output_path, std::ios::out | std::ios::binary | std::ios::trunc};
        if (!out)
        {
            LOG(ERROR) << "Cannot open " << output_path << " for writing";
            return fail(result, utils::ErrorCode::IO_ERROR);
        }

        size_t bytes_transferred = 0;
        for (const auto &chunk : manifest.chunks)
        {
            std::vector<uint8_t> data;
            auto                 status = chunk_fetcher_->fetch_chunk(peer,
                static_cast<long long>(chunk.index), chunk.size, data,
                [this, &chunk](network::ChunkFetcher::Stage stage) {
                    set_state(to_flow_state(stage), chunk.index);
                });
            if (status != utils::ErrorCode::OK)
            {
                return fail(result, status, chunk.index);
            }

            set_state(State::VERIFYING, chunk.index);
            if (!chunk_store_->verify_chunk(chunk, data.data(), data.size()))
            {
                LOG(ERROR) << "Chunk " << chunk.index << " from " << peer
                           << " does not match its digest";
                return fail(result, utils::ErrorCode::INTEGRITY_ERROR, chunk.index);
            }

            set_state(State::APPENDING, chunk.index);
            status = chunk_store_->write_chunk(out, chunk, data);
            if (status != utils::ErrorCode::OK)
            {
                return fail(result, status, chunk.index);
            }

            ++result.chunks_completed;
            bytes_transferred += chunk.size;
            listener_group_.notify(&DownloadFlowListener::on_transfer_progress_changed,
                bytes_transferred, manifest.file_size);
        }

        out.close();
        if (!out)
        {
            LOG(ERROR) << "Failed to flush " << output_path;
            return fail(result, utils::ErrorCode::IO_ERROR);
        }
    }

    std::string file_hash;
    auto        status = chunker_->hash_file(output_path, file_hash);
    if (status != utils::ErrorCode::OK)
    {
        return fail(result, status);
    }
    if (file_hash != manifest.file_hash)
    {
        LOG(ERROR) << "Downloaded file digest " << file_hash << " does not match "
                   << manifest.file_hash;
        return fail(result, utils::ErrorCode::INTEGRITY_ERROR);
    }

    set_state(State::DONE, result.chunks_completed);
    return result;
}

DownloadResult DownloadFlowImpl::fail(
    DownloadResult result, utils::ErrorCode status, std::optional<size_t> chunk_index)
{
    result.status             = status;
    result.failed_chunk_index = chunk_index;

    if (chunk_index)
    {
        LOG(ERROR) << "Download aborted at chunk " << *chunk_index << ": " << status;
    }
    else
    {
        LOG(ERROR) << "Download aborted: " << status;
    }

    set_state(State::FAILED, chunk_index.value_or(result.chunks_completed));
    return result;
}

void DownloadFlowImpl::set_state(State new_state, size_t chunk_index)
{
    {
        std::lock_guard lock {mutex_};
        state_ = new_state;
    }
    listener_group_.notify(&DownloadFlowListener::on_state_changed, new_state, chunk_index);
}
}  // namespace pshare::flows
