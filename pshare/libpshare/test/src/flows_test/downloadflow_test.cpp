#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "chunkerimpl.hpp"
#include "chunkstoreimpl.hpp"
#include "downloadflowimpl.hpp"
#include "hexencoderimpl.hpp"
#include "random.hpp"
#include "sha256hasherimpl.hpp"

#include "chunkfetcher_mock.hpp"
#include "downloadflowlistener_mock.hpp"
#include "testutils.hpp"

using namespace ::testing;
using namespace ::pshare::flows;
using namespace ::pshare::storage;
using ::pshare::utils::ErrorCode;

namespace
{
class DownloadFlowTest : public Test
{
protected:
    void SetUp() override
    {
        auto hasher      = std::make_shared<pshare::crypto::SHA256HasherImpl>();
        auto hex_encoder = std::make_shared<pshare::crypto::HexEncoderImpl>();
        chunker_         = std::make_shared<ChunkerImpl>(hasher, hex_encoder);
        chunk_fetcher_   = std::make_shared<NiceMock<ChunkFetcherMock>>();
        listener_        = std::make_shared<NiceMock<DownloadFlowListenerMock>>();

        content_ = rng_.bytes(file_size);
        auto source_path = temp_dir_.file("source.bin");
        ASSERT_TRUE(testutils::write_file(source_path, content_));
        ASSERT_EQ(chunker_->build_manifest(source_path, chunk_size, manifest_), ErrorCode::OK);

        flow_ = std::make_unique<DownloadFlowImpl>(
            chunk_fetcher_, std::make_shared<ChunkStoreImpl>(hasher, hex_encoder), chunker_);
        flow_->register_listener(listener_);
    }

    // Serves the chunks of content_; the chunk at corrupted_index gets one bit flipped
    void serve_content(long long corrupted_index = -1)
    {
        ON_CALL(*chunk_fetcher_, fetch_chunk(_, _, _, _, _))
            .WillByDefault(Invoke([this, corrupted_index](const PeerAddress &, long long index,
                                      size_t expected_size, std::vector<uint8_t> &out,
                                      const ChunkFetcher::StageCallback &on_stage_changed) {
                on_stage_changed(ChunkFetcher::Stage::CONNECTING);
                on_stage_changed(ChunkFetcher::Stage::REQUESTING);
                on_stage_changed(ChunkFetcher::Stage::RECEIVING);

                auto begin = content_.cbegin() + std::ptrdiff_t(size_t(index) * chunk_size);
                out.assign(begin, begin + std::ptrdiff_t(expected_size));
                if (index == corrupted_index)
                {
                    out[out.size() / 2] ^= 0x01;
                }
                return ErrorCode::OK;
            }));
    }

    static constexpr size_t file_size  = 5 * 1000 + 321;
    static constexpr size_t chunk_size = 1000;

    std::shared_ptr<Chunker>                            chunker_;
    std::shared_ptr<NiceMock<ChunkFetcherMock>>         chunk_fetcher_;
    std::shared_ptr<NiceMock<DownloadFlowListenerMock>> listener_;
    std::unique_ptr<DownloadFlow>                       flow_;
    pshare::utils::Random                               rng_;
    testutils::TempDir                                  temp_dir_ {"pshare_downloadflow_test"};
    std::vector<uint8_t>                                content_;
    Manifest                                            manifest_;
    const PeerAddress                                   peer_ {"10.0.0.9", 9000};
};
}  // namespace

TEST_F(DownloadFlowTest, DownloadWholeFile)
{
    serve_content();
    auto output_path = temp_dir_.file("downloads/source.bin");

    {
        InSequence seq;
        for (size_t i = 0; i != manifest_.chunks.size(); ++i)
        {
            EXPECT_CALL(*chunk_fetcher_,
                fetch_chunk(peer_, (long long) i, manifest_.chunks[i].size, _, _));
        }
    }
    EXPECT_CALL(*listener_, on_state_changed(_, _)).Times(AnyNumber());
    EXPECT_CALL(*listener_, on_transfer_progress_changed(_, file_size)).Times(5);
    EXPECT_CALL(*listener_, on_transfer_progress_changed(file_size, file_size));
    EXPECT_CALL(*listener_, on_state_changed(DownloadFlow::State::DONE, 6));
    EXPECT_CALL(*listener_, on_download_completed(output_path));
    EXPECT_CALL(*listener_, on_download_failed(_)).Times(0);

    auto result = flow_->download(manifest_, peer_, output_path);

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.chunks_completed, 6);
    EXPECT_FALSE(result.failed_chunk_index);
    EXPECT_EQ(flow_->state(), DownloadFlow::State::DONE);
    EXPECT_EQ(testutils::read_file(output_path), content_);
}

TEST_F(DownloadFlowTest, CorruptedChunkStopsDownload)
{
    serve_content(2);
    auto output_path = temp_dir_.file("source.bin.part");

    EXPECT_CALL(*chunk_fetcher_, fetch_chunk(_, 0, _, _, _));
    EXPECT_CALL(*chunk_fetcher_, fetch_chunk(_, 1, _, _, _));
    EXPECT_CALL(*chunk_fetcher_, fetch_chunk(_, 2, _, _, _));
    EXPECT_CALL(*chunk_fetcher_, fetch_chunk(_, Gt(2), _, _, _)).Times(0);
    EXPECT_CALL(*listener_, on_state_changed(_, _)).Times(AnyNumber());
    EXPECT_CALL(*listener_, on_state_changed(DownloadFlow::State::FAILED, 2));
    EXPECT_CALL(*listener_, on_download_completed(_)).Times(0);
    EXPECT_CALL(*listener_, on_download_failed(Field(&DownloadResult::failed_chunk_index, 2)));

    auto result = flow_->download(manifest_, peer_, output_path);

    EXPECT_EQ(result.status, ErrorCode::INTEGRITY_ERROR);
    ASSERT_TRUE(result.failed_chunk_index);
    EXPECT_EQ(*result.failed_chunk_index, 2);
    EXPECT_EQ(result.chunks_completed, 2);
    EXPECT_EQ(flow_->state(), DownloadFlow::State::FAILED);

    // Only the chunks verified before the failure reached the output file
    auto written = testutils::read_file(output_path);
    EXPECT_EQ(written, std::vector<uint8_t>(content_.cbegin(), content_.cbegin() + 2 * chunk_size));
}

TEST_F(DownloadFlowTest, FetchFailureStopsDownload)
{
    serve_content();
    EXPECT_CALL(*chunk_fetcher_, fetch_chunk(_, 0, _, _, _));
    EXPECT_CALL(*chunk_fetcher_, fetch_chunk(_, 1, _, _, _)).WillOnce(Return(ErrorCode::IO_ERROR));
    EXPECT_CALL(*chunk_fetcher_, fetch_chunk(_, Gt(1), _, _, _)).Times(0);

    auto result = flow_->download(manifest_, peer_, temp_dir_.file("out.bin"));

    EXPECT_EQ(result.status, ErrorCode::IO_ERROR);
    ASSERT_TRUE(result.failed_chunk_index);
    EXPECT_EQ(*result.failed_chunk_index, 1);
    EXPECT_EQ(result.chunks_completed, 1);
}

TEST_F(DownloadFlowTest, StatesFollowEachChunk)
{
    serve_content();
    {
        InSequence seq;
        for (size_t i = 0; i != manifest_.chunks.size(); ++i)
        {
            EXPECT_CALL(*listener_, on_state_changed(DownloadFlow::State::CONNECTING, i));
            EXPECT_CALL(*listener_, on_state_changed(DownloadFlow::State::REQUESTING, i));
            EXPECT_CALL(*listener_, on_state_changed(DownloadFlow::State::RECEIVING, i));
            EXPECT_CALL(*listener_, on_state_changed(DownloadFlow::State::VERIFYING, i));
            EXPECT_CALL(*listener_, on_state_changed(DownloadFlow::State::APPENDING, i));
        }
        EXPECT_CALL(*listener_, on_state_changed(DownloadFlow::State::DONE, manifest_.chunks.size()));
    }

    EXPECT_TRUE(flow_->download(manifest_, peer_, temp_dir_.file("out.bin")).ok());
}

TEST_F(DownloadFlowTest, FileHashMismatchIsReported)
{
    serve_content();
    manifest_.file_hash = std::string(64, '0');

    auto result = flow_->download(manifest_, peer_, temp_dir_.file("out.bin"));

    EXPECT_EQ(result.status, ErrorCode::INTEGRITY_ERROR);
    EXPECT_FALSE(result.failed_chunk_index);
    EXPECT_EQ(result.chunks_completed, manifest_.chunks.size());
}

TEST_F(DownloadFlowTest, EmptyFile)
{
    auto empty_path = temp_dir_.file("empty.bin");
    ASSERT_TRUE(testutils::write_file(empty_path, {}));
    Manifest empty;
    ASSERT_EQ(chunker_->build_manifest(empty_path, chunk_size, empty), ErrorCode::OK);

    EXPECT_CALL(*chunk_fetcher_, fetch_chunk(_, _, _, _, _)).Times(0);

    auto output_path = temp_dir_.file("empty_copy.bin");
    EXPECT_TRUE(flow_->download(empty, peer_, output_path).ok());
    EXPECT_TRUE(std::filesystem::exists(output_path));
    EXPECT_EQ(std::filesystem::file_size(output_path), 0);
}

TEST_F(DownloadFlowTest, UnwritableOutput)
{
    EXPECT_CALL(*chunk_fetcher_, fetch_chunk(_, _, _, _, _)).Times(0);

    // A regular file where the parent directory should be
    auto blocker = temp_dir_.file("blocker");
    ASSERT_TRUE(testutils::write_file(blocker, {1}));

    auto result = flow_->download(manifest_, peer_, blocker + "/out.bin");
    EXPECT_EQ(result.status, ErrorCode::IO_ERROR);
    EXPECT_FALSE(result.failed_chunk_index);
}
