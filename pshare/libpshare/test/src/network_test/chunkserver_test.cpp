#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "chunkerimpl.hpp"
#include "chunkfetcherimpl.hpp"
#include "chunkserverimpl.hpp"
#include "chunkstoreimpl.hpp"
#include "hexencoderimpl.hpp"
#include "iothreadpool.hpp"
#include "messageserializerimpl.hpp"
#include "random.hpp"
#include "seedflow.hpp"
#include "sha256hasherimpl.hpp"

#include "chunkrequesthandler_mock.hpp"
#include "testutils.hpp"

using namespace ::testing;
using namespace ::pshare::network;
using ::pshare::utils::ErrorCode;

namespace
{
class ChunkServerTest : public Test
{
protected:
    void SetUp() override
    {
        serializer_  = std::make_shared<pshare::protocol::MessageSerializerImpl>();
        handler_     = std::make_shared<NiceMock<ChunkRequestHandlerMock>>();
        thread_pool_ = std::make_shared<pshare::utils::IOThreadPool>();
        fetcher_     = std::make_unique<ChunkFetcherImpl>(serializer_);

        ON_CALL(*handler_, on_chunk_requested(_, _)).WillByDefault(Return(ErrorCode::RANGE_ERROR));
    }

    void TearDown() override
    {
        if (server_)
        {
            server_->stop();
        }
        io_ctx_.stop();
        thread_pool_->wait_until_all_jobs_done();
        server_.reset();
    }

    void start_server(size_t max_concurrent_connections = 0,
        std::shared_ptr<ChunkRequestHandler> request_handler = nullptr)
    {
        if (!request_handler)
        {
            request_handler = handler_;
        }
        server_ = std::make_unique<ChunkServerImpl>(io_ctx_, 0, std::move(request_handler),
            serializer_, thread_pool_, max_concurrent_connections);
        ASSERT_TRUE(server_->start());
        ASSERT_NE(server_->port(), 0);
        thread_pool_->add_job([this](const pshare::utils::CompletionToken &) { io_ctx_.run(); });
    }

    [[nodiscard]] PeerAddress server_address() const
    {
        return {"127.0.0.1", server_->port()};
    }

    // Sends raw bytes and returns everything the server answers with before closing
    std::string raw_exchange(const std::string &request) const
    {
        boost::asio::io_context      io_ctx;
        boost::asio::ip::tcp::socket socket {io_ctx};
        socket.connect({boost::asio::ip::make_address("127.0.0.1"), server_->port()});

        // The server may reset the connection before the whole request is written
        boost::system::error_code ec;
        boost::asio::write(socket, boost::asio::buffer(request), ec);

        std::string reply;
        boost::asio::read(socket, boost::asio::dynamic_buffer(reply), ec);
        return reply;
    }

    static constexpr unsigned wait_timeout_ms = 5000;

    boost::asio::io_context                                    io_ctx_;
    std::shared_ptr<const pshare::protocol::MessageSerializer> serializer_;
    std::shared_ptr<NiceMock<ChunkRequestHandlerMock>>         handler_;
    std::shared_ptr<pshare::utils::IOThreadPool>               thread_pool_;
    std::unique_ptr<ChunkFetcher>                              fetcher_;
    std::unique_ptr<ChunkServerImpl>                           server_;
    pshare::utils::Random                                      rng_;
};
}  // namespace

TEST_F(ChunkServerTest, FetchChunk)
{
    auto payload = rng_.bytes(64 * 1024 + 3);
    EXPECT_CALL(*handler_, on_chunk_requested(7, _))
        .WillOnce(DoAll(SetArgReferee<1>(payload), Return(ErrorCode::OK)));
    start_server();

    std::vector<ChunkFetcher::Stage> stages;
    std::vector<uint8_t>             data;
    ASSERT_EQ(fetcher_->fetch_chunk(server_address(), 7, payload.size(), data,
                  [&stages](ChunkFetcher::Stage stage) { stages.push_back(stage); }),
        ErrorCode::OK);

    EXPECT_EQ(data, payload);
    EXPECT_EQ(stages, (std::vector<ChunkFetcher::Stage> {ChunkFetcher::Stage::CONNECTING,
                          ChunkFetcher::Stage::REQUESTING, ChunkFetcher::Stage::RECEIVING}));
}

TEST_F(ChunkServerTest, RefusedChunkIsAFailedFetch)
{
    EXPECT_CALL(*handler_, on_chunk_requested(99, _)).WillOnce(Return(ErrorCode::RANGE_ERROR));
    start_server();

    std::vector<uint8_t> data;
    EXPECT_EQ(fetcher_->fetch_chunk(server_address(), 99, 1024, data), ErrorCode::IO_ERROR);
    EXPECT_TRUE(data.empty());
}

TEST_F(ChunkServerTest, ShortPayloadIsAFailedFetch)
{
    EXPECT_CALL(*handler_, on_chunk_requested(0, _))
        .WillOnce(DoAll(SetArgReferee<1>(std::vector<uint8_t>(100, 0x5a)), Return(ErrorCode::OK)));
    start_server();

    std::vector<uint8_t> data;
    EXPECT_EQ(fetcher_->fetch_chunk(server_address(), 0, 200, data), ErrorCode::IO_ERROR);
}

TEST_F(ChunkServerTest, MalformedRequestIsClosedWithoutPayload)
{
    EXPECT_CALL(*handler_, on_chunk_requested(_, _)).Times(0);
    start_server();

    EXPECT_TRUE(raw_exchange("hello\n").empty());
    EXPECT_TRUE(raw_exchange("{\"chunkIndex\": \"3\"}\n").empty());
}

TEST_F(ChunkServerTest, OversizedRequestIsClosedWithoutPayload)
{
    EXPECT_CALL(*handler_, on_chunk_requested(_, _)).Times(0);
    start_server();

    std::string request(2 * pshare::protocol::max_chunk_request_size, ' ');
    EXPECT_TRUE(raw_exchange(request).empty());
}

TEST_F(ChunkServerTest, ServesConcurrentRequests)
{
    ON_CALL(*handler_, on_chunk_requested(_, _))
        .WillByDefault(Invoke([](long long chunk_index, std::vector<uint8_t> &out) {
            out.assign(1000, uint8_t(chunk_index));
            return ErrorCode::OK;
        }));
    start_server();

    std::vector<std::future<bool>> results;
    for (long long i = 0; i != 8; ++i)
    {
        results.push_back(std::async(std::launch::async, [this, i] {
            std::vector<uint8_t> data;
            return fetcher_->fetch_chunk(server_address(), i, 1000, data) == ErrorCode::OK &&
                   data == std::vector<uint8_t>(1000, uint8_t(i));
        }));
    }

    for (auto &result : results)
    {
        EXPECT_TRUE(result.get());
    }
}

TEST_F(ChunkServerTest, ConnectionsAboveLimitAreRejected)
{
    std::promise<void> release;
    auto               released = release.get_future().share();

    EXPECT_CALL(*handler_, on_chunk_requested(1, _))
        .WillOnce(Invoke([released](long long, std::vector<uint8_t> &out) {
            released.wait();
            out.assign(10, 1);
            return ErrorCode::OK;
        }));
    start_server(1);

    auto first = std::async(std::launch::async, [this] {
        std::vector<uint8_t> data;
        return fetcher_->fetch_chunk(server_address(), 1, 10, data);
    });
    ASSERT_TRUE(testutils::wait_for(
        [this] { return server_->active_connection_count() == 1; }, wait_timeout_ms));

    std::vector<uint8_t> data;
    EXPECT_EQ(fetcher_->fetch_chunk(server_address(), 2, 10, data), ErrorCode::IO_ERROR);

    release.set_value();
    EXPECT_EQ(first.get(), ErrorCode::OK);
    EXPECT_TRUE(testutils::wait_for(
        [this] { return server_->active_connection_count() == 0; }, wait_timeout_ms));
}

TEST_F(ChunkServerTest, UnreachablePeer)
{
    start_server();
    auto port = server_->port();
    server_->stop();
    io_ctx_.stop();
    thread_pool_->wait_until_all_jobs_done();
    server_.reset();

    std::vector<uint8_t> data;
    EXPECT_EQ(fetcher_->fetch_chunk({"127.0.0.1", port}, 0, 10, data), ErrorCode::IO_ERROR);
}

TEST_F(ChunkServerTest, SharedFileRefusesIndexPastTheLastChunk)
{
    testutils::TempDir temp_dir {"pshare_chunkserver_test"};
    auto               file_path = temp_dir.file("shared.bin");
    auto               content   = rng_.bytes(2500);
    ASSERT_TRUE(testutils::write_file(file_path, content));

    auto                      hasher      = std::make_shared<pshare::crypto::SHA256HasherImpl>();
    auto                      hex_encoder = std::make_shared<pshare::crypto::HexEncoderImpl>();
    pshare::storage::Manifest manifest;
    ASSERT_EQ(pshare::storage::ChunkerImpl(hasher, hex_encoder)
                  .build_manifest(file_path, 1000, manifest),
        ErrorCode::OK);
    ASSERT_EQ(manifest.chunks.size(), 3);

    auto seed_flow = std::make_shared<pshare::flows::SeedFlow>(file_path, manifest,
        std::make_shared<pshare::storage::ChunkStoreImpl>(hasher, hex_encoder));
    start_server(0, seed_flow);

    std::vector<uint8_t> data;
    EXPECT_EQ(fetcher_->fetch_chunk(server_address(), 3, 1000, data), ErrorCode::IO_ERROR);
    EXPECT_TRUE(data.empty());

    // The last valid chunk is still served
    ASSERT_EQ(fetcher_->fetch_chunk(server_address(), 2, 500, data), ErrorCode::OK);
    EXPECT_EQ(data, std::vector<uint8_t>(content.cbegin() + 2000, content.cend()));
    EXPECT_EQ(seed_flow->chunks_served(), 1);
}
