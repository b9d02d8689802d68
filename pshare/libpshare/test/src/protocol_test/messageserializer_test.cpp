#include <gtest/gtest.h>

#include <string>

#include "messages.hpp"
#include "messageserializerimpl.hpp"

using namespace ::testing;
using namespace ::pshare::protocol;
using ::pshare::network::PeerAddress;

namespace
{
class MessageSerializerTest : public Test
{
protected:
    MessageSerializerImpl serializer_;
};
}  // namespace

TEST_F(MessageSerializerTest, ChunkRequestIsOneLine)
{
    auto text = serializer_.serialize(ChunkRequest {5});
    EXPECT_EQ(text, "{\"chunkIndex\":5}\n");
}

TEST_F(MessageSerializerTest, ParseChunkRequest)
{
    ChunkRequest request;
    ASSERT_TRUE(serializer_.deserialize("{\"chunkIndex\": 42}", request));
    EXPECT_EQ(request.chunk_index, 42);

    ASSERT_TRUE(serializer_.deserialize("{\"chunkIndex\": -3}", request));
    EXPECT_EQ(request.chunk_index, -3);
}

TEST_F(MessageSerializerTest, RejectMalformedChunkRequest)
{
    ChunkRequest request;
    EXPECT_FALSE(serializer_.deserialize("", request));
    EXPECT_FALSE(serializer_.deserialize("{\"chunkIndex\"", request));
    EXPECT_FALSE(serializer_.deserialize("{}", request));
    EXPECT_FALSE(serializer_.deserialize("{\"chunkIndex\": \"1\"}", request));
    EXPECT_FALSE(serializer_.deserialize("{\"chunkIndex\": 1.5}", request));
    EXPECT_FALSE(serializer_.deserialize("[1]", request));
    EXPECT_FALSE(serializer_.deserialize("{\"chunkIndex\": 18446744073709551615}", request));
}

TEST_F(MessageSerializerTest, AnnounceRequest)
{
    AnnounceRequest announce {"abcd", PeerAddress {"10.0.0.7", 9001}};

    AnnounceRequest parsed;
    ASSERT_TRUE(serializer_.deserialize(serializer_.serialize(announce), parsed));
    EXPECT_EQ(parsed.file_hash, "abcd");
    EXPECT_EQ(parsed.peer, announce.peer);
}

TEST_F(MessageSerializerTest, RejectMalformedAnnounce)
{
    AnnounceRequest parsed;
    EXPECT_FALSE(serializer_.deserialize(
        R"({"fileHash": "abcd", "address": "h", "port": 70000})", parsed));
    EXPECT_FALSE(
        serializer_.deserialize(R"({"fileHash": "abcd", "address": "h", "port": -1})", parsed));
    EXPECT_FALSE(serializer_.deserialize(R"({"address": "h", "port": 1})", parsed));
    EXPECT_FALSE(serializer_.deserialize(R"({"fileHash": 5, "address": "h", "port": 1})", parsed));
}

TEST_F(MessageSerializerTest, PeersReply)
{
    PeersReply reply;
    reply.peers = {{"10.0.0.1", 9000}, {"peer.example", 9100}};

    PeersReply parsed;
    ASSERT_TRUE(serializer_.deserialize(serializer_.serialize(reply), parsed));
    EXPECT_EQ(parsed.peers, reply.peers);
}

TEST_F(MessageSerializerTest, PeersReplyNullOrEmpty)
{
    PeersReply parsed;
    parsed.peers = {{"stale", 1}};
    ASSERT_TRUE(serializer_.deserialize(R"({"peers": null})", parsed));
    EXPECT_TRUE(parsed.peers.empty());

    ASSERT_TRUE(serializer_.deserialize(R"({"peers": []})", parsed));
    EXPECT_TRUE(parsed.peers.empty());

    EXPECT_FALSE(serializer_.deserialize(R"({})", parsed));
    EXPECT_FALSE(serializer_.deserialize(R"({"peers": [{"address": "x"}]})", parsed));
}
