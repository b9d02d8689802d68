#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "messageserializerimpl.hpp"
#include "trackerrequestrouter.hpp"

#include "peerregistry_mock.hpp"

using namespace ::testing;
using namespace ::pshare::tracker;
using ::pshare::utils::ErrorCode;

namespace http = boost::beast::http;

namespace
{
class TrackerRequestRouterTest : public Test
{
protected:
    void SetUp() override
    {
        registry_ = std::make_shared<NiceMock<PeerRegistryMock>>();
        router_   = std::make_unique<TrackerRequestRouter>(
            registry_, std::make_shared<pshare::protocol::MessageSerializerImpl>());
    }

    static TrackerRequestRouter::Request make_request(
        http::verb method, const std::string &target, const std::string &body = {})
    {
        TrackerRequestRouter::Request request {method, target, 11};
        request.body() = body;
        request.prepare_payload();
        return request;
    }

    std::shared_ptr<NiceMock<PeerRegistryMock>> registry_;
    std::unique_ptr<TrackerRequestRouter>        router_;
};
}  // namespace

TEST_F(TrackerRequestRouterTest, Announce)
{
    EXPECT_CALL(*registry_, announce("abcd", PeerAddress {"10.0.0.3", 9000}))
        .WillOnce(Return(ErrorCode::OK));

    auto response = router_->route(make_request(http::verb::post, "/announce",
        R"({"fileHash": "abcd", "address": "10.0.0.3", "port": 9000})"));
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_FALSE(response.keep_alive());
}

TEST_F(TrackerRequestRouterTest, AnnounceRejectedByRegistry)
{
    ON_CALL(*registry_, announce(_, _)).WillByDefault(Return(ErrorCode::INVALID_ARGUMENT));

    auto response = router_->route(make_request(
        http::verb::post, "/announce", R"({"fileHash": "", "address": "10.0.0.3", "port": 9000})"));
    EXPECT_EQ(response.result(), http::status::bad_request);
}

TEST_F(TrackerRequestRouterTest, AnnounceWithMalformedBody)
{
    EXPECT_CALL(*registry_, announce(_, _)).Times(0);

    EXPECT_EQ(router_->route(make_request(http::verb::post, "/announce", "{")).result(),
        http::status::bad_request);
    EXPECT_EQ(router_->route(make_request(http::verb::post, "/announce", R"({"fileHash": "x"})"))
                  .result(),
        http::status::bad_request);
}

TEST_F(TrackerRequestRouterTest, Peers)
{
    EXPECT_CALL(*registry_, lookup("ab cd"))
        .WillOnce(Return(std::vector<PeerAddress> {{"10.0.0.1", 9000}, {"10.0.0.2", 9001}}));

    auto response = router_->route(make_request(http::verb::get, "/peers?fileHash=ab%20cd"));
    ASSERT_EQ(response.result(), http::status::ok);

    auto json = nlohmann::json::parse(response.body());
    ASSERT_EQ(json["peers"].size(), 2);
    EXPECT_EQ(json["peers"][1]["address"], "10.0.0.2");
    EXPECT_EQ(json["peers"][1]["port"], 9001);
}

TEST_F(TrackerRequestRouterTest, PeersUnknownHashIsEmptyList)
{
    ON_CALL(*registry_, lookup(_)).WillByDefault(Return(std::vector<PeerAddress> {}));

    auto response = router_->route(make_request(http::verb::get, "/peers?fileHash=zz"));
    ASSERT_EQ(response.result(), http::status::ok);
    EXPECT_TRUE(nlohmann::json::parse(response.body())["peers"].empty());
}

TEST_F(TrackerRequestRouterTest, PeersWithoutHash)
{
    EXPECT_CALL(*registry_, lookup(_)).Times(0);

    EXPECT_EQ(router_->route(make_request(http::verb::get, "/peers")).result(),
        http::status::bad_request);
    EXPECT_EQ(router_->route(make_request(http::verb::get, "/peers?fileHash=")).result(),
        http::status::bad_request);
}

TEST_F(TrackerRequestRouterTest, WrongMethod)
{
    EXPECT_EQ(router_->route(make_request(http::verb::get, "/announce")).result(),
        http::status::bad_request);
    EXPECT_EQ(router_->route(make_request(http::verb::post, "/peers?fileHash=ab")).result(),
        http::status::bad_request);
}

TEST_F(TrackerRequestRouterTest, UnknownPath)
{
    EXPECT_EQ(router_->route(make_request(http::verb::get, "/")).result(), http::status::not_found);
    EXPECT_EQ(router_->route(make_request(http::verb::post, "/scrape")).result(),
        http::status::not_found);
}
