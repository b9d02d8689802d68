#include <gtest/gtest.h>

#include <map>
#include <string>

#include "httputils.hpp"

using namespace ::testing;
using namespace ::pshare::tracker;

TEST(HTTPUtilsTest, EncodeKeepsUnreservedCharacters)
{
    EXPECT_EQ(httputils::url_encode("abcXYZ019-_.~"), "abcXYZ019-_.~");
    EXPECT_EQ(httputils::url_encode("a b&c=d/"), "a%20b%26c%3Dd%2F");
}

TEST(HTTPUtilsTest, Decode)
{
    std::string out;
    ASSERT_TRUE(httputils::url_decode("a%20b+c%2f", out));
    EXPECT_EQ(out, "a b c/");

    EXPECT_FALSE(httputils::url_decode("%2", out));
    EXPECT_FALSE(httputils::url_decode("%zz", out));
}

TEST(HTTPUtilsTest, SplitTarget)
{
    std::string                        path;
    std::map<std::string, std::string> query;

    ASSERT_TRUE(httputils::split_target("/peers?fileHash=ab%20cd&x=1&flag", path, query));
    EXPECT_EQ(path, "/peers");
    EXPECT_EQ(query.size(), 3);
    EXPECT_EQ(query["fileHash"], "ab cd");
    EXPECT_EQ(query["x"], "1");
    EXPECT_EQ(query["flag"], "");

    ASSERT_TRUE(httputils::split_target("/announce", path, query));
    EXPECT_EQ(path, "/announce");
    EXPECT_TRUE(query.empty());

    EXPECT_FALSE(httputils::split_target("/peers?fileHash=%g0", path, query));
}
