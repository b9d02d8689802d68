#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "hexencoderimpl.hpp"

using namespace ::testing;
using namespace ::pshare::crypto;

namespace
{
class HexEncoderTest : public Test
{
protected:
    HexEncoderImpl hex_encoder_;
};
}  // namespace

TEST_F(HexEncoderTest, EncodeLowercase)
{
    std::vector<uint8_t> data {0x00, 0x0f, 0xa5, 0xff, 0x10};
    EXPECT_EQ(hex_encoder_.encode(data), "000fa5ff10");
}

TEST_F(HexEncoderTest, EncodeEmpty)
{
    EXPECT_EQ(hex_encoder_.encode({}), "");
}
