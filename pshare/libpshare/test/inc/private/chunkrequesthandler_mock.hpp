#ifndef PSHARE_TEST_CHUNKREQUESTHANDLER_MOCK_HPP_
#define PSHARE_TEST_CHUNKREQUESTHANDLER_MOCK_HPP_

#include <gmock/gmock.h>

#include "chunkrequesthandler.hpp"

using namespace ::pshare::network;

class ChunkRequestHandlerMock : public ChunkRequestHandler
{
public:
    MOCK_METHOD(pshare::utils::ErrorCode, on_chunk_requested, (long long, std::vector<uint8_t> &),
        (override));
};

#endif  // PSHARE_TEST_CHUNKREQUESTHANDLER_MOCK_HPP_
