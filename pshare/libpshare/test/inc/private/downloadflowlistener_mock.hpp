#ifndef PSHARE_TEST_DOWNLOADFLOWLISTENER_MOCK_HPP_
#define PSHARE_TEST_DOWNLOADFLOWLISTENER_MOCK_HPP_

#include <gmock/gmock.h>

#include "downloadflowlistener.hpp"

using namespace ::pshare::flows;

class DownloadFlowListenerMock : public DownloadFlowListener
{
public:
    MOCK_METHOD(void, on_state_changed, (DownloadFlow::State, size_t), (override));
    MOCK_METHOD(void, on_transfer_progress_changed, (size_t, size_t), (override));
    MOCK_METHOD(void, on_download_completed, (const std::string &), (override));
    MOCK_METHOD(void, on_download_failed, (const DownloadResult &), (override));
};

#endif  // PSHARE_TEST_DOWNLOADFLOWLISTENER_MOCK_HPP_
