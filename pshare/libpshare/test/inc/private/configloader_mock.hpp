#ifndef PSHARE_TEST_CONFIGLOADER_MOCK_HPP_
#define PSHARE_TEST_CONFIGLOADER_MOCK_HPP_

#include <gmock/gmock.h>

#include "configloader.hpp"

using namespace ::pshare::config;

class ConfigLoaderMock : public ConfigLoader
{
public:
    MOCK_METHOD((std::map<std::string, std::any>), load, (), (const, override));
};

#endif  // PSHARE_TEST_CONFIGLOADER_MOCK_HPP_
