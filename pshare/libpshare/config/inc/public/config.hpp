#ifndef PSHARE_CONFIG_CONFIG_HPP_
#define PSHARE_CONFIG_CONFIG_HPP_

#include <any>
#include <array>
#include <memory>
#include <string>
#include <typeinfo>

#include <glog/logging.h>

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace pshare::config
{
// Forward declarations
class ConfigLoader;

class Config
{
public:
    explicit Config(const ConfigLoader &             config_loader,
        std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider = nullptr);

    [[nodiscard]] std::string get_string(ConfigKey key) const
    {
        return get<std::string>(key);
    }

    [[nodiscard]] long long get_integer(ConfigKey key) const
    {
        return get<long long>(key);
    }

private:
    template<typename T>
    [[nodiscard]] T get(ConfigKey key) const
    {
        if (key < ConfigKey::FIRST_KEY || key >= ConfigKey::KEY_COUNT)
        {
            LOG(FATAL) << "Invalid config key " << int(key);
        }

        const auto &val = values_[key];
        if (!val.has_value())
        {
            return get_fallback_value<T>(key);
        }

        if (val.type() != typeid(T))
        {
            LOG(ERROR) << "Config value " << key.to_string() << " has type " << val.type().name()
                       << ", expected " << typeid(T).name() << "; using the default value";
            return get_fallback_value<T>(key);
        }

        return std::any_cast<T>(val);
    }

    template<typename T>
    [[nodiscard]] T get_fallback_value(ConfigKey key) const
    {
        if (!fallback_value_provider_)
        {
            LOG(FATAL) << "No value for config key " << key.to_string()
                       << " and no fallback value provider";
        }

        std::any val = fallback_value_provider_->get(key);
        if (!val.has_value() || val.type() != typeid(T))
        {
            LOG(FATAL) << "No usable fallback value for config key " << key.to_string();
        }

        return std::any_cast<T>(val);
    }

    std::array<std::any, ConfigKey::KEY_COUNT>         values_;
    std::shared_ptr<const FallbackConfigValueProvider> fallback_value_provider_;
};
}  // namespace pshare::config

#endif  // PSHARE_CONFIG_CONFIG_HPP_
