#include "config.hpp"

#include "configloader.hpp"

namespace pshare::config
{
ConfigKey::ConfigKey(const std::string &str_key)
    : key_ {KEY_COUNT}
{
    for (int k = FIRST_KEY; k != KEY_COUNT; ++k)
    {
        if (str_key == string_vals[k])
        {
            key_ = EnumType(k);
            break;
        }
    }
}

Config::Config(const ConfigLoader &              config_loader,
    std::unique_ptr<FallbackConfigValueProvider> fallback_value_provider)
    : fallback_value_provider_ {std::move(fallback_value_provider)}
{
    for (auto &[name, value] : config_loader.load())
    {
        ConfigKey key {name};
        if (key == ConfigKey::KEY_COUNT)
        {
            LOG(WARNING) << "Ignoring unknown config key " << name;
            continue;
        }
        values_[key] = std::move(value);
    }
}
}  // namespace pshare::config
