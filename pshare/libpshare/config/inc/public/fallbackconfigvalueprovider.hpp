#ifndef PSHARE_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
#define PSHARE_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_

#include <any>

namespace pshare::config
{
// Forward declarations
class ConfigKey;

class FallbackConfigValueProvider
{
public:
    virtual ~FallbackConfigValueProvider() = default;

    [[nodiscard]] virtual std::any get(const ConfigKey &key) const = 0;
};
}  // namespace pshare::config

#endif  // PSHARE_CONFIG_FALLBACKCONFIGVALUEPROVIDER_HPP_
