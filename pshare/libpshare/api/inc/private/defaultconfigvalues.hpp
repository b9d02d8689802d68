#ifndef PSHARE_API_DEFAULTCONFIGVALUES_HPP_
#define PSHARE_API_DEFAULTCONFIGVALUES_HPP_

#include "configkeys.hpp"
#include "fallbackconfigvalueprovider.hpp"

namespace pshare
{
class DefaultConfigValues : public config::FallbackConfigValueProvider
{
public:
    DefaultConfigValues();
    [[nodiscard]] std::any get(const config::ConfigKey &key) const override;

private:
    const std::any default_values_[config::ConfigKey::KEY_COUNT];
};
}  // namespace pshare

#endif  // PSHARE_API_DEFAULTCONFIGVALUES_HPP_
