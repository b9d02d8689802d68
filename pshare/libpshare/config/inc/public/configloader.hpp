#ifndef PSHARE_CONFIG_CONFIGLOADER_HPP_
#define PSHARE_CONFIG_CONFIGLOADER_HPP_

#include <any>
#include <map>
#include <string>

namespace pshare::config
{
class ConfigLoader
{
public:
    virtual ~ConfigLoader() = default;

    [[nodiscard]] virtual std::map<std::string, std::any> load() const = 0;
};
}  // namespace pshare::config

#endif  // PSHARE_CONFIG_CONFIGLOADER_HPP_
