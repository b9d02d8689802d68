#include "jsonconfigloader.hpp"

#include <fstream>

#include <glog/logging.h>

namespace pshare::config
{
JSONConfigLoader::JSONConfigLoader(std::string config_file_path)
    : config_file_path_ {std::move(config_file_path)}
{}

std::map<std::string, std::any> JSONConfigLoader::load() const
{
    std::map<std::string, std::any> values;

    std::ifstream fs {config_file_path_};
    if (!fs)
    {
        LOG(INFO) << "Cannot open " << config_file_path_ << ", using default configuration";
        return values;
    }

    nlohmann::json json_root;
    try
    {
        fs >> json_root;
    }
    catch (const nlohmann::json::exception &e)
    {
        LOG(ERROR) << "Malformed configuration file " << config_file_path_ << ": " << e.what();
        return values;
    }

    if (!json_root.is_object())
    {
        LOG(ERROR) << "Configuration file " << config_file_path_ << " must hold a JSON object";
        return values;
    }

    walk_json(json_root, values);
    return values;
}

void JSONConfigLoader::walk_json(
    const nlohmann::json &json_root, std::map<std::string, std::any> &out) const
{
    for (const auto &[k, v] : json_root.items())
    {
        if (v.is_string())
        {
            out.emplace(k, v.get<std::string>());
        }
        else if (v.is_number_integer())
        {
            out.emplace(k, v.get<long long>());
        }
        else if (v.is_boolean())
        {
            out.emplace(k, v.get<bool>());
        }
        else if (v.is_object())
        {
            walk_json(v, out);
        }
        else
        {
            LOG(WARNING) << "Unsupported value type in configuration file (key = " << k << ")";
        }
    }
}
}  // namespace pshare::config
