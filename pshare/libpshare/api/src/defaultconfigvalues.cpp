#include "defaultconfigvalues.hpp"

#include <string>

#include <glog/logging.h>

namespace pshare
{
DefaultConfigValues::DefaultConfigValues()
    : default_values_ {/* PORT */ 9000LL, /* ANNOUNCE_ADDRESS */ std::string {"localhost"},
          /* TRACKER_ADDRESS */ std::string {"localhost"}, /* TRACKER_PORT */ 8080LL,
          /* CHUNK_SIZE */ 1LL * 1024 * 1024 /* = 1 MiB */,
          /* DOWNLOADS_DIR */ std::string {"downloads"},
          /* MAX_CONCURRENT_UPLOADS */ 0LL /* = unbounded */}
{}

std::any DefaultConfigValues::get(const config::ConfigKey &key) const
{
    if (key < config::ConfigKey::FIRST_KEY || key >= config::ConfigKey::KEY_COUNT)
    {
        LOG(ERROR) << "Invalid config key " << int(key);
        return {};
    }
    return default_values_[key];
}
}  // namespace pshare
