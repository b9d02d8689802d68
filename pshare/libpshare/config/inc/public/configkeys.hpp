#ifndef PSHARE_CONFIG_CONFIGKEYS_HPP_
#define PSHARE_CONFIG_CONFIGKEYS_HPP_

#include <string>

namespace pshare::config
{
class ConfigKey
{
public:
    enum EnumType
    {
        FIRST_KEY = 0,

        PORT = FIRST_KEY,
        ANNOUNCE_ADDRESS,
        TRACKER_ADDRESS,
        TRACKER_PORT,
        CHUNK_SIZE,
        DOWNLOADS_DIR,
        MAX_CONCURRENT_UPLOADS,

        KEY_COUNT
    };

    explicit ConfigKey(const std::string &str_key);

    ConfigKey(EnumType k)
        : key_ {k}
    {}

    [[nodiscard]] std::string to_string() const
    {
        if (key_ >= FIRST_KEY && key_ < KEY_COUNT)
        {
            return string_vals[key_];
        }
        return "";
    }

    [[nodiscard]] EnumType to_enum_type() const
    {
        return key_;
    }

    operator EnumType() const
    {
        return to_enum_type();
    }

private:
    EnumType key_;

    static constexpr char const *string_vals[] {"port", "announce_address", "tracker_address",
        "tracker_port", "chunk_size", "downloads_dir", "max_concurrent_uploads"};

    static_assert(sizeof(string_vals) / sizeof(string_vals[0]) == KEY_COUNT);
};
}  // namespace pshare::config

#endif  // PSHARE_CONFIG_CONFIGKEYS_HPP_
