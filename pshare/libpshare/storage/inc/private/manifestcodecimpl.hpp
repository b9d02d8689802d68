#ifndef PSHARE_STORAGE_MANIFESTCODECIMPL_HPP_
#define PSHARE_STORAGE_MANIFESTCODECIMPL_HPP_

#include <nlohmann/json.hpp>

#include "manifestcodec.hpp"

namespace pshare::storage
{
class ManifestCodecImpl : public ManifestCodec
{
public:
    [[nodiscard]] std::string encode(const Manifest &manifest) const override;
    utils::ErrorCode decode(const std::string &text, Manifest &out) const override;
    utils::ErrorCode save(const Manifest &manifest, const std::string &path) const override;
    utils::ErrorCode load(const std::string &path, Manifest &out) const override;

private:
    [[nodiscard]] static bool is_digest(const nlohmann::json &value);
    [[nodiscard]] static bool is_size(const nlohmann::json &value);
    [[nodiscard]] static bool check_layout(const Manifest &manifest);

    static constexpr int indent = 2;
};
}  // namespace pshare::storage

#endif  // PSHARE_STORAGE_MANIFESTCODECIMPL_HPP_
