#ifndef PSHARE_STORAGE_MANIFESTCODEC_HPP_
#define PSHARE_STORAGE_MANIFESTCODEC_HPP_

#include <string>

#include "errorcode.hpp"
#include "manifest.hpp"

namespace pshare::storage
{
class ManifestCodec
{
public:
    virtual ~ManifestCodec() = default;

    [[nodiscard]] virtual std::string encode(const Manifest &manifest) const = 0;

    // Rejects documents that violate the manifest invariants with INVALID_ARGUMENT
    virtual utils::ErrorCode decode(const std::string &text, Manifest &out) const = 0;

    virtual utils::ErrorCode save(const Manifest &manifest, const std::string &path) const = 0;
    virtual utils::ErrorCode load(const std::string &path, Manifest &out) const            = 0;
};
}  // namespace pshare::storage

#endif  // PSHARE_STORAGE_MANIFESTCODEC_HPP_
