#ifndef PSHARE_API_PSHARENODE_HPP_
#define PSHARE_API_PSHARENODE_HPP_

#include <memory>
#include <string>

#include "pshareapidefs.h"

namespace pshare
{
// Forward declarations
class PShareNodeImpl;
class PShareNodeListener;

class PSHARE_API PShareNode
{
public:
    explicit PShareNode(const std::string &config_file_path);
    PShareNode(PShareNode &&other) noexcept;
    PShareNode &operator=(PShareNode &&rhs) noexcept;
    ~PShareNode();

    bool register_listener(const std::shared_ptr<PShareNodeListener> &listener);
    bool unregister_listener(const std::shared_ptr<PShareNodeListener> &listener);

    // Chunks the file, saves <file_path>.manifest, starts serving its chunks and announces it
    // to the tracker. A node shares one file at a time.
    bool share_file(const std::string &file_path, std::string &error_string);
    bool stop_sharing();
    [[nodiscard]] bool is_sharing() const;

    // Fetches the file described by the manifest from the first peer the tracker knows of
    bool download_file(const std::string &manifest_path, std::string &error_string);

private:
    std::unique_ptr<PShareNodeImpl> impl_;
};
}  // namespace pshare

#endif  // PSHARE_API_PSHARENODE_HPP_
