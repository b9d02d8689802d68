#ifndef PSHARE_API_PSHARENODELISTENER_HPP_
#define PSHARE_API_PSHARENODELISTENER_HPP_

#include <cstddef>
#include <string>

#include "pshareapidefs.h"

namespace pshare
{
class PSHARE_API PShareNodeListener
{
public:
    virtual ~PShareNodeListener() = default;

    virtual void on_sharing_started(
        const std::string &manifest_path, const std::string &file_hash, unsigned short port) = 0;
    virtual void on_peer_found(const std::string &peer)                                    = 0;
    virtual void on_transfer_progress_changed(size_t bytes_transferred, size_t total_bytes) = 0;
    virtual void on_download_completed(const std::string &output_path)                      = 0;
};
}  // namespace pshare

#endif  // PSHARE_API_PSHARENODELISTENER_HPP_
