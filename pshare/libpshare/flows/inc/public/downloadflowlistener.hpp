#ifndef PSHARE_FLOWS_DOWNLOADFLOWLISTENER_HPP_
#define PSHARE_FLOWS_DOWNLOADFLOWLISTENER_HPP_

#include "downloadflow.hpp"

namespace pshare::flows
{
class DownloadFlowListener
{
public:
    virtual ~DownloadFlowListener() = default;

    virtual void on_state_changed(DownloadFlow::State new_state, size_t chunk_index)       = 0;
    virtual void on_transfer_progress_changed(size_t bytes_transferred, size_t total_bytes) = 0;
    virtual void on_download_completed(const std::string &output_path)                      = 0;
    virtual void on_download_failed(const DownloadResult &result)                           = 0;
};
}  // namespace pshare::flows

#endif  // PSHARE_FLOWS_DOWNLOADFLOWLISTENER_HPP_
