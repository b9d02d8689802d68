#include "downloadflowlistenerdelegate.hpp"

namespace pshare
{
void DownloadFlowListenerDelegate::register_as_listener(flows::DownloadFlow &flow)
{
    flow.register_listener(shared_from_this());
}

void DownloadFlowListenerDelegate::unregister_as_listener(flows::DownloadFlow &flow)
{
    flow.unregister_listener(shared_from_this());
}

void DownloadFlowListenerDelegate::set_on_state_changed_cb(OnStateChangedCb &&cb)
{
    on_state_changed_cb_ = std::move(cb);
}

void DownloadFlowListenerDelegate::set_on_transfer_progress_changed_cb(
    OnTransferProgressChangedCb &&cb)
{
    on_transfer_progress_changed_cb_ = std::move(cb);
}

void DownloadFlowListenerDelegate::set_on_download_completed_cb(OnDownloadCompletedCb &&cb)
{
    on_download_completed_cb_ = std::move(cb);
}

void DownloadFlowListenerDelegate::set_on_download_failed_cb(OnDownloadFailedCb &&cb)
{
    on_download_failed_cb_ = std::move(cb);
}

void DownloadFlowListenerDelegate::on_state_changed(
    flows::DownloadFlow::State new_state, size_t chunk_index)
{
    if (on_state_changed_cb_)
    {
        on_state_changed_cb_(new_state, chunk_index);
    }
}

void DownloadFlowListenerDelegate::on_transfer_progress_changed(
    size_t bytes_transferred, size_t total_bytes)
{
    if (on_transfer_progress_changed_cb_)
    {
        on_transfer_progress_changed_cb_(bytes_transferred, total_bytes);
    }
}

void DownloadFlowListenerDelegate::on_download_completed(const std::string &output_path)
{
    if (on_download_completed_cb_)
    {
        on_download_completed_cb_(output_path);
    }
}

void DownloadFlowListenerDelegate::on_download_failed(const flows::DownloadResult &result)
{
    if (on_download_failed_cb_)
    {
        on_download_failed_cb_(result);
    }
}
}  // namespace pshare
