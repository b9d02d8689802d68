#ifndef PSHARE_API_DOWNLOADFLOWLISTENERDELEGATE_HPP_
#define PSHARE_API_DOWNLOADFLOWLISTENERDELEGATE_HPP_

#include <functional>
#include <memory>
#include <string>

#include "downloadflow.hpp"
#include "downloadflowlistener.hpp"

namespace pshare
{
class DownloadFlowListenerDelegate
    : public flows::DownloadFlowListener
    , public std::enable_shared_from_this<DownloadFlowListenerDelegate>
{
public:
    using OnStateChangedCb            = std::function<void(flows::DownloadFlow::State, size_t)>;
    using OnTransferProgressChangedCb = std::function<void(size_t, size_t)>;
    using OnDownloadCompletedCb       = std::function<void(const std::string &)>;
    using OnDownloadFailedCb          = std::function<void(const flows::DownloadResult &)>;

    void register_as_listener(flows::DownloadFlow &flow);
    void unregister_as_listener(flows::DownloadFlow &flow);
    void set_on_state_changed_cb(OnStateChangedCb &&cb);
    void set_on_transfer_progress_changed_cb(OnTransferProgressChangedCb &&cb);
    void set_on_download_completed_cb(OnDownloadCompletedCb &&cb);
    void set_on_download_failed_cb(OnDownloadFailedCb &&cb);

public:  // from flows::DownloadFlowListener
    void on_state_changed(flows::DownloadFlow::State new_state, size_t chunk_index) override;
    void on_transfer_progress_changed(size_t bytes_transferred, size_t total_bytes) override;
    void on_download_completed(const std::string &output_path) override;
    void on_download_failed(const flows::DownloadResult &result) override;

private:
    OnStateChangedCb            on_state_changed_cb_;
    OnTransferProgressChangedCb on_transfer_progress_changed_cb_;
    OnDownloadCompletedCb       on_download_completed_cb_;
    OnDownloadFailedCb          on_download_failed_cb_;
};
}  // namespace pshare

#endif  // PSHARE_API_DOWNLOADFLOWLISTENERDELEGATE_HPP_
