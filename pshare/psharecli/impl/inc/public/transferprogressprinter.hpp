#ifndef PSHARECLI_TRANSFERPROGRESSPRINTER_HPP_
#define PSHARECLI_TRANSFERPROGRESSPRINTER_HPP_

#include <chrono>
#include <ostream>

#include "datasizeformatter.hpp"
#include "psharenodelistener.hpp"

namespace psharecli
{
class TransferProgressPrinter : public pshare::PShareNodeListener
{
public:
    TransferProgressPrinter(std::ostream &output_stream, int print_timeout_ms);

    void on_sharing_started(const std::string &manifest_path, const std::string &file_hash,
        unsigned short port) override;
    void on_peer_found(const std::string &peer) override;
    void on_transfer_progress_changed(size_t bytes_transferred, size_t total_bytes) override;
    void on_download_completed(const std::string &output_path) override;

private:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    std::ostream &            output_stream_;
    std::chrono::milliseconds print_timeout_;
    TimePoint                 latest_print_tp_;
    size_t                    bytes_transferred_on_latest_print_;
    DataSizeFormatter         size_formatter_;
};
}  // namespace psharecli

#endif  // PSHARECLI_TRANSFERPROGRESSPRINTER_HPP_
