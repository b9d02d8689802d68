#include "transferprogressprinter.hpp"

namespace psharecli
{
TransferProgressPrinter::TransferProgressPrinter(std::ostream &output_stream, int print_timeout_ms)
    : output_stream_ {output_stream}
    , print_timeout_ {print_timeout_ms}
    , latest_print_tp_ {}
    , bytes_transferred_on_latest_print_ {0}
{}

void TransferProgressPrinter::on_sharing_started(
    const std::string &manifest_path, const std::string &file_hash, unsigned short port)
{
    output_stream_ << "Manifest saved to " << manifest_path << '\n'
                   << "File hash: " << file_hash << '\n'
                   << "Serving chunks on port " << port << ", type exit to stop\n";
}

void TransferProgressPrinter::on_peer_found(const std::string &peer)
{
    output_stream_ << "Peer " << peer << " found, starting transfer...\n";
}

void TransferProgressPrinter::on_transfer_progress_changed(
    size_t bytes_transferred, size_t total_bytes)
{
    auto now = Clock::now();

    if (latest_print_tp_.time_since_epoch().count() == 0)
    {
        // First progress update, the transfer speed is not known yet
        latest_print_tp_                   = now;
        bytes_transferred_on_latest_print_ = bytes_transferred;
        return;
    }

    if (bytes_transferred >= total_bytes)
    {
        latest_print_tp_                   = TimePoint {};
        bytes_transferred_on_latest_print_ = 0;
        return;
    }

    auto elapsed_time = now - latest_print_tp_;
    if (elapsed_time < print_timeout_)
    {
        return;
    }

    auto elapsed_seconds = std::chrono::duration<double>(elapsed_time).count();
    size_t transfer_speed_per_sec =
        elapsed_seconds > 0 ?
            size_t(double(bytes_transferred - bytes_transferred_on_latest_print_) / elapsed_seconds) :
            0;
    size_t progress_percentage = 100 * bytes_transferred / total_bytes;

    output_stream_ << progress_percentage << "% - " << size_formatter_.format(bytes_transferred)
                   << " / " << size_formatter_.format(total_bytes) << " - "
                   << size_formatter_.format(transfer_speed_per_sec) << "/s\n";

    latest_print_tp_                   = now;
    bytes_transferred_on_latest_print_ = bytes_transferred;
}

void TransferProgressPrinter::on_download_completed(const std::string &output_path)
{
    output_stream_ << "Download completed, file written to " << output_path << '\n';
}
}  // namespace psharecli
