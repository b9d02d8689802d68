#ifndef PSHARE_FLOWS_DOWNLOADFLOW_HPP_
#define PSHARE_FLOWS_DOWNLOADFLOW_HPP_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "address.hpp"
#include "errorcode.hpp"
#include "manifest.hpp"

namespace pshare::flows
{
// Forward declarations
class DownloadFlowListener;

struct DownloadResult
{
    utils::ErrorCode      status           = utils::ErrorCode::OK;
    size_t                chunks_completed = 0;
    std::optional<size_t> failed_chunk_index;

    [[nodiscard]] bool ok() const
    {
        return status == utils::ErrorCode::OK;
    }
};

class DownloadFlow
{
public:
    enum class State
    {
        IDLE,
        CONNECTING,
        REQUESTING,
        RECEIVING,
        VERIFYING,
        APPENDING,
        DONE,
        FAILED
    };

    virtual ~DownloadFlow() = default;

    virtual bool register_listener(std::shared_ptr<DownloadFlowListener> listener)   = 0;
    virtual bool unregister_listener(std::shared_ptr<DownloadFlowListener> listener) = 0;
    [[nodiscard]] virtual State state() const                                        = 0;

    // Blocks until the whole file is written to output_path or the first chunk fails
    virtual DownloadResult download(const storage::Manifest &manifest,
        const network::PeerAddress &peer, const std::string &output_path) = 0;
};

constexpr const char *to_string(DownloadFlow::State state)
{
    switch (state)
    {
        case DownloadFlow::State::IDLE: return "IDLE";
        case DownloadFlow::State::CONNECTING: return "CONNECTING";
        case DownloadFlow::State::REQUESTING: return "REQUESTING";
        case DownloadFlow::State::RECEIVING: return "RECEIVING";
        case DownloadFlow::State::VERIFYING: return "VERIFYING";
        case DownloadFlow::State::APPENDING: return "APPENDING";
        case DownloadFlow::State::DONE: return "DONE";
        case DownloadFlow::State::FAILED: return "FAILED";
        default: return "INVALID_STATE";
    }
}
}  // namespace pshare::flows

#endif  // PSHARE_FLOWS_DOWNLOADFLOW_HPP_
