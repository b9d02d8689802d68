#ifndef PSHARE_API_PSHARETRACKERIMPL_HPP_
#define PSHARE_API_PSHARETRACKERIMPL_HPP_

#include <memory>
#include <mutex>
#include <string>

#include <boost/asio.hpp>

#include "config.hpp"

namespace pshare
{
namespace utils
{
// Forward declarations
class IOThreadPool;
}  // namespace utils

namespace tracker
{
// Forward declarations
class PeerRegistry;
class TrackerServer;
}  // namespace tracker

class PShareTrackerImpl
{
public:
    explicit PShareTrackerImpl(const std::string &config_file_path);
    ~PShareTrackerImpl();

    bool                         start();
    void                         stop();
    [[nodiscard]] unsigned short port() const;

private:
    config::Config                           cfg_;
    std::shared_ptr<tracker::PeerRegistry>   registry_;
    std::unique_ptr<boost::asio::io_context> io_ctx_;
    std::unique_ptr<utils::IOThreadPool>     io_thread_pool_;
    std::unique_ptr<tracker::TrackerServer>  server_;
    mutable std::mutex                       mutex_;
};
}  // namespace pshare

#endif  // PSHARE_API_PSHARETRACKERIMPL_HPP_
