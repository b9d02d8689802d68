#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <boost/asio.hpp>
#include <glog/logging.h>

#include "psharetracker.hpp"
#include "pshareversion.hpp"

namespace
{
constexpr char const *config_file_name = "tracker_config.json";

std::string get_config_file_path()
{
    const char *home = std::getenv("HOME");
    return (std::filesystem::path {home ? home : "."} / ".pshare" / config_file_name).string();
}
}  // namespace

int main(int /*argc*/, char **argv)
{
    google::InitGoogleLogging(argv[0]);

    std::cout << "pshare tracker " << pshare::pshare_version << "\n";

    pshare::PShareTracker tracker {get_config_file_path()};
    if (!tracker.start())
    {
        std::cout << "Failed to start the tracker, check the log file for details.\n";
        return EXIT_FAILURE;
    }
    std::cout << "Listening on port " << tracker.port() << ", press Ctrl+C to stop\n";

    boost::asio::io_context signals_ctx;
    boost::asio::signal_set signals {signals_ctx, SIGINT, SIGTERM};
    signals.async_wait([](const boost::system::error_code &ec, int signal_number) {
        if (!ec)
        {
            LOG(INFO) << "Signal " << signal_number << " received, shutting down";
        }
    });
    signals_ctx.run();

    tracker.stop();
    std::cout << "Tracker stopped\n";
    return EXIT_SUCCESS;
}
