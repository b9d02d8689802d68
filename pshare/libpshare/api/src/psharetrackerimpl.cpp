#include "psharetrackerimpl.hpp"

#include <glog/logging.h>

#include "defaultconfigvalues.hpp"
#include "iothreadpool.hpp"
#include "jsonconfigloader.hpp"
#include "messageserializerimpl.hpp"
#include "peerregistryimpl.hpp"
#include "trackerserverimpl.hpp"

namespace pshare
{
PShareTrackerImpl::PShareTrackerImpl(const std::string &config_file_path)
    : cfg_ {config::JSONConfigLoader {config_file_path}, std::make_unique<DefaultConfigValues>()}
    , registry_ {std::make_shared<tracker::PeerRegistryImpl>()}
{}

PShareTrackerImpl::~PShareTrackerImpl()
{
    stop();
}

bool PShareTrackerImpl::start()
{
    std::lock_guard lock {mutex_};
    if (server_)
    {
        LOG(WARNING) << "Tracker already running on port " << server_->port();
        return false;
    }

    auto port = cfg_.get_integer(config::ConfigKey::TRACKER_PORT);
    if (port < 0 || port > 65535)
    {
        LOG(ERROR) << "Invalid tracker_port in configuration: " << port;
        return false;
    }

    auto io_ctx = std::make_unique<boost::asio::io_context>();
    auto server = std::make_unique<tracker::TrackerServerImpl>(*io_ctx,
        static_cast<unsigned short>(port), registry_,
        std::make_shared<protocol::MessageSerializerImpl>());
    if (!server->start())
    {
        return false;
    }

    io_ctx_         = std::move(io_ctx);
    server_         = std::move(server);
    io_thread_pool_ = std::make_unique<utils::IOThreadPool>();
    io_thread_pool_->add_job(
        [io_ctx = io_ctx_.get()](const utils::CompletionToken &) { io_ctx->run(); });

    LOG(INFO) << "Tracker listening on port " << server_->port();
    return true;
}

void PShareTrackerImpl::stop()
{
    std::lock_guard lock {mutex_};
    if (!server_)
    {
        return;
    }

    server_->stop();
    io_ctx_->stop();
    io_thread_pool_.reset();
    server_.reset();
    io_ctx_.reset();

    LOG(INFO) << "Tracker stopped";
}

unsigned short PShareTrackerImpl::port() const
{
    std::lock_guard lock {mutex_};
    return server_ ? server_->port() : 0;
}
}  // namespace pshare
