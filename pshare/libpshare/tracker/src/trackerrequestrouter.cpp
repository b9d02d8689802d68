#include "trackerrequestrouter.hpp"

#include <map>
#include <string>

#include <glog/logging.h>

#include "httputils.hpp"
#include "messages.hpp"
#include "messageserializer.hpp"
#include "peerregistry.hpp"

namespace http = boost::beast::http;

namespace pshare::tracker
{
namespace
{
constexpr char const *announce_path   = "/announce";
constexpr char const *peers_path      = "/peers";
constexpr char const *file_hash_param = "fileHash";
}  // namespace

TrackerRequestRouter::TrackerRequestRouter(std::shared_ptr<PeerRegistry> registry,
    std::shared_ptr<const protocol::MessageSerializer>                    message_serializer)
    : registry_ {std::move(registry)}
    , message_serializer_ {std::move(message_serializer)}
{}

TrackerRequestRouter::Response TrackerRequestRouter::route(const Request &request) const
{
    std::string                        target {request.target().data(), request.target().size()};
    std::string                        path;
    std::map<std::string, std::string> query;
    if (!httputils::split_target(target, path, query))
    {
        return make_response(request, http::status::bad_request, "malformed query string");
    }

    if (path == announce_path)
    {
        if (request.method() != http::verb::post)
        {
            return make_response(request, http::status::bad_request, "method not allowed");
        }
        return handle_announce(request);
    }

    if (path == peers_path)
    {
        if (request.method() != http::verb::get)
        {
            return make_response(request, http::status::bad_request, "method not allowed");
        }
        auto it = query.find(file_hash_param);
        if (it == query.end() || it->second.empty())
        {
            return make_response(request, http::status::bad_request, "missing fileHash");
        }
        return handle_peers(request, it->second);
    }

    return make_response(request, http::status::not_found, "not found");
}

TrackerRequestRouter::Response TrackerRequestRouter::handle_announce(const Request &request) const
{
    protocol::AnnounceRequest announce;
    if (!message_serializer_->deserialize(request.body(), announce))
    {
        return make_response(request, http::status::bad_request, "invalid request body");
    }

    auto status = registry_->announce(announce.file_hash, announce.peer);
    if (status != utils::ErrorCode::OK)
    {
        return make_response(request, http::status::bad_request, utils::to_string(status));
    }

    return make_response(request, http::status::ok);
}

TrackerRequestRouter::Response TrackerRequestRouter::handle_peers(
    const Request &request, const std::string &file_hash) const
{
    protocol::PeersReply reply {registry_->lookup(file_hash)};
    return make_response(request, http::status::ok, message_serializer_->serialize(reply),
        "application/json");
}

TrackerRequestRouter::Response TrackerRequestRouter::make_response(const Request &request,
    http::status status, std::string body, const char *content_type)
{
    Response response {status, request.version()};
    response.set(http::field::server, "pshare-tracker");
    response.set(http::field::content_type, content_type);
    response.keep_alive(false);
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}
}  // namespace pshare::tracker
