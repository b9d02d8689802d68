#ifndef PSHARE_TRACKER_TRACKERREQUESTROUTER_HPP_
#define PSHARE_TRACKER_TRACKERREQUESTROUTER_HPP_

#include <memory>

#include <boost/beast/http.hpp>

namespace pshare::protocol
{
// Forward declarations
class MessageSerializer;
}  // namespace pshare::protocol

namespace pshare::tracker
{
// Forward declarations
class PeerRegistry;

// Maps tracker HTTP requests onto the registry:
//   POST /announce         {fileHash, address, port}  -> 200 | 400
//   GET  /peers?fileHash=  -> 200 {"peers": [...]}    | 400
// Anything else is 404.
class TrackerRequestRouter
{
public:
    using Request  = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    TrackerRequestRouter(std::shared_ptr<PeerRegistry> registry,
        std::shared_ptr<const protocol::MessageSerializer> message_serializer);

    [[nodiscard]] Response route(const Request &request) const;

private:
    [[nodiscard]] Response handle_announce(const Request &request) const;
    [[nodiscard]] Response handle_peers(
        const Request &request, const std::string &file_hash) const;

    static Response make_response(const Request &request, boost::beast::http::status status,
        std::string body = {}, const char *content_type = "text/plain");

    std::shared_ptr<PeerRegistry>                      registry_;
    std::shared_ptr<const protocol::MessageSerializer> message_serializer_;
};
}  // namespace pshare::tracker

#endif  // PSHARE_TRACKER_TRACKERREQUESTROUTER_HPP_
