#ifndef PSHARE_TRACKER_HTTPUTILS_HPP_
#define PSHARE_TRACKER_HTTPUTILS_HPP_

#include <map>
#include <string>

namespace pshare::tracker::httputils
{
std::string url_encode(const std::string &str);
bool        url_decode(const std::string &str, std::string &out);

// Splits "/path?k1=v1&k2=v2" into its path and decoded query parameters. Returns false on a
// malformed escape sequence.
bool split_target(
    const std::string &target, std::string &path, std::map<std::string, std::string> &query);
}  // namespace pshare::tracker::httputils

#endif  // PSHARE_TRACKER_HTTPUTILS_HPP_
