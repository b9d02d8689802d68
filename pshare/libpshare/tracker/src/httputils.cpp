#include "httputils.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace pshare::tracker::httputils
{
std::string url_encode(const std::string &str)
{
    std::ostringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0');
    for (char c : str)
    {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            ss << c;
        }
        else
        {
            ss << '%' << std::setw(2) << int(uc);
        }
    }
    return ss.str();
}

bool url_decode(const std::string &str, std::string &out)
{
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i)
    {
        if (str[i] == '+')
        {
            decoded.push_back(' ');
        }
        else if (str[i] == '%')
        {
            if (i + 2 >= str.size() || !std::isxdigit(static_cast<unsigned char>(str[i + 1])) ||
                !std::isxdigit(static_cast<unsigned char>(str[i + 2])))
            {
                return false;
            }
            decoded.push_back(char(std::stoi(str.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        }
        else
        {
            decoded.push_back(str[i]);
        }
    }

    out = std::move(decoded);
    return true;
}

bool split_target(
    const std::string &target, std::string &path, std::map<std::string, std::string> &query)
{
    auto question_mark = target.find('?');
    path               = target.substr(0, question_mark);
    query.clear();

    if (question_mark == std::string::npos)
    {
        return true;
    }

    std::istringstream ss {target.substr(question_mark + 1)};
    std::string        pair;
    while (std::getline(ss, pair, '&'))
    {
        if (pair.empty())
        {
            continue;
        }

        auto        eq = pair.find('=');
        std::string key;
        std::string value;
        if (!url_decode(pair.substr(0, eq), key) ||
            (eq != std::string::npos && !url_decode(pair.substr(eq + 1), value)))
        {
            return false;
        }
        query.emplace(std::move(key), std::move(value));
    }

    return true;
}
}  // namespace pshare::tracker::httputils
