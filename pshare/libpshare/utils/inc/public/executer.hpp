#ifndef PSHARE_UTILS_EXECUTER_HPP_
#define PSHARE_UTILS_EXECUTER_HPP_

#include <functional>

#include "completiontoken.hpp"

namespace pshare::utils
{
class Executer
{
public:
    using Job = std::function<void(const CompletionToken &)>;

    virtual ~Executer() = default;

    virtual CompletionToken add_job(Job &&job) = 0;
};
}  // namespace pshare::utils

#endif  // PSHARE_UTILS_EXECUTER_HPP_
